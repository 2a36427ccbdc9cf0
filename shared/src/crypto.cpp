#include "ferry/crypto.hpp"

#include <array>
#include <fstream>
#include <vector>

#include <sodium.h>

#include "ferry/errors.hpp"

namespace ferry::crypto
{

    namespace
    {
        constexpr std::size_t kReadBlock = 64 * 1024;

        [[noreturn]] void sodium_failure(const char *call)
        {
            throw Error(ErrorCode::InternalError, std::string("libsodium call failed: ") + call);
        }

        std::string hex(const unsigned char *data, std::size_t size)
        {
            std::string text(size * 2 + 1, '\0');
            sodium_bin2hex(text.data(), text.size(), data, size);
            text.pop_back();
            return text;
        }

        // Incremental BLAKE2b with the default 32-byte digest.
        class Blake2b
        {
        public:
            Blake2b()
            {
                ensure_sodium_init();
                if (crypto_generichash_init(&state_, nullptr, 0, digest_.size()) != 0)
                {
                    sodium_failure("crypto_generichash_init");
                }
            }

            void update(const unsigned char *data, std::size_t size)
            {
                if (crypto_generichash_update(&state_, data, size) != 0)
                {
                    sodium_failure("crypto_generichash_update");
                }
            }

            std::string hex_digest()
            {
                if (crypto_generichash_final(&state_, digest_.data(), digest_.size()) != 0)
                {
                    sodium_failure("crypto_generichash_final");
                }
                return hex(digest_.data(), digest_.size());
            }

        private:
            crypto_generichash_state state_{};
            std::array<unsigned char, crypto_generichash_BYTES> digest_{};
        };

    } // namespace

    void ensure_sodium_init()
    {
        // sodium_init() is idempotent; a function-local static runs it once per process.
        static const int status = sodium_init();
        if (status < 0)
        {
            throw Error(ErrorCode::InternalError, "libsodium initialization failed");
        }
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        Blake2b hasher;
        hasher.update(reinterpret_cast<const unsigned char *>(data.data()), data.size());
        return hasher.hex_digest();
    }

    std::string hash_stream(std::istream &input)
    {
        Blake2b hasher;
        std::vector<char> block(kReadBlock);
        while (input.read(block.data(), static_cast<std::streamsize>(block.size())) || input.gcount() > 0)
        {
            hasher.update(reinterpret_cast<const unsigned char *>(block.data()),
                          static_cast<std::size_t>(input.gcount()));
        }
        if (input.bad())
        {
            throw LocalIOError("Read failed while hashing");
        }
        return hasher.hex_digest();
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw LocalIOError("Cannot open " + path.string() + " for hashing", ErrorCode::NotFound);
        }
        return hash_stream(file);
    }

    std::string random_hex(std::size_t byte_count)
    {
        ensure_sodium_init();
        std::vector<unsigned char> bytes(byte_count);
        randombytes_buf(bytes.data(), bytes.size());
        return hex(bytes.data(), bytes.size());
    }

} // namespace ferry::crypto
