#include "ferry/client/local_session.hpp"

#include <fstream>
#include <system_error>
#include <utility>

#include "ferry/crypto.hpp"
#include "ferry/errors.hpp"
#include "ferry/file_time.hpp"

namespace ferry::client
{

    namespace
    {
        constexpr std::size_t kChunkSize = 64 * 1024;
        constexpr auto kPartialSuffix = ".ferry-part";

        enum class Side
        {
            Local,
            Remote
        };

        ErrorCode code_for(const std::error_code &ec)
        {
            if (ec == std::errc::no_such_file_or_directory)
            {
                return ErrorCode::NotFound;
            }
            if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted)
            {
                return ErrorCode::PermissionDenied;
            }
            if (ec == std::errc::file_exists)
            {
                return ErrorCode::AlreadyExists;
            }
            if (ec == std::errc::not_a_directory)
            {
                return ErrorCode::NotADirectory;
            }
            if (ec == std::errc::is_a_directory)
            {
                return ErrorCode::IsADirectory;
            }
            return ErrorCode::IoFailure;
        }

        [[noreturn]] void fail(Side side, const std::string &message, ErrorCode code)
        {
            if (side == Side::Local)
            {
                throw LocalIOError(message, code);
            }
            throw FileOperationError(message, code);
        }

        [[noreturn]] void fail(Side side, const std::string &what, const std::filesystem::path &path,
                               const std::error_code &ec)
        {
            fail(side, what + " " + path.string() + ": " + ec.message(), code_for(ec));
        }

        std::string permission_string(std::filesystem::perms value)
        {
            using std::filesystem::perms;
            const std::pair<perms, char> bits[] = {
                {perms::owner_read, 'r'}, {perms::owner_write, 'w'}, {perms::owner_exec, 'x'},
                {perms::group_read, 'r'}, {perms::group_write, 'w'}, {perms::group_exec, 'x'},
                {perms::others_read, 'r'}, {perms::others_write, 'w'}, {perms::others_exec, 'x'},
            };
            std::string result;
            for (const auto &[bit, letter] : bits)
            {
                result.push_back((value & bit) != perms::none ? letter : '-');
            }
            return result;
        }

        void stream_copy(const std::filesystem::path &source, Side source_side,
                         const std::filesystem::path &destination, Side destination_side,
                         const ProgressCallback &progress)
        {
            std::error_code ec;
            if (std::filesystem::is_directory(source, ec))
            {
                fail(source_side, "Cannot transfer a directory: " + source.string(), ErrorCode::IsADirectory);
            }
            const auto total = std::filesystem::file_size(source, ec);
            if (ec)
            {
                fail(source_side, "Cannot read", source, ec);
            }
            const auto source_time = std::filesystem::last_write_time(source, ec);
            if (ec)
            {
                fail(source_side, "Cannot read modification time of", source, ec);
            }

            std::ifstream in(source, std::ios::binary);
            if (!in.is_open())
            {
                fail(source_side, "Failed to open " + source.string() + " for reading", ErrorCode::IoFailure);
            }

            auto partial = destination;
            partial += kPartialSuffix;
            std::ofstream out(partial, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                fail(destination_side, "Failed to open " + destination.string() + " for writing",
                     ErrorCode::IoFailure);
            }

            std::vector<char> buffer(kChunkSize);
            std::uint64_t written = 0;
            try
            {
                while (in)
                {
                    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                    const auto count = in.gcount();
                    if (count <= 0)
                    {
                        break;
                    }
                    out.write(buffer.data(), count);
                    if (!out)
                    {
                        fail(destination_side, "Write failed for " + destination.string(), ErrorCode::IoFailure);
                    }
                    written += static_cast<std::uint64_t>(count);
                    if (progress)
                    {
                        progress(written, total);
                    }
                }
                if (in.bad())
                {
                    fail(source_side, "Read failed for " + source.string(), ErrorCode::IoFailure);
                }
                out.close();
                if (out.fail())
                {
                    fail(destination_side, "Failed to flush " + destination.string(), ErrorCode::IoFailure);
                }
            }
            catch (...)
            {
                out.close();
                std::filesystem::remove(partial, ec);
                throw;
            }

            std::filesystem::rename(partial, destination, ec);
            if (ec)
            {
                std::error_code cleanup;
                std::filesystem::remove(partial, cleanup);
                fail(destination_side, "Cannot move into place", destination, ec);
            }
            std::filesystem::last_write_time(destination, source_time, ec);
            if (ec)
            {
                fail(destination_side, "Cannot set modification time of", destination, ec);
            }
        }

    } // namespace

    LocalSession::LocalSession(Site site) : RemoteSession(std::move(site)), root_(this->site().hostname) {}

    void LocalSession::connect()
    {
        std::error_code ec;
        if (root_.empty() || !std::filesystem::is_directory(root_, ec))
        {
            throw ConnectionError("Root directory is not available: " + root_.string());
        }
        connected_ = true;
    }

    void LocalSession::disconnect()
    {
        connected_ = false;
    }

    bool LocalSession::is_connected() const
    {
        return connected_;
    }

    std::vector<RemoteFile> LocalSession::list_directory(const std::string &path)
    {
        const auto target = resolve(path);
        std::error_code ec;
        if (!std::filesystem::exists(target, ec))
        {
            throw FileOperationError("Path does not exist: " + path, ErrorCode::NotFound);
        }
        if (!std::filesystem::is_directory(target, ec))
        {
            throw FileOperationError("Not a directory: " + path, ErrorCode::NotADirectory);
        }

        std::filesystem::directory_iterator it(target, ec);
        if (ec)
        {
            fail(Side::Remote, "Cannot list", path, ec);
        }
        std::vector<RemoteFile> entries;
        for (; it != std::filesystem::directory_iterator(); it.increment(ec))
        {
            if (ec)
            {
                break;
            }
            if (it->path().filename().string().ends_with(kPartialSuffix))
            {
                continue;
            }
            try
            {
                entries.push_back(describe(it->path()));
            }
            catch (const FileOperationError &)
            {
                // Entry vanished or became unreadable between listing and stat.
                continue;
            }
        }
        return entries;
    }

    RemoteFile LocalSession::stat(const std::string &path)
    {
        return describe(resolve(path));
    }

    void LocalSession::mkdir(const std::string &path, bool recursive)
    {
        const auto target = resolve(path);
        std::error_code ec;
        if (recursive)
        {
            std::filesystem::create_directories(target, ec);
            if (ec)
            {
                fail(Side::Remote, "Cannot create directory", path, ec);
            }
            return;
        }
        if (std::filesystem::exists(target, ec))
        {
            throw FileOperationError("Already exists: " + path, ErrorCode::AlreadyExists);
        }
        std::filesystem::create_directory(target, ec);
        if (ec)
        {
            fail(Side::Remote, "Cannot create directory", path, ec);
        }
    }

    void LocalSession::rmdir(const std::string &path)
    {
        const auto target = resolve(path);
        const auto info = describe(target);
        if (!info.is_directory())
        {
            throw FileOperationError("Not a directory: " + path, ErrorCode::NotADirectory);
        }
        std::error_code ec;
        std::filesystem::remove(target, ec);
        if (ec)
        {
            fail(Side::Remote, "Cannot remove directory", path, ec);
        }
    }

    void LocalSession::remove(const std::string &path)
    {
        const auto target = resolve(path);
        const auto info = describe(target);
        if (info.is_directory())
        {
            throw FileOperationError("Is a directory: " + path, ErrorCode::IsADirectory);
        }
        std::error_code ec;
        std::filesystem::remove(target, ec);
        if (ec)
        {
            fail(Side::Remote, "Cannot remove", path, ec);
        }
    }

    void LocalSession::rename(const std::string &from, const std::string &to)
    {
        const auto source = resolve(from);
        const auto destination = resolve(to);
        (void)describe(source);
        std::error_code ec;
        std::filesystem::rename(source, destination, ec);
        if (ec)
        {
            fail(Side::Remote, "Cannot rename " + from + " to", to, ec);
        }
    }

    void LocalSession::upload(const std::filesystem::path &local_path, const std::string &remote_path,
                              const ProgressCallback &progress)
    {
        const auto target = resolve(remote_path);
        std::error_code ec;
        if (!std::filesystem::is_directory(target.parent_path(), ec))
        {
            throw FileOperationError("Parent directory does not exist: " + remote_path, ErrorCode::NotFound);
        }
        stream_copy(local_path, Side::Local, target, Side::Remote, progress);
    }

    void LocalSession::download(const std::string &remote_path, const std::filesystem::path &local_path,
                                const ProgressCallback &progress)
    {
        const auto source = resolve(remote_path);
        std::error_code ec;
        if (!std::filesystem::exists(source, ec))
        {
            throw FileOperationError("Path does not exist: " + remote_path, ErrorCode::NotFound);
        }
        stream_copy(source, Side::Remote, local_path, Side::Local, progress);
    }

    void LocalSession::chmod(const std::string &path, std::uint32_t mode)
    {
        const auto target = resolve(path);
        std::error_code ec;
        std::filesystem::permissions(target, static_cast<std::filesystem::perms>(mode & 07777),
                                     std::filesystem::perm_options::replace, ec);
        if (ec)
        {
            fail(Side::Remote, "Cannot change permissions of", path, ec);
        }
    }

    std::optional<std::string> LocalSession::checksum(const std::string &path, std::string_view algorithm)
    {
        if (algorithm != crypto::kChecksumAlgorithm)
        {
            return std::nullopt;
        }
        const auto target = resolve(path);
        if (describe(target).is_directory())
        {
            throw FileOperationError("Is a directory: " + path, ErrorCode::IsADirectory);
        }
        return crypto::hash_file(target);
    }

    void LocalSession::ensure_connected() const
    {
        if (!connected_)
        {
            throw ConnectionError("Session for " + site().name + " is not connected");
        }
    }

    std::filesystem::path LocalSession::resolve(const std::string &requested) const
    {
        ensure_connected();

        std::filesystem::path relative = requested;
        if (relative.is_relative())
        {
            relative = std::filesystem::path(working_directory()) / relative;
        }
        relative = relative.lexically_relative("/");

        std::filesystem::path sanitized = root_;
        for (const auto &part : relative)
        {
            const auto part_string = part.generic_string();
            if (part_string.empty() || part_string == ".")
            {
                continue;
            }
            if (part_string == "..")
            {
                throw FileOperationError("Path traversal detected: " + requested, ErrorCode::InvalidPath);
            }
            sanitized /= part;
        }
        return sanitized;
    }

    std::string LocalSession::remote_path_of(const std::filesystem::path &target) const
    {
        const auto rel = target.lexically_relative(root_).generic_string();
        if (rel.empty() || rel == ".")
        {
            return "/";
        }
        return "/" + rel;
    }

    RemoteFile LocalSession::describe(const std::filesystem::path &target) const
    {
        std::error_code ec;
        const auto link_status = std::filesystem::symlink_status(target, ec);
        if (ec || !std::filesystem::exists(link_status))
        {
            throw FileOperationError("Path does not exist: " + remote_path_of(target), ErrorCode::NotFound);
        }

        RemoteFile file;
        file.path = remote_path_of(target);
        file.name = file.path == "/" ? std::string("/") : target.filename().string();
        file.hidden = !file.name.empty() && file.name.front() == '.';
        file.permissions = permission_string(link_status.permissions());

        if (std::filesystem::is_symlink(link_status))
        {
            file.type = FileType::Link;
            // Sized by its target so a linked file compares like the file it points at.
            std::error_code target_ec;
            if (std::filesystem::is_regular_file(std::filesystem::status(target, target_ec)))
            {
                file.size = std::filesystem::file_size(target, target_ec);
                if (target_ec)
                {
                    file.size = 0;
                }
            }
        }
        else if (std::filesystem::is_directory(link_status))
        {
            file.type = FileType::Directory;
        }
        else if (std::filesystem::is_regular_file(link_status))
        {
            file.type = FileType::File;
            file.size = std::filesystem::file_size(target, ec);
            if (ec)
            {
                fail(Side::Remote, "Cannot read size of", file.path, ec);
            }
        }
        else
        {
            file.type = FileType::Unknown;
        }

        const auto modified = std::filesystem::last_write_time(target, ec);
        if (!ec)
        {
            file.modified = to_system_time(modified);
        }
        return file;
    }

    void register_builtin_protocols(SessionFactory &factory)
    {
        factory.register_protocol(LocalSession::kProtocol, [](const Site &site)
                                  { return std::make_shared<LocalSession>(site); });
    }

} // namespace ferry::client
