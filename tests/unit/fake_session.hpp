#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "ferry/crypto.hpp"
#include "ferry/errors.hpp"
#include "ferry/remote_session.hpp"

namespace ferry::testing
{

    struct FakeNode
    {
        bool directory{};
        std::string content;
        std::optional<TimePoint> modified{};
    };

    // In-memory remote tree shared by every FakeSession created for it.
    class FakeRemote
    {
    public:
        static std::string normalize(const std::string &path)
        {
            std::string result = path.empty() || path.front() != '/' ? "/" + path : path;
            while (result.size() > 1 && result.back() == '/')
            {
                result.pop_back();
            }
            return result;
        }

        static std::string parent_of(const std::string &path)
        {
            const auto slash = path.find_last_of('/');
            return slash == 0 || slash == std::string::npos ? std::string("/") : path.substr(0, slash);
        }

        void put_file(const std::string &path, std::string content, std::optional<TimePoint> modified = std::nullopt)
        {
            std::lock_guard lock(mutex);
            const auto key = normalize(path);
            add_parents(key);
            nodes[key] = FakeNode{.directory = false, .content = std::move(content), .modified = modified};
        }

        void put_directory(const std::string &path)
        {
            std::lock_guard lock(mutex);
            const auto key = normalize(path);
            add_parents(key);
            nodes[key] = FakeNode{.directory = true};
        }

        std::optional<FakeNode> node(const std::string &path) const
        {
            std::lock_guard lock(mutex);
            const auto key = normalize(path);
            if (key == "/")
            {
                return FakeNode{.directory = true};
            }
            auto it = nodes.find(key);
            if (it == nodes.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::optional<std::string> content(const std::string &path) const
        {
            auto found = node(path);
            if (!found || found->directory)
            {
                return std::nullopt;
            }
            return found->content;
        }

        void close_gate()
        {
            std::lock_guard lock(mutex);
            gate_closed = true;
        }

        void open_gate()
        {
            {
                std::lock_guard lock(mutex);
                gate_closed = false;
            }
            gate_cv.notify_all();
        }

        void wait_gate()
        {
            std::unique_lock lock(mutex);
            gate_cv.wait(lock, [this]
                         { return !gate_closed; });
        }

        // Caller holds `mutex`.
        void add_parents(const std::string &key)
        {
            for (auto parent = parent_of(key); parent != "/"; parent = parent_of(parent))
            {
                nodes.try_emplace(parent, FakeNode{.directory = true});
            }
        }

        mutable std::mutex mutex;
        std::condition_variable gate_cv;
        bool gate_closed{false};
        std::map<std::string, FakeNode> nodes;

        std::set<std::string> fail_uploads;
        std::set<std::string> fail_downloads;
        std::set<std::string> fail_lists;
        std::set<std::string> fail_removes;
        bool fail_connect{false};
        bool checksums{false};
        bool corrupt_checksums{false};
        // Runs after every successful listing, outside the node lock.
        std::function<void(const std::string &)> after_list;

        std::atomic<int> connects{0};
        std::atomic<int> disconnects{0};
        std::atomic<int> transfers{0};
        std::atomic<int> active{0};
        std::atomic<int> max_active{0};
    };

    class FakeSession : public RemoteSession
    {
    public:
        explicit FakeSession(std::shared_ptr<FakeRemote> remote, Site site = default_site())
            : RemoteSession(std::move(site)), remote_(std::move(remote))
        {
        }

        static Site default_site()
        {
            Site site;
            site.id = "fake";
            site.name = "fake";
            site.protocol = "fake";
            return site;
        }

        void connect() override
        {
            if (remote_->fail_connect)
            {
                throw ConnectionError("fake connection refused");
            }
            ++remote_->connects;
            connected_ = true;
        }

        void disconnect() override
        {
            if (connected_.exchange(false))
            {
                ++remote_->disconnects;
            }
        }

        bool is_connected() const override { return connected_; }

        std::vector<RemoteFile> list_directory(const std::string &path) override
        {
            const auto key = FakeRemote::normalize(path);
            if (remote_->fail_lists.contains(key))
            {
                throw FileOperationError("listing refused: " + key, ErrorCode::PermissionDenied);
            }
            const auto found = remote_->node(key);
            if (!found)
            {
                throw FileOperationError("no such directory: " + key, ErrorCode::NotFound);
            }
            if (!found->directory)
            {
                throw FileOperationError("not a directory: " + key, ErrorCode::NotADirectory);
            }
            std::vector<RemoteFile> result;
            {
                std::lock_guard lock(remote_->mutex);
                for (const auto &[child, node] : remote_->nodes)
                {
                    if (child != "/" && FakeRemote::parent_of(child) == key)
                    {
                        result.push_back(describe(child, node));
                    }
                }
            }
            if (remote_->after_list)
            {
                remote_->after_list(key);
            }
            return result;
        }

        RemoteFile stat(const std::string &path) override
        {
            const auto key = FakeRemote::normalize(path);
            const auto found = remote_->node(key);
            if (!found)
            {
                throw FileOperationError("no such file: " + key, ErrorCode::NotFound);
            }
            return describe(key, *found);
        }

        void mkdir(const std::string &path, bool recursive) override
        {
            const auto key = FakeRemote::normalize(path);
            std::lock_guard lock(remote_->mutex);
            if (auto it = remote_->nodes.find(key); it != remote_->nodes.end())
            {
                if (recursive && it->second.directory)
                {
                    return;
                }
                throw FileOperationError("already exists: " + key, ErrorCode::AlreadyExists);
            }
            const auto parent = FakeRemote::parent_of(key);
            if (!recursive && parent != "/" && !remote_->nodes.contains(parent))
            {
                throw FileOperationError("no parent for " + key, ErrorCode::NotFound);
            }
            remote_->add_parents(key);
            remote_->nodes[key] = FakeNode{.directory = true};
        }

        void rmdir(const std::string &path) override
        {
            const auto key = FakeRemote::normalize(path);
            std::lock_guard lock(remote_->mutex);
            auto it = remote_->nodes.find(key);
            if (it == remote_->nodes.end() || !it->second.directory)
            {
                throw FileOperationError("no such directory: " + key, ErrorCode::NotFound);
            }
            for (const auto &[child, node] : remote_->nodes)
            {
                if (FakeRemote::parent_of(child) == key && child != key)
                {
                    throw FileOperationError("directory not empty: " + key, ErrorCode::IoFailure);
                }
            }
            remote_->nodes.erase(it);
        }

        void remove(const std::string &path) override
        {
            const auto key = FakeRemote::normalize(path);
            std::lock_guard lock(remote_->mutex);
            if (remote_->fail_removes.contains(key))
            {
                throw FileOperationError("remove refused: " + key, ErrorCode::PermissionDenied);
            }
            auto it = remote_->nodes.find(key);
            if (it == remote_->nodes.end())
            {
                throw FileOperationError("no such file: " + key, ErrorCode::NotFound);
            }
            if (it->second.directory)
            {
                throw FileOperationError("is a directory: " + key, ErrorCode::IsADirectory);
            }
            remote_->nodes.erase(it);
        }

        void rename(const std::string &from, const std::string &to) override
        {
            std::lock_guard lock(remote_->mutex);
            auto it = remote_->nodes.find(FakeRemote::normalize(from));
            if (it == remote_->nodes.end())
            {
                throw FileOperationError("no such file: " + from, ErrorCode::NotFound);
            }
            auto node = it->second;
            remote_->nodes.erase(it);
            remote_->nodes[FakeRemote::normalize(to)] = std::move(node);
        }

        void upload(const std::filesystem::path &local_path, const std::string &remote_path,
                    const ProgressCallback &progress) override
        {
            const auto key = FakeRemote::normalize(remote_path);
            ActiveGuard guard(*remote_);
            std::ifstream input(local_path, std::ios::binary);
            if (!input)
            {
                throw LocalIOError("cannot open " + local_path.string());
            }
            const std::string data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
            report(progress, data.size() / 2, data.size());
            remote_->wait_gate();
            if (remote_->fail_uploads.contains(key))
            {
                throw FileOperationError("upload refused: " + key, ErrorCode::PermissionDenied);
            }
            report(progress, data.size(), data.size());
            std::error_code ec;
            const auto modified = std::filesystem::last_write_time(local_path, ec);
            std::optional<TimePoint> stamp;
            if (!ec)
            {
                stamp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                    modified - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
            }
            remote_->put_file(key, data, stamp);
        }

        void download(const std::string &remote_path, const std::filesystem::path &local_path,
                      const ProgressCallback &progress) override
        {
            const auto key = FakeRemote::normalize(remote_path);
            ActiveGuard guard(*remote_);
            const auto data = remote_->content(key);
            if (!data)
            {
                throw FileOperationError("no such file: " + key, ErrorCode::NotFound);
            }
            report(progress, data->size() / 2, data->size());
            remote_->wait_gate();
            if (remote_->fail_downloads.contains(key))
            {
                throw FileOperationError("download refused: " + key, ErrorCode::PermissionDenied);
            }
            {
                std::ofstream output(local_path, std::ios::binary | std::ios::trunc);
                if (!output)
                {
                    throw LocalIOError("cannot write " + local_path.string());
                }
                output << *data;
            }
            report(progress, data->size(), data->size());
        }

        void chmod(const std::string &path, std::uint32_t /*mode*/) override
        {
            (void)stat(path);
        }

        std::optional<std::string> checksum(const std::string &path, std::string_view /*algorithm*/) override
        {
            if (!remote_->checksums)
            {
                return std::nullopt;
            }
            const auto data = remote_->content(path);
            if (!data)
            {
                throw FileOperationError("no such file: " + path, ErrorCode::NotFound);
            }
            if (remote_->corrupt_checksums)
            {
                return std::string("0000");
            }
            return crypto::hash_bytes(std::as_bytes(std::span(data->data(), data->size())));
        }

    private:
        struct ActiveGuard
        {
            explicit ActiveGuard(FakeRemote &remote) : remote_(remote)
            {
                ++remote_.transfers;
                const auto now = ++remote_.active;
                auto seen = remote_.max_active.load();
                while (now > seen && !remote_.max_active.compare_exchange_weak(seen, now))
                {
                }
            }
            ~ActiveGuard() { --remote_.active; }

            FakeRemote &remote_;
        };

        static void report(const ProgressCallback &progress, std::uint64_t transferred, std::uint64_t total)
        {
            if (progress)
            {
                progress(transferred, total);
            }
        }

        static RemoteFile describe(const std::string &key, const FakeNode &node)
        {
            RemoteFile file;
            file.path = key;
            file.name = key == "/" ? std::string("/") : key.substr(key.find_last_of('/') + 1);
            file.type = node.directory ? FileType::Directory : FileType::File;
            file.size = node.directory ? 0 : node.content.size();
            file.modified = node.modified;
            file.hidden = file.name.starts_with(".");
            return file;
        }

        std::shared_ptr<FakeRemote> remote_;
        std::atomic<bool> connected_{false};
    };

    inline std::filesystem::path scratch_directory(const std::string &name)
    {
        const auto path = std::filesystem::temp_directory_path() / ("ferry_test_" + name);
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        std::filesystem::create_directories(path);
        return path;
    }

    inline void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    inline void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream output(path, std::ios::binary | std::ios::trunc);
        output << content;
    }

    inline std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream input(path, std::ios::binary);
        std::ostringstream buffer;
        buffer << input.rdbuf();
        return buffer.str();
    }

    inline bool wait_until(const std::function<bool()> &predicate,
                           std::chrono::milliseconds timeout = std::chrono::seconds(10))
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (predicate())
            {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return predicate();
    }

} // namespace ferry::testing
