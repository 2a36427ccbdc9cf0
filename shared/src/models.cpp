#include "ferry/models.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

#include "ferry/crypto.hpp"
#include "ferry/errors.hpp"
#include "ferry/file_time.hpp"

namespace ferry
{

    namespace
    {

        template <typename Enum>
        struct EnumLabel
        {
            Enum value;
            std::string_view label;
        };

        template <typename Enum, std::size_t N>
        std::string_view label_for(const std::array<EnumLabel<Enum>, N> &mappings, Enum value) noexcept
        {
            for (const auto &mapping : mappings)
            {
                if (mapping.value == value)
                {
                    return mapping.label;
                }
            }
            return "unknown";
        }

        template <typename Enum, std::size_t N>
        std::optional<Enum> value_for(const std::array<EnumLabel<Enum>, N> &mappings, std::string_view label) noexcept
        {
            for (const auto &mapping : mappings)
            {
                if (mapping.label == label)
                {
                    return mapping.value;
                }
            }
            return std::nullopt;
        }

        constexpr std::array<EnumLabel<TransferDirection>, 2> kDirectionLabels{{
            {TransferDirection::Upload, "upload"},
            {TransferDirection::Download, "download"},
        }};

        constexpr std::array<EnumLabel<TransferStatus>, 6> kStatusLabels{{
            {TransferStatus::Pending, "pending"},
            {TransferStatus::Running, "running"},
            {TransferStatus::Paused, "paused"},
            {TransferStatus::Completed, "completed"},
            {TransferStatus::Failed, "failed"},
            {TransferStatus::Cancelled, "cancelled"},
        }};

        constexpr std::array<EnumLabel<OverwriteMode>, 4> kOverwriteLabels{{
            {OverwriteMode::Ask, "ask"},
            {OverwriteMode::Overwrite, "overwrite"},
            {OverwriteMode::Skip, "skip"},
            {OverwriteMode::Rename, "rename"},
        }};

        constexpr std::array<EnumLabel<SyncMode>, 4> kSyncModeLabels{{
            {SyncMode::Mirror, "mirror"},
            {SyncMode::Bidirectional, "bidirectional"},
            {SyncMode::UploadOnly, "upload_only"},
            {SyncMode::DownloadOnly, "download_only"},
        }};

        constexpr std::array<EnumLabel<FileType>, 4> kFileTypeLabels{{
            {FileType::File, "file"},
            {FileType::Directory, "directory"},
            {FileType::Link, "link"},
            {FileType::Unknown, "unknown"},
        }};

        constexpr std::array<EnumLabel<SyncActionKind>, 6> kActionLabels{{
            {SyncActionKind::Upload, "upload"},
            {SyncActionKind::Download, "download"},
            {SyncActionKind::DeleteLocal, "delete_local"},
            {SyncActionKind::DeleteRemote, "delete_remote"},
            {SyncActionKind::MkdirLocal, "mkdir_local"},
            {SyncActionKind::MkdirRemote, "mkdir_remote"},
        }};

        std::vector<std::string> string_list(const nlohmann::json &json, const char *key)
        {
            std::vector<std::string> values;
            if (auto it = json.find(key); it != json.end())
            {
                if (!it->is_array())
                {
                    throw ConfigurationError(std::string("Expected a list of patterns for ") + key);
                }
                for (const auto &value : *it)
                {
                    values.push_back(value.get<std::string>());
                }
            }
            return values;
        }

        std::string optional_time_label(const std::optional<TimePoint> &time)
        {
            return time ? std::to_string(to_unix_seconds(*time)) : std::string{};
        }

    } // namespace

    std::string_view to_string(TransferDirection direction) noexcept
    {
        return label_for(kDirectionLabels, direction);
    }

    std::optional<TransferDirection> transfer_direction_from_string(std::string_view value) noexcept
    {
        return value_for(kDirectionLabels, value);
    }

    std::string_view to_string(TransferStatus status) noexcept
    {
        return label_for(kStatusLabels, status);
    }

    std::optional<TransferStatus> transfer_status_from_string(std::string_view value) noexcept
    {
        return value_for(kStatusLabels, value);
    }

    std::string_view to_string(OverwriteMode mode) noexcept
    {
        return label_for(kOverwriteLabels, mode);
    }

    std::optional<OverwriteMode> overwrite_mode_from_string(std::string_view value) noexcept
    {
        return value_for(kOverwriteLabels, value);
    }

    std::string_view to_string(SyncMode mode) noexcept
    {
        return label_for(kSyncModeLabels, mode);
    }

    std::optional<SyncMode> sync_mode_from_string(std::string_view value) noexcept
    {
        return value_for(kSyncModeLabels, value);
    }

    std::string_view to_string(FileType type) noexcept
    {
        return label_for(kFileTypeLabels, type);
    }

    std::optional<FileType> file_type_from_string(std::string_view value) noexcept
    {
        return value_for(kFileTypeLabels, value);
    }

    std::string_view to_string(SyncActionKind kind) noexcept
    {
        return label_for(kActionLabels, kind);
    }

    std::optional<SyncActionKind> sync_action_kind_from_string(std::string_view value) noexcept
    {
        return value_for(kActionLabels, value);
    }

    std::string generate_id()
    {
        return crypto::random_hex(16);
    }

    std::string RemoteFile::extension() const
    {
        auto ext = std::filesystem::path(name).extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return ext;
    }

    double TransferItem::progress() const noexcept
    {
        if (size == 0)
        {
            return 0.0;
        }
        const auto ratio = static_cast<double>(transferred) / static_cast<double>(size);
        return std::min(ratio, 1.0);
    }

    bool TransferItem::can_retry() const noexcept
    {
        return status == TransferStatus::Failed && retry_count < max_retries;
    }

    TransferItem make_transfer_item(std::string site_id, TransferDirection direction,
                                    std::filesystem::path local_path, std::string remote_path, std::uint64_t size)
    {
        TransferItem item;
        item.id = generate_id();
        item.site_id = std::move(site_id);
        item.direction = direction;
        item.local_path = std::move(local_path);
        item.remote_path = std::move(remote_path);
        item.size = size;
        item.created_at = std::chrono::system_clock::now();
        return item;
    }

    void to_json(nlohmann::json &json, const TransferItem &item)
    {
        json = {
            {"id", item.id},
            {"site", item.site_id},
            {"direction", to_string(item.direction)},
            {"local", item.local_path.generic_string()},
            {"remote", item.remote_path},
            {"size", item.size},
            {"transferred", item.transferred},
            {"status", to_string(item.status)},
            {"retry_count", item.retry_count},
            {"max_retries", item.max_retries},
            {"created", to_unix_seconds(item.created_at)},
        };
        if (item.started_at)
        {
            json["started"] = to_unix_seconds(*item.started_at);
        }
        if (item.completed_at)
        {
            json["completed"] = to_unix_seconds(*item.completed_at);
        }
        if (item.error_message)
        {
            json["error"] = *item.error_message;
        }
    }

    void from_json(const nlohmann::json &json, Site &site)
    {
        site.id = json.value("id", std::string{});
        if (site.id.empty())
        {
            site.id = generate_id();
        }
        site.name = json.at("name").get<std::string>();
        site.protocol = json.at("protocol").get<std::string>();
        site.hostname = json.value("hostname", std::string{});
        const auto port = json.value("port", 0);
        if (port < 0 || port > 65535)
        {
            throw ConfigurationError("Port must be between 1 and 65535 for site " + site.name);
        }
        site.port = static_cast<std::uint16_t>(port);
        site.username = json.value("username", std::string{});
        if (auto it = json.find("password"); it != json.end())
        {
            site.password = it->get<std::string>();
        }
        if (auto it = json.find("remote_path"); it != json.end())
        {
            site.remote_path = it->get<std::string>();
        }
        if (auto it = json.find("local_path"); it != json.end())
        {
            site.local_path = std::filesystem::path(it->get<std::string>());
        }
        site.timeout = std::chrono::seconds(json.value("timeout", 30));
    }

    void from_json(const nlohmann::json &json, SyncProfile &profile)
    {
        profile.id = json.value("id", std::string{});
        if (profile.id.empty())
        {
            profile.id = generate_id();
        }
        profile.name = json.at("name").get<std::string>();
        profile.site_id = json.at("site").get<std::string>();
        profile.local_path = std::filesystem::path(json.at("local_path").get<std::string>());
        profile.remote_path = json.at("remote_path").get<std::string>();

        const auto mode_label = json.value("mode", std::string("mirror"));
        const auto mode = sync_mode_from_string(mode_label);
        if (!mode)
        {
            throw ConfigurationError("Unknown sync mode: " + mode_label);
        }
        profile.mode = *mode;

        profile.include_patterns = string_list(json, "include");
        profile.exclude_patterns = string_list(json, "exclude");
        profile.delete_extra = json.value("delete_extra", false);
        profile.preserve_timestamps = json.value("preserve_timestamps", true);
        profile.follow_symlinks = json.value("follow_symlinks", false);
        profile.verify_checksums = json.value("verify_checksums", true);
        profile.dry_run = json.value("dry_run", false);
    }

    std::string SyncAction::describe() const
    {
        const auto local = local_path ? local_path->generic_string() : std::string("?");
        const auto remote = remote_path.value_or("?");
        switch (kind)
        {
        case SyncActionKind::Upload:
            return "Upload " + local + " -> " + remote + " (" + reason + ")";
        case SyncActionKind::Download:
            return "Download " + remote + " -> " + local + " (" + reason + ")";
        case SyncActionKind::DeleteLocal:
            return "Delete local " + local + " (" + reason + ")";
        case SyncActionKind::DeleteRemote:
            return "Delete remote " + remote + " (" + reason + ")";
        case SyncActionKind::MkdirLocal:
            return "Create local directory " + local;
        case SyncActionKind::MkdirRemote:
            return "Create remote directory " + remote;
        }
        return std::string(to_string(kind)) + ": " + local + " <-> " + remote;
    }

    void to_json(nlohmann::json &json, const SyncAction &action)
    {
        json = {
            {"action", to_string(action.kind)},
            {"size", action.size},
            {"reason", action.reason},
        };
        if (action.local_path)
        {
            json["local"] = action.local_path->generic_string();
        }
        if (action.remote_path)
        {
            json["remote"] = *action.remote_path;
        }
    }

    std::uint64_t SyncResult::total_size() const noexcept
    {
        std::uint64_t total = 0;
        for (const auto &action : actions_executed)
        {
            total += action.size;
        }
        return total;
    }

    std::optional<std::chrono::duration<double>> SyncResult::duration() const
    {
        if (!start_time || !end_time)
        {
            return std::nullopt;
        }
        return std::chrono::duration<double>(*end_time - *start_time);
    }

    nlohmann::json SyncResult::summary() const
    {
        nlohmann::json errors_json = nlohmann::json::array();
        for (const auto &error : errors)
        {
            errors_json.push_back({{"action", error.action}, {"message", error.message}});
        }
        nlohmann::json json = {
            {"planned", actions_planned.size()},
            {"executed", success_count()},
            {"failed", error_count()},
            {"bytes", total_size()},
            {"dry_run", dry_run},
            {"errors", std::move(errors_json)},
            {"started", optional_time_label(start_time)},
            {"finished", optional_time_label(end_time)},
        };
        if (const auto elapsed = duration())
        {
            json["duration_seconds"] = elapsed->count();
        }
        else
        {
            json["duration_seconds"] = nullptr;
        }
        return json;
    }

} // namespace ferry
