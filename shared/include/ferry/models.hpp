/**
 * Ferry - Transfer, site, sync profile and sync plan records with JSON serialization.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace ferry
{

    using TimePoint = std::chrono::system_clock::time_point;

    enum class TransferDirection : std::uint8_t
    {
        Upload,
        Download
    };

    std::string_view to_string(TransferDirection direction) noexcept;
    std::optional<TransferDirection> transfer_direction_from_string(std::string_view value) noexcept;

    enum class TransferStatus : std::uint8_t
    {
        Pending,
        Running,
        Paused,
        Completed,
        Failed,
        Cancelled
    };

    std::string_view to_string(TransferStatus status) noexcept;
    std::optional<TransferStatus> transfer_status_from_string(std::string_view value) noexcept;

    enum class OverwriteMode : std::uint8_t
    {
        Ask,
        Overwrite,
        Skip,
        Rename
    };

    std::string_view to_string(OverwriteMode mode) noexcept;
    std::optional<OverwriteMode> overwrite_mode_from_string(std::string_view value) noexcept;

    enum class SyncMode : std::uint8_t
    {
        Mirror,
        Bidirectional,
        UploadOnly,
        DownloadOnly
    };

    std::string_view to_string(SyncMode mode) noexcept;
    std::optional<SyncMode> sync_mode_from_string(std::string_view value) noexcept;

    enum class FileType : std::uint8_t
    {
        File,
        Directory,
        Link,
        Unknown
    };

    std::string_view to_string(FileType type) noexcept;
    std::optional<FileType> file_type_from_string(std::string_view value) noexcept;

    // Random 128-bit identifier rendered as 32 hex digits.
    std::string generate_id();

    struct RemoteFile
    {
        std::string name;
        std::string path;
        std::uint64_t size{};
        std::optional<TimePoint> modified{};
        std::optional<std::string> permissions{};
        std::optional<std::string> owner{};
        std::optional<std::string> group{};
        FileType type{FileType::File};
        bool hidden{};

        bool is_directory() const noexcept { return type == FileType::Directory; }
        std::string extension() const;
    };

    struct TransferItem
    {
        std::string id;
        std::string site_id;
        TransferDirection direction{TransferDirection::Upload};
        std::filesystem::path local_path;
        std::string remote_path;
        std::uint64_t size{};
        std::uint64_t transferred{};
        TransferStatus status{TransferStatus::Pending};
        int priority{};
        TimePoint created_at{};
        std::optional<TimePoint> started_at{};
        std::optional<TimePoint> completed_at{};
        std::optional<std::string> error_message{};
        int retry_count{};
        int max_retries{3};

        OverwriteMode overwrite_mode{OverwriteMode::Ask};
        bool verify_checksum{true};
        bool preserve_timestamp{true};
        bool create_directories{true};

        // Fraction in [0, 1]; 0 while the size is unknown.
        double progress() const noexcept;
        bool is_complete() const noexcept { return status == TransferStatus::Completed; }
        bool can_retry() const noexcept;
    };

    TransferItem make_transfer_item(std::string site_id, TransferDirection direction,
                                    std::filesystem::path local_path, std::string remote_path,
                                    std::uint64_t size = 0);

    void to_json(nlohmann::json &json, const TransferItem &item);

    struct Site
    {
        std::string id;
        std::string name;
        std::string protocol;
        std::string hostname;
        std::uint16_t port{};
        std::string username;
        std::optional<std::string> password{};
        std::optional<std::string> remote_path{};
        std::optional<std::filesystem::path> local_path{};
        std::chrono::seconds timeout{30};
    };

    void from_json(const nlohmann::json &json, Site &site);

    struct SyncProfile
    {
        std::string id;
        std::string name;
        std::string site_id;
        std::filesystem::path local_path;
        std::string remote_path;
        SyncMode mode{SyncMode::Mirror};

        std::vector<std::string> include_patterns;
        std::vector<std::string> exclude_patterns;

        bool delete_extra{false};
        bool preserve_timestamps{true};
        bool follow_symlinks{false};
        bool verify_checksums{true};
        bool dry_run{false};
    };

    void from_json(const nlohmann::json &json, SyncProfile &profile);

    enum class SyncActionKind : std::uint8_t
    {
        Upload,
        Download,
        DeleteLocal,
        DeleteRemote,
        MkdirLocal,
        MkdirRemote
    };

    std::string_view to_string(SyncActionKind kind) noexcept;
    std::optional<SyncActionKind> sync_action_kind_from_string(std::string_view value) noexcept;

    struct SyncAction
    {
        SyncActionKind kind{};
        std::optional<std::filesystem::path> local_path{};
        std::optional<std::string> remote_path{};
        std::uint64_t size{};
        std::string reason;

        std::string describe() const;
    };

    void to_json(nlohmann::json &json, const SyncAction &action);

    struct SyncError
    {
        SyncAction action;
        std::string message;
    };

    struct SyncResult
    {
        std::vector<SyncAction> actions_planned;
        std::vector<SyncAction> actions_executed;
        std::vector<SyncError> errors;
        std::optional<TimePoint> start_time{};
        std::optional<TimePoint> end_time{};
        bool dry_run{};

        std::size_t success_count() const noexcept { return actions_executed.size(); }
        std::size_t error_count() const noexcept { return errors.size(); }
        std::uint64_t total_size() const noexcept;
        std::optional<std::chrono::duration<double>> duration() const;

        nlohmann::json summary() const;
    };

} // namespace ferry
