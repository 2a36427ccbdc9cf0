#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include "ferry/client/transfer_manager.hpp"
#include "ferry/models.hpp"
#include "ferry/remote_session.hpp"

namespace ferry::client
{

    // Command line: ferry --config <file> [--log <file>] [--verbose] <command> [args...]
    struct ClientConfig
    {
        std::filesystem::path config_path;
        std::optional<std::filesystem::path> log_path;
        bool verbose{false};
        bool dry_run{false};
        std::string command;
        std::vector<std::string> arguments;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

    struct AppConfig
    {
        std::size_t max_workers{3};
        std::size_t queue_capacity{1024};
        int max_retries{3};
        spdlog::level::level_enum log_level{spdlog::level::info};
        std::vector<Site> sites;
        std::vector<SyncProfile> profiles;

        // Lookup by id first, then by display name.
        const Site *find_site(const std::string &key) const;
        const SyncProfile *find_profile(const std::string &key) const;

        TransferManagerConfig transfer_config() const;
    };

    // Throws ConfigurationError. When `factory` is given every site protocol must be registered.
    AppConfig parse_app_config(const nlohmann::json &json, const SessionFactory *factory = nullptr);
    AppConfig load_app_config(const std::filesystem::path &path, const SessionFactory *factory = nullptr);

} // namespace ferry::client
