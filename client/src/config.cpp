#include "ferry/client/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>

#include "ferry/client/logger.hpp"
#include "ferry/errors.hpp"

namespace ferry::client
{

    namespace
    {

        constexpr const char *kUsage =
            "Usage: ferry --config <file> [--log <file>] [--verbose] <command> [args...]\n"
            "Commands:\n"
            "  protocols\n"
            "  plan <profile>\n"
            "  sync <profile> [--dry-run]\n"
            "  upload <site> <local> <remote>\n"
            "  download <site> <remote> <local>";

        std::size_t expected_arguments(const std::string &command)
        {
            if (command == "protocols")
            {
                return 0;
            }
            if (command == "plan" || command == "sync")
            {
                return 1;
            }
            if (command == "upload" || command == "download")
            {
                return 3;
            }
            throw std::runtime_error("Unknown command: " + command + "\n" + kUsage);
        }

        std::string lowercase(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return value;
        }

        template <typename T>
        T read_number(const nlohmann::json &json, const char *key, T fallback, long long minimum)
        {
            const auto it = json.find(key);
            if (it == json.end())
            {
                return fallback;
            }
            if (!it->is_number_integer())
            {
                throw ConfigurationError(std::string(key) + " must be an integer");
            }
            if (!it->is_number_unsigned() && it->get<long long>() < minimum)
            {
                throw ConfigurationError(std::string(key) + " must be at least " + std::to_string(minimum));
            }
            const auto value = it->is_number_unsigned() ? it->get<unsigned long long>()
                                                        : static_cast<unsigned long long>(it->get<long long>());
            if (value < static_cast<unsigned long long>(minimum))
            {
                throw ConfigurationError(std::string(key) + " must be at least " + std::to_string(minimum));
            }
            constexpr auto maximum = static_cast<unsigned long long>(std::numeric_limits<T>::max());
            if (value > maximum)
            {
                throw ConfigurationError(std::string(key) + " must be at most " + std::to_string(maximum));
            }
            return static_cast<T>(value);
        }

    } // namespace

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;
        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--config")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--config requires a file path");
                }
                config.config_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--log")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--log requires a file path");
                }
                config.log_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg == "--dry-run")
            {
                config.dry_run = true;
            }
            else if (arg.starts_with("--"))
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else if (config.command.empty())
            {
                config.command = arg;
            }
            else
            {
                config.arguments.push_back(arg);
            }
        }

        if (config.command.empty())
        {
            throw std::runtime_error(kUsage);
        }
        if (config.arguments.size() != expected_arguments(config.command))
        {
            throw std::runtime_error("Wrong number of arguments for " + config.command + "\n" + kUsage);
        }
        if (config.dry_run && config.command != "sync")
        {
            throw std::runtime_error("--dry-run only applies to sync");
        }
        if (config.config_path.empty() && config.command != "protocols")
        {
            throw std::runtime_error("--config is required for " + config.command);
        }
        return config;
    }

    const Site *AppConfig::find_site(const std::string &key) const
    {
        for (const auto &site : sites)
        {
            if (site.id == key)
            {
                return &site;
            }
        }
        for (const auto &site : sites)
        {
            if (site.name == key)
            {
                return &site;
            }
        }
        return nullptr;
    }

    const SyncProfile *AppConfig::find_profile(const std::string &key) const
    {
        for (const auto &profile : profiles)
        {
            if (profile.id == key)
            {
                return &profile;
            }
        }
        for (const auto &profile : profiles)
        {
            if (profile.name == key)
            {
                return &profile;
            }
        }
        return nullptr;
    }

    TransferManagerConfig AppConfig::transfer_config() const
    {
        TransferManagerConfig config;
        config.max_workers = max_workers;
        config.queue_capacity = queue_capacity;
        return config;
    }

    AppConfig parse_app_config(const nlohmann::json &json, const SessionFactory *factory)
    {
        if (!json.is_object())
        {
            throw ConfigurationError("Configuration must be a JSON object");
        }

        AppConfig config;
        config.max_workers = read_number<std::size_t>(json, "max_workers", config.max_workers, 1);
        config.queue_capacity = read_number<std::size_t>(json, "queue_capacity", config.queue_capacity, 1);
        config.max_retries = read_number<int>(json, "max_retries", config.max_retries, 0);

        const auto level_name = json.value("log_level", std::string("info"));
        const auto level = log_level_from_string(level_name);
        if (!level)
        {
            throw ConfigurationError("Unknown log level: " + level_name);
        }
        config.log_level = *level;

        std::set<std::string> protocols;
        if (factory)
        {
            const auto supported = factory->supported_protocols();
            protocols.insert(supported.begin(), supported.end());
        }

        try
        {
            std::set<std::string> site_ids;
            for (const auto &entry : json.value("sites", nlohmann::json::array()))
            {
                auto site = entry.get<Site>();
                if (!site_ids.insert(site.id).second)
                {
                    throw ConfigurationError("Duplicate site id: " + site.id);
                }
                if (factory && !protocols.contains(lowercase(site.protocol)))
                {
                    throw ConfigurationError("Unsupported protocol '" + site.protocol + "' for site " + site.name);
                }
                config.sites.push_back(std::move(site));
            }

            std::set<std::string> profile_ids;
            for (const auto &entry : json.value("sync_profiles", nlohmann::json::array()))
            {
                auto profile = entry.get<SyncProfile>();
                if (!profile_ids.insert(profile.id).second)
                {
                    throw ConfigurationError("Duplicate sync profile id: " + profile.id);
                }
                const auto *site = config.find_site(profile.site_id);
                if (!site)
                {
                    throw ConfigurationError("Sync profile " + profile.name + " refers to unknown site " +
                                             profile.site_id);
                }
                profile.site_id = site->id;
                config.profiles.push_back(std::move(profile));
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ConfigurationError(std::string("Invalid configuration: ") + ex.what());
        }

        return config;
    }

    AppConfig load_app_config(const std::filesystem::path &path, const SessionFactory *factory)
    {
        std::ifstream input(path);
        if (!input)
        {
            throw ConfigurationError("Cannot open configuration file " + path.string());
        }
        nlohmann::json json;
        try
        {
            input >> json;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw ConfigurationError("Cannot parse " + path.string() + ": " + ex.what());
        }
        return parse_app_config(json, factory);
    }

} // namespace ferry::client
