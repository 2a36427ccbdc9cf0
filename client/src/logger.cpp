#include "ferry/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace ferry::client
{

    Logger::Logger()
        : logger_(std::make_shared<spdlog::logger>("ferry", std::make_shared<spdlog::sinks::null_sink_mt>()))
    {
    }

    Logger::Logger(const LoggerOptions &options)
    {
        std::vector<spdlog::sink_ptr> sinks;
        if (options.console)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }
        if (options.path)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.path->string(), true));
        }
        if (sinks.empty())
        {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }
        logger_ = std::make_shared<spdlog::logger>("ferry", sinks.begin(), sinks.end());
        logger_->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
        logger_->set_level(options.level);
        logger_->flush_on(spdlog::level::warn);
    }

    void Logger::transfer(spdlog::level::level_enum level, const TransferItem &item, std::string_view message) const
    {
        if (!logger_ || !logger_->should_log(level))
        {
            return;
        }
        logger_->log(level, "[transfer] id={} site={} {}", item.id, item.site_id, message);
    }

    std::optional<spdlog::level::level_enum> log_level_from_string(std::string_view value) noexcept
    {
        const auto level = spdlog::level::from_str(std::string(value));
        if (level == spdlog::level::off && value != "off")
        {
            return std::nullopt;
        }
        return level;
    }

} // namespace ferry::client
