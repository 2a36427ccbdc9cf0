#pragma once

#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include "ferry/models.hpp"

namespace ferry::client
{

    struct LoggerOptions
    {
        std::optional<std::filesystem::path> path;
        bool console{false};
        spdlog::level::level_enum level{spdlog::level::info};
    };

    class Logger
    {
    public:
        // Null sink: every record is dropped.
        Logger();
        explicit Logger(const LoggerOptions &options);

        template <typename... Args>
        void log(spdlog::level::level_enum level, std::string_view tag, Args &&...args) const
        {
            if (!logger_ || !logger_->should_log(level))
            {
                return;
            }
            spdlog::fmt_lib::memory_buffer buf;
            (spdlog::fmt_lib::format_to(std::back_inserter(buf), "{}", std::forward<Args>(args)), ...);
            logger_->log(level, "[{}] {}", tag, std::string(buf.data(), buf.size()));
        }

        template <typename... Args>
        void info(std::string_view tag, Args &&...args) const
        {
            log(spdlog::level::info, tag, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void warn(std::string_view tag, Args &&...args) const
        {
            log(spdlog::level::warn, tag, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void error(std::string_view tag, Args &&...args) const
        {
            log(spdlog::level::err, tag, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void debug(std::string_view tag, Args &&...args) const
        {
            log(spdlog::level::debug, tag, std::forward<Args>(args)...);
        }

        // Fixed-field record for one transfer.
        void transfer(spdlog::level::level_enum level, const TransferItem &item, std::string_view message) const;

        std::shared_ptr<spdlog::logger> underlying() const { return logger_; }

    private:
        std::shared_ptr<spdlog::logger> logger_;
    };

    std::optional<spdlog::level::level_enum> log_level_from_string(std::string_view value) noexcept;

} // namespace ferry::client
