/**
 * Ferry - Conversions between filesystem clock, system clock and unix seconds.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>

namespace ferry
{

    std::chrono::system_clock::time_point to_system_time(std::filesystem::file_time_type time);

    std::filesystem::file_time_type to_file_time(std::chrono::system_clock::time_point time);

    std::int64_t to_unix_seconds(std::chrono::system_clock::time_point time);

    std::chrono::system_clock::time_point from_unix_seconds(std::int64_t seconds);

    // Nearest whole second; filesystem and protocol timestamps only agree to that resolution.
    std::int64_t rounded_unix_seconds(std::chrono::system_clock::time_point time);

} // namespace ferry
