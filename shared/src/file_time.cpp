#include "ferry/file_time.hpp"

#include <cmath>

namespace ferry
{

    std::chrono::system_clock::time_point to_system_time(std::filesystem::file_time_type time)
    {
        using namespace std::chrono;
        return time_point_cast<system_clock::duration>(time - std::filesystem::file_time_type::clock::now() +
                                                       system_clock::now());
    }

    std::filesystem::file_time_type to_file_time(std::chrono::system_clock::time_point time)
    {
        using namespace std::chrono;
        return time_point_cast<std::filesystem::file_time_type::duration>(
            time - system_clock::now() + std::filesystem::file_time_type::clock::now());
    }

    std::int64_t to_unix_seconds(std::chrono::system_clock::time_point time)
    {
        using namespace std::chrono;
        return duration_cast<seconds>(time.time_since_epoch()).count();
    }

    std::chrono::system_clock::time_point from_unix_seconds(std::int64_t seconds)
    {
        return std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
    }

    std::int64_t rounded_unix_seconds(std::chrono::system_clock::time_point time)
    {
        const auto exact = std::chrono::duration<double>(time.time_since_epoch()).count();
        return static_cast<std::int64_t>(std::llround(exact));
    }

} // namespace ferry
