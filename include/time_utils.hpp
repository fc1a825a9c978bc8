#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <chrono>
#include <string>

/**
 * @brief Get the current local time formatted as YYYY-MM-DD HH:MM:SS.
 */
std::string timestamp();

/**
 * @brief Format @p tp as local HH:MM:SS.
 */
std::string format_clock_time(std::chrono::system_clock::time_point tp);

#endif // TIME_UTILS_HPP
