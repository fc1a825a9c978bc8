#include "time_utils.hpp"

#include <ctime>

namespace {

std::string format_local(std::chrono::system_clock::time_point tp, const char* fmt) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

} // namespace

std::string timestamp() {
    return format_local(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S");
}

std::string format_clock_time(std::chrono::system_clock::time_point tp) {
    return format_local(tp, "%H:%M:%S");
}
