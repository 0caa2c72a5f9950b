#include "time_util.hpp"

#include <chrono>
#include <ctime>

namespace apiproxy::plugins {

namespace {

std::string format_now(const char* format) {
    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buffer[32] = {0};
    std::strftime(buffer, sizeof(buffer), format, &tm);
    return buffer;
}

} // namespace

std::string now_iso() {
    return format_now("%Y-%m-%dT%H:%M:%SZ");
}

std::string today_compact() {
    return format_now("%Y%m%d");
}

} // namespace apiproxy::plugins
