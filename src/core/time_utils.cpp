#include "time_utils.hpp"
#include <fmt/format.h>
#include <cctype>

static struct tm local_tm(std::time_t t) {
    struct tm tm_buf = {};
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    return tm_buf;
}

std::string format_elapsed(std::chrono::seconds elapsed) {
    long long seconds = elapsed.count();
    if (seconds < 0) seconds = 0;
    long long hours = seconds / 3600;
    long long mins = (seconds % 3600) / 60;
    long long secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    }
    return fmt::format("{}s", secs);
}

std::string format_clock(std::time_t t) {
    struct tm tm_buf = local_tm(t);

    // "08:13PM" -> "8:13pm"
    char buf[16];
    std::strftime(buf, sizeof(buf), "%I:%M%p", &tm_buf);
    std::string result(buf);
    if (!result.empty() && result[0] == '0') result.erase(0, 1);
    for (auto& c : result) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return result;
}

std::string format_epoch(int64_t epoch_secs) {
    if (epoch_secs <= 0) return "-";
    struct tm tm_buf = local_tm(static_cast<std::time_t>(epoch_secs));
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm_buf);
    return std::string(buf);
}
