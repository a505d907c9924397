#include "time_utils.hpp"
#include <chrono>
#include <ctime>

static std::tm local_tm(std::time_t t) {
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return tm;
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::tm tm = local_tm(std::chrono::system_clock::to_time_t(now));
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

std::string format_elapsed(std::chrono::milliseconds dur) {
    long long total = dur.count();
    long long ms = total % 1000;
    long long s = (total / 1000) % 60;
    long long m = total / 60000;
    std::string out;
    if (m > 0)
        out += std::to_string(m) + "m";
    out += std::to_string(s);
    if (ms > 0) {
        std::string frac = std::to_string(ms);
        out += "." + std::string(3 - frac.size(), '0') + frac;
    }
    out += "s";
    return out;
}

void to_dos_datetime(std::time_t t, unsigned short& dos_date, unsigned short& dos_time) {
    std::tm tm = local_tm(t);
    if (tm.tm_year < 80) {
        dos_date = static_cast<unsigned short>((0 << 9) | (1 << 5) | 1);
        dos_time = 0;
        return;
    }
    dos_date = static_cast<unsigned short>(((tm.tm_year - 80) << 9) | ((tm.tm_mon + 1) << 5) |
                                           tm.tm_mday);
    dos_time =
        static_cast<unsigned short>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
}
