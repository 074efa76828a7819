#include "dos_time.hpp"

#include <cstdio>

namespace zipbundle::zip {

namespace {

bool local_time(std::time_t t, std::tm* out) {
#if defined(_WIN32)
    return localtime_s(out, &t) == 0;
#else
    return localtime_r(&t, out) != nullptr;
#endif
}

} // namespace

DosDateTime to_dos_date_time(std::time_t t) {
    std::tm tm{};
    if (!local_time(t, &tm)) {
        return DOS_EPOCH;
    }

    const int year = tm.tm_year + 1900;
    if (year < 1980) {
        return DOS_EPOCH;
    }
    if (year > 2107) {
        // 2107-12-31 23:59:58
        return DosDateTime{static_cast<std::uint16_t>((23 << 11) | (59 << 5) | 29),
                           static_cast<std::uint16_t>((127 << 9) | (12 << 5) | 31)};
    }

    DosDateTime dos;
    dos.time = static_cast<std::uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
    dos.date = static_cast<std::uint16_t>(((year - 1980) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
    return dos;
}

std::time_t from_dos_date_time(DosDateTime dos) {
    std::tm tm{};
    tm.tm_year = ((dos.date >> 9) & 0x7F) + 80;
    tm.tm_mon = ((dos.date >> 5) & 0x0F) - 1;
    tm.tm_mday = dos.date & 0x1F;
    tm.tm_hour = (dos.time >> 11) & 0x1F;
    tm.tm_min = (dos.time >> 5) & 0x3F;
    tm.tm_sec = (dos.time & 0x1F) * 2;
    tm.tm_isdst = -1;
    return std::mktime(&tm);
}

std::string format_dos_date_time(DosDateTime dos) {
    std::tm tm{};
    if (!local_time(from_dos_date_time(dos), &tm)) {
        return "????-??-?? ??:??:??";
    }

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02d:%02d:%02d", tm.tm_year + 1900, tm.tm_mon + 1,
                  tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buffer;
}

} // namespace zipbundle::zip
