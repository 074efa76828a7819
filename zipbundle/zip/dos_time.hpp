#pragma once

#include "zip_format.hpp"

#include <ctime>
#include <string>

namespace zipbundle::zip {

// 1980-01-01 00:00:00, the earliest representable DOS timestamp.
constexpr DosDateTime DOS_EPOCH{0x0000, 0x0021};

// Converts a calendar time (interpreted in local time, as archivers do).
// Years outside 1980..2107 are clamped to the representable range.
DosDateTime to_dos_date_time(std::time_t t);

// Inverse of to_dos_date_time(), local time. Seconds have 2s resolution.
std::time_t from_dos_date_time(DosDateTime dos);

// "YYYY-MM-DD HH:MM:SS" in local time, as shown by archive listings.
std::string format_dos_date_time(DosDateTime dos);

} // namespace zipbundle::zip
