#pragma once

#include <string>
#include <chrono>
#include <ctime>
#include <cstdint>

// Format an elapsed duration as "2h15m", "5m30s" or "45s".
std::string format_elapsed(std::chrono::seconds elapsed);

// Format a wall-clock time as "2:35pm" (12-hour, no leading zero).
std::string format_clock(std::time_t t);

// Format epoch seconds as "YYYY-MM-DD HH:MM" in local time.
// Returns "-" for 0 (unknown mtime).
std::string format_epoch(int64_t epoch_secs);
