#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace caproute {

std::string trim_ws(std::string s);
std::string lower_ascii(std::string s);
std::vector<std::string> split_csv(const std::string& s);

int getenv_int(const char* name, int defv);
int64_t getenv_i64(const char* name, int64_t defv);
bool getenv_bool(const char* name, bool defv);
std::string getenv_str(const char* name, const std::string& defv);

// Monotonic clock (durations, deadlines).
int64_t now_ms();
// Wall clock (timestamps written to logs and telemetry).
int64_t now_ms_wall();
// UTC ISO-8601 with milliseconds, e.g. 2024-05-01T12:00:00.123Z
std::string iso_from_ms(int64_t epoch_ms);

} // namespace caproute
