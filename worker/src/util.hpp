
#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
std::string get_required_env_var(const std::string& name);
int get_env_int(const std::string& name, int default_value);
bool get_env_bool(const std::string& name, bool default_value);

// String utilities
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string trim(const std::string& str);
std::string to_lower(std::string str);
std::string to_upper(std::string str);

// Time utilities
int64_t now_millis();
std::string format_iso8601(int64_t epoch_millis);
std::string current_iso8601();

// Logging
void setup_logging(const std::string& service_name, const std::string& level);

} // namespace util
