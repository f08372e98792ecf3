#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
// nullopt on odd length or a non-hex digit.
std::optional<std::vector<unsigned char>> bytes_from_hex(const std::string& hex);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);

// OpenSSL RAND_bytes; throws on entropy failure.
std::vector<unsigned char> random_bytes(std::size_t count);
std::string random_hex(std::size_t byte_count);
// 128-bit random identifier, rendered as a canonical v4 UUID.
std::string new_uuid();

std::string to_lower(std::string value);
std::string trim_copy(std::string value);
bool contains_icase(const std::string& haystack, const std::string& needle);
std::vector<std::string> split(const std::string& value, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& separator);

std::size_t levenshtein_distance(const std::string& a, const std::string& b);
// Candidates within max_distance of token, nearest first (ties keep input order).
std::vector<std::string> rank_suggestions(const std::string& token,
                                          const std::vector<std::string>& candidates,
                                          std::size_t max_distance);

std::string format_rfc3339(std::chrono::system_clock::time_point tp);
std::optional<std::chrono::system_clock::time_point> parse_rfc3339(const std::string& text);
std::string format_local_time(std::chrono::system_clock::time_point tp);
int64_t to_unix_millis(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point from_unix_millis(int64_t ms);

std::filesystem::path user_config_dir();
std::filesystem::path user_data_dir();
std::string local_host_name();
