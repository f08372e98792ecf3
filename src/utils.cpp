#include "utils.hpp"
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::optional<std::vector<unsigned char>> bytes_from_hex(const std::string& hex){
    if(hex.size() % 2 != 0) return std::nullopt;
    auto nibble = [](char c) -> int {
        if(c >= '0' && c <= '9') return c - '0';
        if(c >= 'a' && c <= 'f') return c - 'a' + 10;
        if(c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::vector<unsigned char> out;
    out.reserve(hex.size() / 2);
    for(std::size_t i = 0; i < hex.size(); i += 2){
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if(hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return out;
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::vector<unsigned char> random_bytes(std::size_t count) {
  std::vector<unsigned char> out(count);
  if(count == 0) return out;
  if(RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return out;
}

std::string random_hex(std::size_t byte_count) {
  return hex_from_bytes(random_bytes(byte_count));
}

std::string new_uuid() {
  auto bytes = random_bytes(16);
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);
  auto hex = hex_from_bytes(bytes);
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
         hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

bool contains_icase(const std::string& haystack, const std::string& needle) {
  return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::vector<std::string> split(const std::string& value, char delimiter) {
  std::vector<std::string> out;
  std::string current;
  std::istringstream in(value);
  while(std::getline(in, current, delimiter)) {
    out.push_back(current);
  }
  return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
  std::string out;
  for(std::size_t i = 0; i < parts.size(); ++i) {
    if(i > 0) out += separator;
    out += parts[i];
  }
  return out;
}

std::size_t levenshtein_distance(const std::string& a, const std::string& b) {
  std::vector<std::size_t> prev(b.size() + 1);
  std::vector<std::size_t> cur(b.size() + 1);
  for(std::size_t j = 0; j <= b.size(); ++j) prev[j] = j;
  for(std::size_t i = 1; i <= a.size(); ++i) {
    cur[0] = i;
    for(std::size_t j = 1; j <= b.size(); ++j) {
      std::size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
      cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
    }
    std::swap(prev, cur);
  }
  return prev[b.size()];
}

std::vector<std::string> rank_suggestions(const std::string& token,
                                          const std::vector<std::string>& candidates,
                                          std::size_t max_distance) {
  std::vector<std::pair<std::size_t, std::string>> scored;
  for(const auto& candidate : candidates) {
    auto d = levenshtein_distance(to_lower(token), to_lower(candidate));
    if(d <= max_distance) scored.emplace_back(d, candidate);
  }
  std::stable_sort(scored.begin(), scored.end(),
                   [](const auto& a, const auto& b){ return a.first < b.first; });
  std::vector<std::string> out;
  out.reserve(scored.size());
  for(auto& entry : scored) out.push_back(std::move(entry.second));
  return out;
}

std::string format_rfc3339(std::chrono::system_clock::time_point tp) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  std::time_t secs = static_cast<std::time_t>(ms / 1000);
  if(ms < 0 && ms % 1000 != 0) secs -= 1;
  int millis = static_cast<int>(((ms % 1000) + 1000) % 1000);
  std::tm tm{};
  gmtime_r(&secs, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
      << "." << std::setw(3) << std::setfill('0') << millis << "Z";
  return oss.str();
}

std::optional<std::chrono::system_clock::time_point> parse_rfc3339(const std::string& text) {
  std::tm tm{};
  std::istringstream in(text);
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if(in.fail()) return std::nullopt;
  int millis = 0;
  if(in.peek() == '.') {
    in.get();
    std::string digits;
    while(std::isdigit(in.peek())) digits.push_back(static_cast<char>(in.get()));
    digits = (digits + "000").substr(0, 3);
    millis = std::stoi(digits);
  }
  long offset_seconds = 0;
  int next = in.peek();
  if(next == '+' || next == '-') {
    char sign = static_cast<char>(in.get());
    int hh = 0, mm = 0;
    char colon = 0;
    in >> hh >> colon >> mm;
    if(in.fail()) return std::nullopt;
    offset_seconds = (hh * 3600L + mm * 60L) * (sign == '-' ? -1 : 1);
  }
  std::time_t secs = timegm(&tm);
  if(secs == static_cast<std::time_t>(-1)) return std::nullopt;
  auto tp = std::chrono::system_clock::from_time_t(secs - offset_seconds);
  return tp + std::chrono::milliseconds(millis);
}

std::string format_local_time(std::chrono::system_clock::time_point tp) {
  std::time_t secs = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&secs, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

int64_t to_unix_millis(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_unix_millis(int64_t ms) {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

namespace {

std::filesystem::path home_dir() {
  if(const char* home = std::getenv("HOME"); home && *home) {
    return home;
  }
  return std::filesystem::current_path();
}

} // namespace

std::filesystem::path user_config_dir() {
  if(const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return std::filesystem::path(xdg) / "kizuna";
  }
  return home_dir() / ".config" / "kizuna";
}

std::filesystem::path user_data_dir() {
  if(const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
    return std::filesystem::path(xdg) / "kizuna";
  }
  return home_dir() / ".local" / "share" / "kizuna";
}

std::string local_host_name() {
  char hostname[256];
  if(gethostname(hostname, sizeof(hostname)) != 0) {
    return "kizuna-device";
  }
  hostname[sizeof(hostname) - 1] = '\0';
  return hostname;
}
