#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "command_parser.hpp"
#include "command_validator.hpp"
#include "types.hpp"

// Keys are dotted TOML paths. type is one of string, bool, int, path,
// format, color or quality.
inline const nlohmann::json CONFIG_SPECIFICATION = nlohmann::json::array({
  {{"key","default_peer"},                          {"aliases", {"peer"}},                          {"type","string"},  {"default",""},        {"description","Peer used when --peer is omitted"}},
  {{"key","output_format"},                         {"aliases", {"format"}},                        {"type","format"},  {"default","table"},   {"description","Output format: table, json, csv or minimal"}},
  {{"key","color_mode"},                            {"aliases", {"color","colour"}},                {"type","color"},   {"default","auto"},    {"description","Colour mode: always, never or auto"}},
  {{"key","transfer_settings.compression"},         {"aliases", {"compression"}},                   {"type","bool"},    {"default",true},      {"description","Compress file transfers"}},
  {{"key","transfer_settings.encryption"},          {"aliases", {"encryption"}},                    {"type","bool"},    {"default",true},      {"description","Encrypt file transfers"}},
  {{"key","transfer_settings.default_download_path"},{"aliases", {"download_path","download_dir"}}, {"type","path"},    {"default",""},        {"description","Directory for received files"}},
  {{"key","transfer_settings.auto_accept_trusted"}, {"aliases", {"auto_accept"}},                   {"type","bool"},    {"default",false},     {"description","Accept transfers from trusted peers without asking"}},
  {{"key","transfer_settings.require_trusted"},     {"aliases", {"require_trusted"}},               {"type","bool"},    {"default",true},      {"description","Only send to trusted peers"}},
  {{"key","transfer_settings.max_concurrent"},      {"aliases", {"max_concurrent","concurrency"}},  {"type","int"},     {"default",4},         {"description","Concurrent batch and queue transfers"}},
  {{"key","stream_settings.default_quality"},       {"aliases", {"quality"}},                       {"type","quality"}, {"default","medium"},  {"description","Stream quality: low, medium, high or ultra"}},
  {{"key","stream_settings.auto_record"},           {"aliases", {"auto_record"}},                   {"type","bool"},    {"default",false},     {"description","Record every stream"}},
  {{"key","stream_settings.recording_path"},        {"aliases", {"recording_path"}},                {"type","path"},    {"default",""},        {"description","Directory for stream recordings"}},
  {{"key","network.listen_port"},                   {"aliases", {"listen_port","port"}},            {"type","int"},     {"default",47801},     {"description","TCP port for the peer service"}},
  {{"key","network.discovery_port"},                {"aliases", {"discovery_port"}},                {"type","int"},     {"default",47800},     {"description","UDP port for LAN discovery"}},
  {{"key","network.device_name"},                   {"aliases", {"device_name","name"}},            {"type","string"},  {"default",""},        {"description","Name announced to peers (host name when empty)"}},
  {{"key","network.device_type"},                   {"aliases", {"device_type"}},                   {"type","string"},  {"default","desktop"}, {"description","Device type announced to peers"}},
  {{"key","exec.allow_remote"},                     {"aliases", {"allow_remote"}},                  {"type","bool"},    {"default",false},     {"description","Run commands requested by trusted peers"}}
});

struct TransferSettings {
  bool compression = true;
  bool encryption = true;
  std::optional<std::string> default_download_path;
  bool auto_accept_trusted = false;
  bool require_trusted = true;
  int max_concurrent = 4;

  bool operator==(const TransferSettings& other) const;
};

struct StreamSettings {
  std::string default_quality = "medium";
  bool auto_record = false;
  std::optional<std::string> recording_path;

  bool operator==(const StreamSettings& other) const;
};

struct NetworkSettings {
  int listen_port = 47801;
  int discovery_port = 47800;
  std::string device_name;
  std::string device_type = "desktop";

  bool operator==(const NetworkSettings& other) const;
};

struct ExecSettings {
  bool allow_remote = false;

  bool operator==(const ExecSettings& other) const { return allow_remote == other.allow_remote; }
};

struct Profile {
  std::string description;
  std::optional<std::string> parent;
  nlohmann::json settings = nlohmann::json::object();

  bool operator==(const Profile& other) const;
};

struct CLIConfig {
  std::optional<std::string> default_peer;
  OutputFormat output_format = OutputFormat::Table;
  ColorMode color_mode = ColorMode::Auto;
  TransferSettings transfer;
  StreamSettings stream;
  NetworkSettings network;
  ExecSettings exec;
  std::map<std::string, Profile> profiles;

  bool operator==(const CLIConfig& other) const;
  bool operator!=(const CLIConfig& other) const { return !(*this == other); }
};

class ConfigManager {
public:
  ConfigManager();
  explicit ConfigManager(std::filesystem::path path,
                         const nlohmann::json& specification = CONFIG_SPECIFICATION);

  static std::filesystem::path default_path();
  const std::filesystem::path& path() const { return path_; }
  bool exists() const;

  // Missing file yields defaults. Malformed TOML or invalid values throw
  // KizunaError(Config).
  CLIConfig load() const;
  CLIConfig parse(const std::string& toml_text, const std::string& source = "<string>") const;
  void save(const CLIConfig& config) const;
  std::string to_toml(const CLIConfig& config) const;
  // Writes the commented template when no file exists yet.
  bool write_default_file() const;
  std::string default_file_contents() const;

  // Throws on errors, returns advisory warnings.
  std::vector<ValidationWarning> validate(const CLIConfig& config) const;

  std::vector<std::string> keys() const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  std::string description(const std::string& key) const;
  std::string get_value(const CLIConfig& config, const std::string& key) const;
  void set_value(CLIConfig& config, const std::string& key, const std::string& value) const;
  std::vector<std::pair<std::string, std::string>> list(const CLIConfig& config) const;

  // Parent settings first, then the profile's own; one level of inheritance.
  CLIConfig apply_profile(const CLIConfig& base, const std::string& name) const;
  // Highest precedence layer: options given on the command line.
  CLIConfig apply_command_line(const CLIConfig& base, const ParsedCommand& command) const;
  // defaults < file < profile < command line
  CLIConfig resolve(const ParsedCommand& command) const;

private:
  struct KeySpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    std::string description;
  };

  static std::vector<KeySpec> build_key_specs(const nlohmann::json& specification);
  const KeySpec* find_spec(const std::string& token) const;
  const KeySpec& require_spec(const std::string& token) const;

  std::filesystem::path path_;
  std::vector<KeySpec> specs_;
};

bool parse_bool_literal(const std::string& value, bool& out);
