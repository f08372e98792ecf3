#include "config_manager.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

#include "collaborators.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace {

Logger* config_log() {
  static auto logger = component_logger("config");
  return logger.get();
}

const std::vector<std::string>& top_level_keys() {
  static const std::vector<std::string> keys{
    "default_peer", "output_format", "color_mode",
    "transfer_settings", "stream_settings", "network", "exec", "profiles"};
  return keys;
}

nlohmann::json node_to_json(const toml::node& node, const std::string& key) {
  if(auto v = node.as_string()) return v->get();
  if(auto v = node.as_integer()) return v->get();
  if(auto v = node.as_floating_point()) return v->get();
  if(auto v = node.as_boolean()) return v->get();
  if(auto arr = node.as_array()) {
    nlohmann::json out = nlohmann::json::array();
    for(const auto& element : *arr) out.push_back(node_to_json(element, key));
    return out;
  }
  if(auto table = node.as_table()) {
    nlohmann::json out = nlohmann::json::object();
    for(auto&& [name, child] : *table) {
      std::string child_key(name.str());
      out[child_key] = node_to_json(child, key + "." + child_key);
    }
    return out;
  }
  throw KizunaError::config("unsupported value type for '" + key + "'", key);
}

template<typename Sink>
void emit_json(const nlohmann::json& value, Sink&& sink);

toml::array json_to_array(const nlohmann::json& value) {
  toml::array arr;
  for(const auto& element : value) {
    emit_json(element, [&](auto&& node){ arr.push_back(std::forward<decltype(node)>(node)); });
  }
  return arr;
}

toml::table json_to_table(const nlohmann::json& value) {
  toml::table table;
  for(const auto& item : value.items()) {
    emit_json(item.value(), [&](auto&& node){
      table.insert_or_assign(item.key(), std::forward<decltype(node)>(node));
    });
  }
  return table;
}

// TOML has no null; null values are dropped.
template<typename Sink>
void emit_json(const nlohmann::json& value, Sink&& sink) {
  switch(value.type()) {
    case nlohmann::json::value_t::boolean: sink(value.get<bool>()); break;
    case nlohmann::json::value_t::number_integer: sink(value.get<int64_t>()); break;
    case nlohmann::json::value_t::number_unsigned: sink(static_cast<int64_t>(value.get<uint64_t>())); break;
    case nlohmann::json::value_t::number_float: sink(value.get<double>()); break;
    case nlohmann::json::value_t::string: sink(value.get<std::string>()); break;
    case nlohmann::json::value_t::array: sink(json_to_array(value)); break;
    case nlohmann::json::value_t::object: sink(json_to_table(value)); break;
    default: break;
  }
}

std::string json_to_setting_string(const nlohmann::json& value) {
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

std::string optional_string(const std::optional<std::string>& value) {
  return value.value_or("");
}

std::optional<std::string> non_empty(const std::string& value) {
  if(value.empty()) return std::nullopt;
  return value;
}

void check_directory(const std::optional<std::string>& path,
                     const std::string& key,
                     std::vector<ValidationWarning>& warnings) {
  if(!path || path->empty()) return;
  std::error_code ec;
  std::filesystem::path p(*path);
  if(std::filesystem::exists(p, ec)) {
    if(!std::filesystem::is_directory(p, ec)) {
      throw KizunaError::config("'" + *path + "' for '" + key + "' is a file, expected a directory", key);
    }
    return;
  }
  warnings.push_back({key, "Directory '" + *path + "' does not exist yet", std::nullopt});
}

} // namespace

bool parse_bool_literal(const std::string& value, bool& out) {
  auto v = to_lower(trim_copy(value));
  if(v == "true" || v == "1" || v == "on" || v == "yes") { out = true; return true; }
  if(v == "false" || v == "0" || v == "off" || v == "no") { out = false; return true; }
  return false;
}

bool TransferSettings::operator==(const TransferSettings& other) const {
  return compression == other.compression &&
         encryption == other.encryption &&
         default_download_path == other.default_download_path &&
         auto_accept_trusted == other.auto_accept_trusted &&
         require_trusted == other.require_trusted &&
         max_concurrent == other.max_concurrent;
}

bool StreamSettings::operator==(const StreamSettings& other) const {
  return default_quality == other.default_quality &&
         auto_record == other.auto_record &&
         recording_path == other.recording_path;
}

bool NetworkSettings::operator==(const NetworkSettings& other) const {
  return listen_port == other.listen_port &&
         discovery_port == other.discovery_port &&
         device_name == other.device_name &&
         device_type == other.device_type;
}

bool Profile::operator==(const Profile& other) const {
  return description == other.description &&
         parent == other.parent &&
         settings == other.settings;
}

bool CLIConfig::operator==(const CLIConfig& other) const {
  return default_peer == other.default_peer &&
         output_format == other.output_format &&
         color_mode == other.color_mode &&
         transfer == other.transfer &&
         stream == other.stream &&
         network == other.network &&
         exec == other.exec &&
         profiles == other.profiles;
}

ConfigManager::ConfigManager()
  : ConfigManager(default_path()) {}

ConfigManager::ConfigManager(std::filesystem::path path, const nlohmann::json& specification)
  : path_(std::move(path)),
    specs_(build_key_specs(specification)) {}

std::filesystem::path ConfigManager::default_path() {
  return user_config_dir() / "config.toml";
}

bool ConfigManager::exists() const {
  std::error_code ec;
  return std::filesystem::is_regular_file(path_, ec);
}

std::vector<ConfigManager::KeySpec> ConfigManager::build_key_specs(const nlohmann::json& specification) {
  std::vector<KeySpec> result;
  for(const auto& entry : specification) {
    KeySpec spec;
    spec.key = entry.at("key").get<std::string>();
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) alias = to_lower(alias);
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    result.push_back(std::move(spec));
  }
  return result;
}

const ConfigManager::KeySpec* ConfigManager::find_spec(const std::string& token) const {
  auto lowered = to_lower(trim_copy(token));
  for(const auto& spec : specs_) {
    if(lowered == spec.key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) return &spec;
  }
  return nullptr;
}

const ConfigManager::KeySpec& ConfigManager::require_spec(const std::string& token) const {
  if(const auto* spec = find_spec(token)) return *spec;
  std::vector<std::string> candidates = keys();
  for(const auto& spec : specs_) {
    candidates.insert(candidates.end(), spec.aliases.begin(), spec.aliases.end());
  }
  throw KizunaError(ErrorKind::Config,
                    "unknown configuration key '" + token + "'",
                    std::nullopt,
                    token,
                    rank_suggestions(token, candidates, 3));
}

std::vector<std::string> ConfigManager::keys() const {
  std::vector<std::string> out;
  out.reserve(specs_.size());
  for(const auto& spec : specs_) out.push_back(spec.key);
  return out;
}

std::optional<std::string> ConfigManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) return spec->key;
  return std::nullopt;
}

std::string ConfigManager::description(const std::string& key) const {
  if(const auto* spec = find_spec(key)) return spec->description;
  return {};
}

std::string ConfigManager::get_value(const CLIConfig& config, const std::string& token) const {
  const auto& key = require_spec(token).key;
  auto b = [](bool v){ return std::string(v ? "true" : "false"); };

  if(key == "default_peer") return optional_string(config.default_peer);
  if(key == "output_format") return to_string(config.output_format);
  if(key == "color_mode") return to_string(config.color_mode);
  if(key == "transfer_settings.compression") return b(config.transfer.compression);
  if(key == "transfer_settings.encryption") return b(config.transfer.encryption);
  if(key == "transfer_settings.default_download_path") return optional_string(config.transfer.default_download_path);
  if(key == "transfer_settings.auto_accept_trusted") return b(config.transfer.auto_accept_trusted);
  if(key == "transfer_settings.require_trusted") return b(config.transfer.require_trusted);
  if(key == "transfer_settings.max_concurrent") return std::to_string(config.transfer.max_concurrent);
  if(key == "stream_settings.default_quality") return config.stream.default_quality;
  if(key == "stream_settings.auto_record") return b(config.stream.auto_record);
  if(key == "stream_settings.recording_path") return optional_string(config.stream.recording_path);
  if(key == "network.listen_port") return std::to_string(config.network.listen_port);
  if(key == "network.discovery_port") return std::to_string(config.network.discovery_port);
  if(key == "network.device_name") return config.network.device_name;
  if(key == "network.device_type") return config.network.device_type;
  if(key == "exec.allow_remote") return b(config.exec.allow_remote);
  throw KizunaError::config("configuration key '" + key + "' has no storage", key);
}

void ConfigManager::set_value(CLIConfig& config, const std::string& token, const std::string& raw) const {
  const auto& spec = require_spec(token);
  const auto& key = spec.key;
  auto value = trim_copy(raw);

  bool bool_value = false;
  long long int_value = 0;
  if(spec.type == "bool" && !parse_bool_literal(value, bool_value)) {
    throw KizunaError::config("expected true or false for '" + key + "', got '" + value + "'", key);
  }
  if(spec.type == "int") {
    try {
      std::size_t consumed = 0;
      int_value = std::stoll(value, &consumed);
      if(consumed != value.size()) throw std::invalid_argument(value);
    } catch(const std::exception&) {
      throw KizunaError::config("expected an integer for '" + key + "', got '" + value + "'", key);
    }
  }

  if(key == "default_peer") config.default_peer = non_empty(value);
  else if(key == "output_format") {
    auto format = output_format_from_string(value);
    if(!format) throw KizunaError::config("invalid output format '" + value + "'", key);
    config.output_format = *format;
  } else if(key == "color_mode") {
    auto mode = color_mode_from_string(value);
    if(!mode) throw KizunaError::config("invalid colour mode '" + value + "'", key);
    config.color_mode = *mode;
  }
  else if(key == "transfer_settings.compression") config.transfer.compression = bool_value;
  else if(key == "transfer_settings.encryption") config.transfer.encryption = bool_value;
  else if(key == "transfer_settings.default_download_path") config.transfer.default_download_path = non_empty(value);
  else if(key == "transfer_settings.auto_accept_trusted") config.transfer.auto_accept_trusted = bool_value;
  else if(key == "transfer_settings.require_trusted") config.transfer.require_trusted = bool_value;
  else if(key == "transfer_settings.max_concurrent") config.transfer.max_concurrent = static_cast<int>(int_value);
  else if(key == "stream_settings.default_quality") {
    if(!stream_quality_from_string(value)) {
      throw KizunaError::config("invalid stream quality '" + value + "' (expected low, medium, high or ultra)", key);
    }
    config.stream.default_quality = to_lower(value);
  }
  else if(key == "stream_settings.auto_record") config.stream.auto_record = bool_value;
  else if(key == "stream_settings.recording_path") config.stream.recording_path = non_empty(value);
  else if(key == "network.listen_port") config.network.listen_port = static_cast<int>(int_value);
  else if(key == "network.discovery_port") config.network.discovery_port = static_cast<int>(int_value);
  else if(key == "network.device_name") config.network.device_name = value;
  else if(key == "network.device_type") config.network.device_type = value;
  else if(key == "exec.allow_remote") config.exec.allow_remote = bool_value;
  else throw KizunaError::config("configuration key '" + key + "' has no storage", key);
}

std::vector<std::pair<std::string, std::string>> ConfigManager::list(const CLIConfig& config) const {
  std::vector<std::pair<std::string, std::string>> out;
  for(const auto& spec : specs_) {
    out.emplace_back(spec.key, get_value(config, spec.key));
  }
  return out;
}

std::vector<ValidationWarning> ConfigManager::validate(const CLIConfig& config) const {
  std::vector<ValidationWarning> warnings;

  if(!stream_quality_from_string(config.stream.default_quality)) {
    throw KizunaError::config("invalid stream quality '" + config.stream.default_quality +
                              "' (expected low, medium, high or ultra)",
                              "stream_settings.default_quality");
  }
  auto check_port = [](int port, const std::string& key){
    if(port < 1 || port > 65535) {
      throw KizunaError::config("port " + std::to_string(port) + " is out of range 1-65535", key);
    }
  };
  check_port(config.network.listen_port, "network.listen_port");
  check_port(config.network.discovery_port, "network.discovery_port");
  if(config.network.listen_port == config.network.discovery_port) {
    warnings.push_back({"network.discovery_port", "listen and discovery ports are equal", std::nullopt});
  }
  if(config.transfer.max_concurrent < 1) {
    throw KizunaError::config("max_concurrent must be at least 1", "transfer_settings.max_concurrent");
  }

  check_directory(config.transfer.default_download_path, "transfer_settings.default_download_path", warnings);
  check_directory(config.stream.recording_path, "stream_settings.recording_path", warnings);

  for(const auto& [name, profile] : config.profiles) {
    if(profile.parent) {
      if(*profile.parent == name) {
        throw KizunaError::config("profile '" + name + "' names itself as parent", "profiles." + name + ".parent");
      }
      auto parent = config.profiles.find(*profile.parent);
      if(parent == config.profiles.end()) {
        throw KizunaError::config("profile '" + name + "' has unknown parent '" + *profile.parent + "'",
                                  "profiles." + name + ".parent");
      }
      if(parent->second.parent) {
        throw KizunaError::config("profile '" + name + "' inherits from '" + *profile.parent +
                                  "', which has a parent of its own; only one level is supported",
                                  "profiles." + name + ".parent");
      }
    }
    if(!profile.settings.is_object()) {
      throw KizunaError::config("settings of profile '" + name + "' must be a table", "profiles." + name + ".settings");
    }
    for(const auto& item : profile.settings.items()) {
      require_spec(item.key());
    }
  }
  return warnings;
}

CLIConfig ConfigManager::parse(const std::string& toml_text, const std::string& source) const {
  toml::table root;
  try {
    root = toml::parse(toml_text, source);
  } catch(const toml::parse_error& e) {
    std::ostringstream message;
    message << "failed to parse " << source << " at line " << e.source().begin.line
            << ": " << e.description();
    throw KizunaError::config(message.str());
  }

  for(auto&& [name, node] : root) {
    std::string key(name.str());
    if(std::find(top_level_keys().begin(), top_level_keys().end(), key) == top_level_keys().end()) {
      log_warn(config_log(), "Ignoring unknown configuration key '{}' in {}", key, source);
    }
  }

  CLIConfig config;
  for(const auto& spec : specs_) {
    auto node = root.at_path(spec.key);
    if(!node) continue;
    std::string value;
    if(spec.type == "bool") {
      auto b = node.as_boolean();
      if(!b) throw KizunaError::config("expected a boolean for '" + spec.key + "'", spec.key);
      value = b->get() ? "true" : "false";
    } else if(spec.type == "int") {
      auto i = node.as_integer();
      if(!i) throw KizunaError::config("expected an integer for '" + spec.key + "'", spec.key);
      value = std::to_string(i->get());
    } else {
      auto s = node.as_string();
      if(!s) throw KizunaError::config("expected a string for '" + spec.key + "'", spec.key);
      value = s->get();
    }
    set_value(config, spec.key, value);
  }

  if(auto profiles = root["profiles"].as_table()) {
    for(auto&& [name, node] : *profiles) {
      std::string profile_name(name.str());
      auto table = node.as_table();
      if(!table) {
        throw KizunaError::config("profile '" + profile_name + "' must be a table", "profiles." + profile_name);
      }
      Profile profile;
      profile.description = (*table)["description"].value_or(std::string{});
      if(auto parent = (*table)["parent"].value<std::string>()) profile.parent = *parent;
      if(auto settings = (*table)["settings"].as_table()) {
        profile.settings = node_to_json(*settings, "profiles." + profile_name + ".settings");
      }
      config.profiles.emplace(profile_name, std::move(profile));
    }
  }

  for(const auto& warning : validate(config)) {
    log_warn(config_log(), "{}: {}", warning.field, warning.message);
  }
  return config;
}

CLIConfig ConfigManager::load() const {
  if(!exists()) {
    log_debug(config_log(), "No configuration at {}, using defaults", path_.string());
    return CLIConfig{};
  }
  std::ifstream in(path_, std::ios::binary);
  if(!in) {
    throw KizunaError::io("unable to read " + path_.string());
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  return parse(contents.str(), path_.string());
}

std::string ConfigManager::to_toml(const CLIConfig& config) const {
  toml::table root;
  if(config.default_peer) root.insert_or_assign("default_peer", *config.default_peer);
  root.insert_or_assign("output_format", std::string(to_string(config.output_format)));
  root.insert_or_assign("color_mode", std::string(to_string(config.color_mode)));

  toml::table transfer;
  transfer.insert_or_assign("compression", config.transfer.compression);
  transfer.insert_or_assign("encryption", config.transfer.encryption);
  if(config.transfer.default_download_path) {
    transfer.insert_or_assign("default_download_path", *config.transfer.default_download_path);
  }
  transfer.insert_or_assign("auto_accept_trusted", config.transfer.auto_accept_trusted);
  transfer.insert_or_assign("require_trusted", config.transfer.require_trusted);
  transfer.insert_or_assign("max_concurrent", static_cast<int64_t>(config.transfer.max_concurrent));
  root.insert_or_assign("transfer_settings", std::move(transfer));

  toml::table stream;
  stream.insert_or_assign("default_quality", config.stream.default_quality);
  stream.insert_or_assign("auto_record", config.stream.auto_record);
  if(config.stream.recording_path) stream.insert_or_assign("recording_path", *config.stream.recording_path);
  root.insert_or_assign("stream_settings", std::move(stream));

  toml::table network;
  network.insert_or_assign("listen_port", static_cast<int64_t>(config.network.listen_port));
  network.insert_or_assign("discovery_port", static_cast<int64_t>(config.network.discovery_port));
  network.insert_or_assign("device_name", config.network.device_name);
  network.insert_or_assign("device_type", config.network.device_type);
  root.insert_or_assign("network", std::move(network));

  toml::table exec;
  exec.insert_or_assign("allow_remote", config.exec.allow_remote);
  root.insert_or_assign("exec", std::move(exec));

  if(!config.profiles.empty()) {
    toml::table profiles;
    for(const auto& [name, profile] : config.profiles) {
      toml::table entry;
      entry.insert_or_assign("description", profile.description);
      if(profile.parent) entry.insert_or_assign("parent", *profile.parent);
      entry.insert_or_assign("settings", json_to_table(profile.settings));
      profiles.insert_or_assign(name, std::move(entry));
    }
    root.insert_or_assign("profiles", std::move(profiles));
  }

  std::ostringstream out;
  out << root << "\n";
  return out.str();
}

void ConfigManager::save(const CLIConfig& config) const {
  for(const auto& warning : validate(config)) {
    log_warn(config_log(), "{}: {}", warning.field, warning.message);
  }
  std::error_code ec;
  if(path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if(ec) throw KizunaError::io("unable to create " + path_.parent_path().string() + ": " + ec.message());
  }
  std::ofstream out(path_, std::ios::binary | std::ios::trunc);
  if(!out) {
    throw KizunaError::io("unable to write " + path_.string());
  }
  out << "# Kizuna configuration\n\n" << to_toml(config);
  if(!out) {
    throw KizunaError::io("failed while writing " + path_.string());
  }
  log_debug(config_log(), "Saved configuration to {}", path_.string());
}

std::string ConfigManager::default_file_contents() const {
  std::ostringstream out;
  out << "# Kizuna configuration\n"
      << "# Uncomment a line to override its default. Command-line options\n"
      << "# win over profiles, profiles win over this file.\n\n";

  std::string current_section;
  for(const auto& spec : specs_) {
    auto dot = spec.key.find('.');
    std::string section = dot == std::string::npos ? std::string() : spec.key.substr(0, dot);
    std::string name = dot == std::string::npos ? spec.key : spec.key.substr(dot + 1);
    if(section != current_section) {
      out << "\n[" << section << "]\n";
      current_section = section;
    }
    out << "# " << spec.description << "\n";
    out << "# " << name << " = " << spec.default_value.dump() << "\n";
  }

  out << "\n# Profiles bundle overrides; apply one with --profile NAME.\n"
      << "# [profiles.office]\n"
      << "# description = \"Office network\"\n"
      << "# parent = \"base\"\n"
      << "# [profiles.office.settings]\n"
      << "# output_format = \"json\"\n"
      << "# compression = false\n";
  return out.str();
}

bool ConfigManager::write_default_file() const {
  if(exists()) return false;
  std::error_code ec;
  if(path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if(ec) throw KizunaError::io("unable to create " + path_.parent_path().string() + ": " + ec.message());
  }
  std::ofstream out(path_, std::ios::binary | std::ios::trunc);
  if(!out) {
    throw KizunaError::io("unable to write " + path_.string());
  }
  out << default_file_contents();
  log_info(config_log(), "Wrote default configuration to {}", path_.string());
  return true;
}

CLIConfig ConfigManager::apply_profile(const CLIConfig& base, const std::string& name) const {
  auto it = base.profiles.find(name);
  if(it == base.profiles.end()) {
    std::vector<std::string> names;
    for(const auto& entry : base.profiles) names.push_back(entry.first);
    throw KizunaError(ErrorKind::Config,
                      "unknown profile '" + name + "'",
                      std::nullopt,
                      "profiles." + name,
                      rank_suggestions(name, names, 3));
  }

  std::vector<const Profile*> chain;
  if(it->second.parent) {
    const auto& parent_name = *it->second.parent;
    auto parent = base.profiles.find(parent_name);
    if(parent_name == name || parent == base.profiles.end()) {
      throw KizunaError::config("profile '" + name + "' has invalid parent '" + parent_name + "'",
                                "profiles." + name + ".parent");
    }
    if(parent->second.parent) {
      throw KizunaError::config("profile '" + name + "' inherits from '" + parent_name +
                                "', which has a parent of its own; only one level is supported",
                                "profiles." + name + ".parent");
    }
    chain.push_back(&parent->second);
  }
  chain.push_back(&it->second);

  CLIConfig result = base;
  for(const auto* profile : chain) {
    for(const auto& item : profile->settings.items()) {
      set_value(result, item.key(), json_to_setting_string(item.value()));
    }
  }
  log_debug(config_log(), "Applied profile '{}'", name);
  return result;
}

CLIConfig ConfigManager::apply_command_line(const CLIConfig& base, const ParsedCommand& command) const {
  CLIConfig result = base;
  if(auto format = command.option("format")) {
    auto parsed = output_format_from_string(*format);
    if(!parsed) {
      throw KizunaError::invalid_argument_value("--format", "expected one of table, json, csv, minimal");
    }
    result.output_format = *parsed;
  }
  if(command.has_flag("json")) result.output_format = OutputFormat::Json;
  if(auto color = command.option("color")) {
    auto parsed = color_mode_from_string(*color);
    if(!parsed) {
      throw KizunaError::invalid_argument_value("--color", "expected one of always, never, auto");
    }
    result.color_mode = *parsed;
  }
  if(command.has_flag("no-color") || command.has_flag("pipeline")) result.color_mode = ColorMode::Never;

  if(command.verb == "send") {
    if(command.has_flag("no-compression")) result.transfer.compression = false;
    if(command.has_flag("no-encryption")) result.transfer.encryption = false;
  }
  if(command.verb == "stream") {
    if(auto quality = command.option("quality")) {
      if(stream_quality_from_string(*quality)) result.stream.default_quality = to_lower(*quality);
    }
  }
  return result;
}

CLIConfig ConfigManager::resolve(const ParsedCommand& command) const {
  CLIConfig config = load();
  if(auto profile = command.option("profile")) {
    config = apply_profile(config, *profile);
  }
  return apply_command_line(config, command);
}
