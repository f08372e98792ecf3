#include "command_validator.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include "collaborators.hpp"
#include "errors.hpp"
#include "types.hpp"
#include "utils.hpp"

namespace {

constexpr uint64_t kLargeFileBytes = 1024ull * 1024ull * 1024ull;
constexpr long long kLongDiscoverySeconds = 300;

bool in_list(const std::vector<std::string>& list, const std::string& value) {
  return std::find(list.begin(), list.end(), value) != list.end();
}

} // namespace

const std::vector<std::string>& CommandValidator::destructive_patterns() {
  static const std::vector<std::string> patterns{"rm -rf", "del /f", "format", "mkfs", "dd if="};
  return patterns;
}

const std::vector<std::string>& CommandValidator::known_device_types() {
  static const std::vector<std::string> types{"desktop", "laptop", "mobile", "tablet", "server"};
  return types;
}

const std::vector<std::string>& CommandValidator::video_extensions() {
  static const std::vector<std::string> extensions{".mp4", ".mkv", ".avi", ".webm", ".mov"};
  return extensions;
}

ValidatedCommand CommandValidator::validate(const ParsedCommand& command) const {
  ValidatedCommand out;
  out.command = command;
  validate_globals(command, out.warnings);

  if(command.has_flag("help")) return out;

  const auto& verb = command.verb;
  if(verb == "send") validate_send(command, out.warnings);
  else if(verb == "receive") validate_receive(command, out.warnings);
  else if(verb == "stream") validate_stream(command, out.warnings);
  else if(verb == "exec") validate_exec(command, out.warnings);
  else if(verb == "config") validate_config(command, out.warnings);
  else if(verb == "clipboard") validate_clipboard(command, out.warnings);
  else if(verb == "discover") validate_discover(command, out.warnings);
  else if(verb == "peers") validate_peers(command, out.warnings);
  return out;
}

void CommandValidator::validate_globals(const ParsedCommand& cmd, std::vector<ValidationWarning>& warnings) const {
  if(auto format = cmd.option("format")) {
    if(!output_format_from_string(*format)) {
      throw KizunaError::invalid_argument_value("--format",
        "expected one of table, json, csv, minimal; got '" + *format + "'");
    }
    if(cmd.has_flag("json") && to_lower(*format) != "json") {
      warnings.push_back({"--json", "--json overrides --format " + *format, std::nullopt});
    }
  }
  if(auto color = cmd.option("color")) {
    if(!color_mode_from_string(*color)) {
      throw KizunaError::invalid_argument_value("--color",
        "expected one of always, never, auto; got '" + *color + "'");
    }
  }
  if(cmd.has_flag("verbose") && cmd.has_flag("quiet")) {
    warnings.push_back({"--quiet", "--verbose and --quiet both given; --quiet wins", std::nullopt});
  }
}

void CommandValidator::validate_send(const ParsedCommand& cmd, std::vector<ValidationWarning>& warnings) const {
  bool from_stdin = cmd.has_flag("batch") || context_.stdin_payload ||
                    in_list(cmd.positional, "-");

  if(cmd.has_flag("batch") && !cmd.positional.empty()) {
    throw KizunaError::parse("--batch reads files from stdin and takes no file arguments",
                             cmd.positional.front());
  }
  if(!from_stdin && cmd.positional.empty()) {
    throw KizunaError::missing_argument("file (at least one file to send)");
  }

  for(const auto& file : cmd.positional) {
    if(file == "-") continue;
    std::error_code ec;
    std::filesystem::path path(file);
    if(!std::filesystem::exists(path, ec)) {
      throw KizunaError::invalid_argument_value(file, "file does not exist");
    }
    if(std::filesystem::is_directory(path, ec)) {
      throw KizunaError::invalid_argument_value(file, "is a directory, not a file");
    }
    auto size = std::filesystem::file_size(path, ec);
    if(!ec && size > kLargeFileBytes) {
      warnings.push_back({file,
                          "File is larger than 1 GB; the transfer may take a while",
                          std::string("Consider --queue to send it in the background")});
    }
  }

  if(!cmd.has_flag("batch") && !cmd.option("peer") && !context_.default_peer) {
    throw KizunaError::missing_argument("--peer");
  }
  bool files_from_stdin = cmd.has_flag("batch") ||
                          (cmd.positional.size() == 1 && cmd.positional.front() == "-");
  if(files_from_stdin && cmd.option("peer") == std::optional<std::string>("-")) {
    throw KizunaError::invalid_argument_value("--peer", "'-' cannot share standard input with the file list");
  }

  if(cmd.has_flag("no-encryption")) {
    warnings.push_back({"--no-encryption",
                        "Encryption is disabled; file contents travel in the clear",
                        std::string("Drop --no-encryption unless the network is trusted")});
  }
  if(cmd.has_flag("no-compression") && cmd.has_flag("no-encryption")) {
    warnings.push_back({"--no-compression", "Both compression and encryption are disabled", std::nullopt});
  }
  if(auto max = cmd.int_option("max-concurrent")) {
    if(*max < 0) {
      throw KizunaError::invalid_argument_value("--max-concurrent", "must not be negative");
    }
    if(!cmd.has_flag("parallel")) {
      warnings.push_back({"--max-concurrent", "--max-concurrent has no effect without --parallel", std::nullopt});
    }
  }
  if(auto priority = cmd.option("priority")) {
    static const std::vector<std::string> priorities{"low", "normal", "high", "urgent"};
    if(!in_list(priorities, to_lower(*priority))) {
      throw KizunaError::invalid_argument_value("--priority",
        "expected one of low, normal, high, urgent; got '" + *priority + "'");
    }
    if(!cmd.has_flag("queue")) {
      warnings.push_back({"--priority", "--priority only applies together with --queue", std::nullopt});
    }
  }
}

void CommandValidator::validate_receive(const ParsedCommand& cmd, std::vector<ValidationWarning>& warnings) const {
  if(auto output = cmd.option("output")) {
    std::error_code ec;
    std::filesystem::path path(*output);
    if(std::filesystem::exists(path, ec)) {
      if(!std::filesystem::is_directory(path, ec)) {
        throw KizunaError::invalid_argument_value("--output", "'" + *output + "' exists and is not a directory");
      }
    } else {
      warnings.push_back({"--output", "Directory '" + *output + "' does not exist and will be created", std::nullopt});
    }
  }
  if(cmd.has_flag("auto-accept")) {
    warnings.push_back({"--auto-accept",
                        "Transfers from trusted peers will be accepted without confirmation",
                        std::nullopt});
  }
}

void CommandValidator::validate_stream(const ParsedCommand& cmd, std::vector<ValidationWarning>& warnings) const {
  if(auto quality = cmd.option("quality")) {
    auto parsed = stream_quality_from_string(*quality);
    if(!parsed) {
      throw KizunaError::invalid_argument_value("--quality",
        "expected one of low, medium, high, ultra; got '" + *quality + "'");
    }
    if(*parsed == StreamQuality::Ultra) {
      warnings.push_back({"--quality", "Ultra quality needs a fast network and a capable camera", std::nullopt});
    }
  }

  if(cmd.has_flag("record")) {
    auto output = cmd.option("output");
    if(!output) {
      warnings.push_back({"--output", "No --output given; recording to 'recording.mp4'", std::nullopt});
      return;
    }
    std::filesystem::path path(*output);
    std::error_code ec;
    if(std::filesystem::exists(path, ec)) {
      warnings.push_back({"--output", "'" + *output + "' exists and will be overwritten", std::nullopt});
    }
    auto extension = to_lower(path.extension().string());
    if(!in_list(video_extensions(), extension)) {
      warnings.push_back({"--output",
                          "'" + *output + "' does not have a video file extension",
                          std::string("Use .mp4, .mkv, .avi or .webm")});
    }
  } else if(cmd.option("output")) {
    warnings.push_back({"--output", "--output is ignored without --record", std::nullopt});
  }
}

void CommandValidator::validate_exec(const ParsedCommand& cmd, std::vector<ValidationWarning>& warnings) const {
  if(cmd.positional.empty() && !cmd.has_flag("interactive")) {
    throw KizunaError::missing_argument("command");
  }
  if(!cmd.option("peer") && !context_.default_peer) {
    throw KizunaError::missing_argument("--peer");
  }
  if(cmd.has_flag("interactive") && cmd.option("peer") == std::optional<std::string>("-")) {
    throw KizunaError::invalid_argument_value("--peer", "'-' cannot be combined with --interactive");
  }
  if(auto timeout = cmd.int_option("timeout")) {
    if(*timeout <= 0) {
      throw KizunaError::invalid_argument_value("--timeout", "must be a positive number of seconds");
    }
  }
  auto command_line = to_lower(join(cmd.positional, " "));
  for(const auto& pattern : destructive_patterns()) {
    if(command_line.find(pattern) != std::string::npos) {
      warnings.push_back({"command",
                          "Command contains '" + pattern + "', which may be destructive",
                          std::string("Double-check the command before running it on a remote peer")});
    }
  }
}

void CommandValidator::validate_config(const ParsedCommand& cmd, std::vector<ValidationWarning>&) const {
  const auto& sub = cmd.subcommand.value_or("");
  if(sub == "set" && cmd.positional.size() != 2) {
    throw KizunaError::missing_argument("config set <key> <value>");
  }
  if(sub == "get" && cmd.positional.size() != 1) {
    throw KizunaError::missing_argument("config get <key>");
  }
  if(sub == "list" && !cmd.positional.empty()) {
    throw KizunaError::parse("config list takes no arguments", cmd.positional.front());
  }
}

void CommandValidator::validate_clipboard(const ParsedCommand& cmd, std::vector<ValidationWarning>& warnings) const {
  const auto& sub = cmd.subcommand.value_or("");
  if(sub == "share") {
    if(cmd.has_flag("enable") && cmd.has_flag("disable")) {
      throw KizunaError::invalid_argument_value("--enable", "--enable and --disable are mutually exclusive");
    }
    if(cmd.has_flag("enable")) {
      warnings.push_back({"--enable", "Clipboard contents will be shared with enabled peers", std::nullopt});
    }
  }
  if(sub == "history") {
    if(auto limit = cmd.int_option("limit")) {
      if(*limit <= 0) {
        throw KizunaError::invalid_argument_value("--limit", "must be a positive integer");
      }
    }
  }
}

void CommandValidator::validate_discover(const ParsedCommand& cmd, std::vector<ValidationWarning>& warnings) const {
  if(auto timeout = cmd.int_option("timeout")) {
    if(*timeout <= 0) {
      throw KizunaError::invalid_argument_value("--timeout", "must be a positive number of seconds");
    }
    if(*timeout > kLongDiscoverySeconds) {
      warnings.push_back({"--timeout", "Discovery timeout exceeds 300 seconds", std::nullopt});
    }
  }
  if(auto type = cmd.option("type")) {
    if(!in_list(known_device_types(), to_lower(*type))) {
      auto ranked = rank_suggestions(*type, known_device_types(), 3);
      std::optional<std::string> suggestion;
      if(!ranked.empty()) suggestion = "Did you mean '" + ranked.front() + "'?";
      warnings.push_back({"--type", "'" + *type + "' is not a standard device type", suggestion});
    }
  }
}

void CommandValidator::validate_peers(const ParsedCommand& cmd, std::vector<ValidationWarning>& warnings) const {
  if(cmd.option("verify") && !cmd.option("peer")) {
    throw KizunaError::missing_argument("--peer (peer to verify)");
  }
  if(auto mode = cmd.option("private")) {
    auto lowered = to_lower(*mode);
    if(lowered != "on" && lowered != "off") {
      throw KizunaError::invalid_argument_value("--private", "expected on or off");
    }
  }
  if(cmd.option("nickname") && !cmd.option("trust") && !cmd.option("verify")) {
    warnings.push_back({"--nickname", "--nickname only applies with --trust or --verify", std::nullopt});
  }
  int actions = 0;
  for(const char* action : {"trust", "untrust", "block", "verify", "private", "invite"}) {
    if(cmd.option(action)) ++actions;
  }
  if(cmd.has_flag("pair")) ++actions;
  if(actions > 1) {
    throw KizunaError::parse("Only one peer management action may be given at a time");
  }
}
