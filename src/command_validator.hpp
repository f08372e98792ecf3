#pragma once

#include <optional>
#include <string>
#include <vector>

#include "command_parser.hpp"

struct ValidationWarning {
  std::string field;
  std::string message;
  std::optional<std::string> suggestion;
};

struct ValidatedCommand {
  ParsedCommand command;
  std::vector<ValidationWarning> warnings;
};

// Semantic pass run after parsing. Fatal problems throw KizunaError; advisory
// findings come back as warnings.
class CommandValidator {
public:
  struct Context {
    // Used when send/exec carry no --peer of their own.
    std::optional<std::string> default_peer;
    // Set when stdin carries the payload ("-" or --batch).
    bool stdin_payload = false;
  };

  CommandValidator() = default;
  explicit CommandValidator(Context context) : context_(std::move(context)) {}

  ValidatedCommand validate(const ParsedCommand& command) const;

  static const std::vector<std::string>& destructive_patterns();
  static const std::vector<std::string>& known_device_types();
  static const std::vector<std::string>& video_extensions();

private:
  void validate_globals(const ParsedCommand& cmd, std::vector<ValidationWarning>& warnings) const;
  void validate_send(const ParsedCommand& cmd, std::vector<ValidationWarning>& warnings) const;
  void validate_receive(const ParsedCommand& cmd, std::vector<ValidationWarning>& warnings) const;
  void validate_stream(const ParsedCommand& cmd, std::vector<ValidationWarning>& warnings) const;
  void validate_exec(const ParsedCommand& cmd, std::vector<ValidationWarning>& warnings) const;
  void validate_config(const ParsedCommand& cmd, std::vector<ValidationWarning>& warnings) const;
  void validate_clipboard(const ParsedCommand& cmd, std::vector<ValidationWarning>& warnings) const;
  void validate_discover(const ParsedCommand& cmd, std::vector<ValidationWarning>& warnings) const;
  void validate_peers(const ParsedCommand& cmd, std::vector<ValidationWarning>& warnings) const;

  Context context_;
};
