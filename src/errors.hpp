#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

enum class ErrorKind {
  Parse,
  Config,
  Tui,
  Integration,
  Io,
  InvalidCommand,
  MissingArgument,
  InvalidArgumentValue,
  Execution,
  Cancelled,
  Format,
  Other
};

enum class IntegrationDomain {
  Discovery,
  Transfer,
  Clipboard,
  Streaming,
  Security,
  BatchOperation
};

const char* to_string(ErrorKind kind);
const char* to_string(IntegrationDomain domain);

// Every user-facing failure is a KizunaError. The message is a single line;
// structured variants also carry the offending field and ranked suggestions.
class KizunaError : public std::runtime_error {
public:
  KizunaError(ErrorKind kind,
              std::string message,
              std::optional<IntegrationDomain> domain = std::nullopt,
              std::string field = {},
              std::vector<std::string> suggestions = {});

  static KizunaError parse(const std::string& message,
                           std::string token = {},
                           std::vector<std::string> suggestions = {});
  static KizunaError config(const std::string& message, std::string key = {});
  static KizunaError tui(const std::string& message);
  static KizunaError integration(IntegrationDomain domain, const std::string& message);
  static KizunaError io(const std::string& message);
  static KizunaError invalid_command(const std::string& command,
                                     std::vector<std::string> suggestions = {});
  static KizunaError missing_argument(const std::string& argument);
  static KizunaError invalid_argument_value(const std::string& argument, const std::string& reason);
  static KizunaError execution(const std::string& message);
  static KizunaError cancelled();
  static KizunaError format(const std::string& message);
  static KizunaError other(const std::string& message);

  ErrorKind kind() const { return kind_; }
  const std::optional<IntegrationDomain>& domain() const { return domain_; }
  const std::string& field() const { return field_; }
  const std::vector<std::string>& suggestions() const { return suggestions_; }
  const std::string& detail() const { return detail_; }

  int exit_code() const;
  bool is_transient() const;
  bool is_usage_error() const;

private:
  ErrorKind kind_;
  std::optional<IntegrationDomain> domain_;
  std::string field_;
  std::vector<std::string> suggestions_;
  std::string detail_;
};

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitUsage = 1;
inline constexpr int kExitIntegration = 2;
inline constexpr int kExitCancelled = 130;
