#include "errors.hpp"

namespace {

std::string render_message(ErrorKind kind,
                           const std::string& detail,
                           const std::optional<IntegrationDomain>& domain,
                           const std::string& field) {
  switch(kind) {
    case ErrorKind::Parse: return "Parse error: " + detail;
    case ErrorKind::Config: return "Configuration error: " + detail;
    case ErrorKind::Tui: return "TUI error: " + detail;
    case ErrorKind::Integration:
      if(domain) return std::string("Integration error: ") + to_string(*domain) + ": " + detail;
      return "Integration error: " + detail;
    case ErrorKind::Io: return "IO error: " + detail;
    case ErrorKind::InvalidCommand: return "Invalid command: " + detail;
    case ErrorKind::MissingArgument: return "Missing required argument: " + detail;
    case ErrorKind::InvalidArgumentValue: return "Invalid argument value for " + field + ": " + detail;
    case ErrorKind::Execution: return "Command execution failed: " + detail;
    case ErrorKind::Cancelled: return "Operation cancelled";
    case ErrorKind::Format: return "Format error: " + detail;
    case ErrorKind::Other: return detail;
  }
  return detail;
}

} // namespace

const char* to_string(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::Parse: return "Parse";
    case ErrorKind::Config: return "Config";
    case ErrorKind::Tui: return "TUI";
    case ErrorKind::Integration: return "Integration";
    case ErrorKind::Io: return "IO";
    case ErrorKind::InvalidCommand: return "InvalidCommand";
    case ErrorKind::MissingArgument: return "MissingArgument";
    case ErrorKind::InvalidArgumentValue: return "InvalidArgumentValue";
    case ErrorKind::Execution: return "Execution";
    case ErrorKind::Cancelled: return "Cancelled";
    case ErrorKind::Format: return "Format";
    case ErrorKind::Other: return "Other";
  }
  return "Other";
}

const char* to_string(IntegrationDomain domain) {
  switch(domain) {
    case IntegrationDomain::Discovery: return "Discovery";
    case IntegrationDomain::Transfer: return "Transfer";
    case IntegrationDomain::Clipboard: return "Clipboard";
    case IntegrationDomain::Streaming: return "Streaming";
    case IntegrationDomain::Security: return "Security";
    case IntegrationDomain::BatchOperation: return "Batch operation";
  }
  return "Unknown";
}

KizunaError::KizunaError(ErrorKind kind,
                         std::string message,
                         std::optional<IntegrationDomain> domain,
                         std::string field,
                         std::vector<std::string> suggestions)
  : std::runtime_error(render_message(kind, message, domain, field)),
    kind_(kind),
    domain_(domain),
    field_(std::move(field)),
    suggestions_(std::move(suggestions)),
    detail_(std::move(message)) {}

KizunaError KizunaError::parse(const std::string& message,
                               std::string token,
                               std::vector<std::string> suggestions) {
  return KizunaError(ErrorKind::Parse, message, std::nullopt, std::move(token), std::move(suggestions));
}

KizunaError KizunaError::config(const std::string& message, std::string key) {
  return KizunaError(ErrorKind::Config, message, std::nullopt, std::move(key));
}

KizunaError KizunaError::tui(const std::string& message) {
  return KizunaError(ErrorKind::Tui, message);
}

KizunaError KizunaError::integration(IntegrationDomain domain, const std::string& message) {
  return KizunaError(ErrorKind::Integration, message, domain);
}

KizunaError KizunaError::io(const std::string& message) {
  return KizunaError(ErrorKind::Io, message);
}

KizunaError KizunaError::invalid_command(const std::string& command,
                                         std::vector<std::string> suggestions) {
  return KizunaError(ErrorKind::InvalidCommand, command, std::nullopt, command, std::move(suggestions));
}

KizunaError KizunaError::missing_argument(const std::string& argument) {
  return KizunaError(ErrorKind::MissingArgument, argument, std::nullopt, argument);
}

KizunaError KizunaError::invalid_argument_value(const std::string& argument, const std::string& reason) {
  return KizunaError(ErrorKind::InvalidArgumentValue, reason, std::nullopt, argument);
}

KizunaError KizunaError::execution(const std::string& message) {
  return KizunaError(ErrorKind::Execution, message);
}

KizunaError KizunaError::cancelled() {
  return KizunaError(ErrorKind::Cancelled, "cancelled");
}

KizunaError KizunaError::format(const std::string& message) {
  return KizunaError(ErrorKind::Format, message);
}

KizunaError KizunaError::other(const std::string& message) {
  return KizunaError(ErrorKind::Other, message);
}

int KizunaError::exit_code() const {
  switch(kind_) {
    case ErrorKind::Integration: return kExitIntegration;
    case ErrorKind::Cancelled: return kExitCancelled;
    default: return kExitUsage;
  }
}

bool KizunaError::is_transient() const {
  if(kind_ != ErrorKind::Integration || !domain_) return false;
  switch(*domain_) {
    case IntegrationDomain::Discovery:
    case IntegrationDomain::Transfer:
    case IntegrationDomain::Streaming:
    case IntegrationDomain::Clipboard:
      return true;
    default:
      return false;
  }
}

bool KizunaError::is_usage_error() const {
  return kind_ == ErrorKind::Parse ||
         kind_ == ErrorKind::InvalidCommand ||
         kind_ == ErrorKind::MissingArgument ||
         kind_ == ErrorKind::InvalidArgumentValue;
}
