#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "collaborators.hpp"
#include "log.hpp"
#include "operation_tracker.hpp"
#include "types.hpp"

class SecurityGate;

struct ExecCommandRequest {
  std::string command;
  std::string peer; // name or id
  std::optional<std::chrono::seconds> timeout;
};

struct ExecResult {
  std::string operation_id;
  std::string output;
  int exit_code = 0;
  std::chrono::milliseconds execution_time{0};
};

// Runs one command on a trusted peer and blocks until it finishes.
class ExecHandler {
public:
  using PeerResolver = std::function<std::optional<PeerInfo>(const std::string& name_or_id)>;

  ExecHandler(std::shared_ptr<ExecService> service, SecurityGate& gate, PeerResolver resolver);

  ExecResult handle_exec(const ExecCommandRequest& request);

  std::vector<OperationStatus> get_all_operations() const { return tracker_.snapshot(); }
  std::shared_ptr<Channel<OperationStatus>> subscribe(std::size_t capacity = 0) {
    return tracker_.subscribe(capacity);
  }

private:
  std::shared_ptr<ExecService> service_;
  SecurityGate& gate_;
  PeerResolver resolver_;
  std::shared_ptr<Logger> logger_;
  OperationTracker tracker_;
};
