#include "exec_handler.hpp"

#include "errors.hpp"
#include "security_gate.hpp"
#include "utils.hpp"

ExecHandler::ExecHandler(std::shared_ptr<ExecService> service, SecurityGate& gate, PeerResolver resolver)
  : service_(std::move(service)),
    gate_(gate),
    resolver_(std::move(resolver)),
    logger_(component_logger("exec")) {}

ExecResult ExecHandler::handle_exec(const ExecCommandRequest& request) {
  if(trim_copy(request.command).empty()) {
    throw KizunaError::missing_argument("command");
  }
  if(request.timeout && request.timeout->count() <= 0) {
    throw KizunaError::invalid_argument_value("--timeout", "must be greater than zero");
  }

  std::optional<PeerInfo> peer = resolver_ ? resolver_(request.peer) : std::nullopt;
  if(!peer) {
    throw KizunaError::integration(IntegrationDomain::Security,
                                   "Unknown peer '" + request.peer + "'; run 'kizuna discover' to find peers");
  }

  gate_.ensure_session();
  auto decision = gate_.authorize_operation(GatedOperation::Exec, peer->id);
  if(!decision.allowed) {
    std::string reason = decision.reason;
    if(gate_.is_session_valid() && gate_.trust_status(peer->id) == TrustStatus::Untrusted) {
      reason = "Cannot execute command on untrusted peer '" + request.peer + "'";
    }
    log_warn(logger_.get(), "Refused exec on {}: {}", peer->id, reason);
    throw KizunaError::integration(IntegrationDomain::Security, reason);
  }

  ExecRequest exec;
  exec.command = request.command;
  exec.peer_id = peer->id;
  if(!peer->addresses.empty()) exec.peer_address = peer->addresses.front();
  if(request.timeout) {
    exec.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(*request.timeout);
  }

  OperationStatus status;
  status.operation_id = new_uuid();
  status.kind = OperationKind::CommandExecution;
  status.peer_id = peer->id;
  status.state = OperationState::in_progress();
  ProgressInfo progress;
  progress.message = request.command;
  status.progress = progress;
  tracker_.insert(status);

  log_info(logger_.get(), "Executing '{}' on {}", request.command, peer->name);
  auto start = std::chrono::steady_clock::now();
  ExecOutcome outcome;
  try {
    outcome = service_->execute(exec);
  } catch(const KizunaError& e) {
    tracker_.set_state(status.operation_id, OperationState::failed(e.detail()));
    throw;
  } catch(const std::exception& e) {
    tracker_.set_state(status.operation_id, OperationState::failed(e.what()));
    throw KizunaError::execution(std::string("Remote command failed: ") + e.what());
  }

  ExecResult result;
  result.operation_id = status.operation_id;
  result.output = std::move(outcome.output);
  result.exit_code = outcome.exit_code;
  result.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - start);
  tracker_.set_state(status.operation_id, OperationState::completed());
  log_debug(logger_.get(), "Command on {} exited with {} after {} ms",
            peer->id, result.exit_code, result.execution_time.count());
  return result;
}
