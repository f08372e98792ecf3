#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "collaborators.hpp"
#include "log.hpp"
#include "operation_tracker.hpp"
#include "runtime.hpp"
#include "types.hpp"

class SecurityGate;

struct SendRequest {
  std::vector<std::filesystem::path> files;
  std::string peer; // name or id
  std::optional<bool> compression;
  std::optional<bool> encryption;
};

struct ReceiveRequest {
  std::optional<std::filesystem::path> output_dir;
  bool auto_accept = false;
  std::optional<std::string> from_peer;
};

struct OperationHandle {
  std::string operation_id;
  OperationStatus status;
};

class TransferHandler {
public:
  using PeerResolver = std::function<std::optional<PeerInfo>(const std::string& name_or_id)>;
  using OfferPrompt = std::function<bool(const IncomingOffer& offer)>;

  TransferHandler(Runtime& runtime,
                  std::shared_ptr<TransferService> service,
                  SecurityGate& gate,
                  PeerResolver resolver);
  ~TransferHandler();

  TransferHandler(const TransferHandler&) = delete;
  TransferHandler& operator=(const TransferHandler&) = delete;

  void set_defaults(bool compression, bool encryption);
  void set_download_dir(std::filesystem::path dir);
  // Asked for offers that auto-accept does not settle.
  void set_offer_prompt(OfferPrompt prompt);

  // Starts draining collaborator events on the runtime.
  void start();
  void stop();

  // Returns once the collaborator accepted the request.
  OperationHandle send(const SendRequest& request);
  OperationHandle receive(const ReceiveRequest& request);
  void stop_receiving();

  std::vector<OperationStatus> get_all_operations() const;
  std::optional<OperationStatus> get_operation_status(const std::string& operation_id) const;
  void cancel_operation(const std::string& operation_id);
  void pause_operation(const std::string& operation_id);
  void resume_operation(const std::string& operation_id);
  void set_bandwidth_limit(const std::string& operation_id, std::optional<uint64_t> bytes_per_sec);
  bool wait_for_terminal(const std::string& operation_id, std::optional<std::chrono::milliseconds> timeout);

  // Merges one collaborator event (unknown ids dropped, terminal sticky).
  void apply_event(const TransferEvent& event);

  std::shared_ptr<Channel<OperationStatus>> subscribe(std::size_t capacity = 0);
  const OperationTracker& tracker() const { return tracker_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  PeerInfo resolve_peer(const std::string& peer) const;
  bool decide_offer(const IncomingOffer& offer, const ReceiveRequest& request);
  void pump_events();
  void require_known(const std::string& operation_id) const;

  Runtime& runtime_;
  std::shared_ptr<TransferService> service_;
  SecurityGate& gate_;
  PeerResolver resolver_;
  std::shared_ptr<Logger> logger_;

  OperationTracker tracker_;

  mutable std::mutex settings_mutex_;
  bool default_compression_ = true;
  bool default_encryption_ = true;
  std::filesystem::path download_dir_;
  OfferPrompt prompt_;

  std::mutex pump_mutex_;
  std::shared_ptr<Channel<TransferEvent>> events_;
  std::shared_ptr<PeriodicTask> pump_;
};
