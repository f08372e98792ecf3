#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "channel.hpp"
#include "collaborators.hpp"
#include "log.hpp"
#include "protocol.hpp"

class InboundSession;

// TCP side of a device: pushes files to peers, accepts offers while a
// receive is armed, and runs or forwards exec requests.
// Outbound work uses one thread per operation with blocking, time-limited
// sockets; inbound connections are served asynchronously on io_thread_.
class PeerService : public TransferService, public ExecService {
public:
  static constexpr std::chrono::milliseconds kIoTimeout{10000};
  static constexpr std::chrono::milliseconds kProgressInterval{100};
  static constexpr std::chrono::milliseconds kDefaultExecTimeout{30000};

  PeerService(LocalNode node, std::shared_ptr<SecuritySystem> security);
  ~PeerService() override;

  PeerService(const PeerService&) = delete;
  PeerService& operator=(const PeerService&) = delete;

  // Binds the service port (0 picks one) and starts serving.
  void listen(unsigned short port);
  void stop();
  bool listening() const { return listening_.load(); }
  unsigned short port() const { return node_.service_port; }

  void set_allow_remote_exec(bool allowed) { allow_remote_exec_ = allowed; }
  bool allow_remote_exec() const { return allow_remote_exec_.load(); }

  // TransferService
  void handle_send(const SendArgs& args) override;
  void start_receiving(const ReceiveArgs& args) override;
  void stop_receiving() override;
  void cancel(const std::string& operation_id) override;
  void pause(const std::string& operation_id) override;
  void resume(const std::string& operation_id) override;
  void set_bandwidth_limit(const std::string& operation_id, std::optional<uint64_t> bytes_per_sec) override;
  std::shared_ptr<Channel<TransferEvent>> events() override { return events_; }

  // ExecService
  ExecOutcome execute(const ExecRequest& request) override;

  // Runs a command locally with stdout and stderr merged.
  static ExecOutcome run_local_command(const std::string& command);

private:
  friend class InboundSession;

  struct SendJob {
    std::atomic<bool> cancelled{false};
    std::atomic<bool> paused{false};
    std::atomic<uint64_t> limit{0}; // bytes per second, 0 = unlimited
    std::thread worker;
  };

  void do_accept();
  void run_send(SendArgs args, std::shared_ptr<SendJob> job);
  std::shared_ptr<SendJob> find_job(const std::string& operation_id);
  void reap_finished_jobs();

  // Claims the armed receive for one inbound offer; nullopt when nothing
  // is armed or another offer already holds it.
  std::optional<ReceiveArgs> claim_receive();
  void release_receive(const ReceiveArgs& args, bool finished);
  void emit(TransferEvent event);

  LocalNode node_;
  std::shared_ptr<SecuritySystem> security_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<Channel<TransferEvent>> events_;
  std::atomic<bool> allow_remote_exec_{false};

  asio::io_context io_;
  std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::thread io_thread_;
  std::atomic<bool> listening_{false};
  asio::thread_pool blocking_pool_{2};

  std::mutex mutex_;
  std::map<std::string, std::shared_ptr<SendJob>> jobs_;
  std::map<std::string, std::shared_ptr<SendJob>> finished_jobs_;
  std::optional<ReceiveArgs> receive_;
  bool receive_busy_ = false;
};
