#include "peer_service.hpp"

#include <sys/wait.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <istream>
#include <functional>
#include <system_error>
#include <vector>

#include "errors.hpp"
#include "local_security.hpp"
#include "utils.hpp"

using tcp = asio::ip::tcp;

namespace {

constexpr std::chrono::milliseconds kOfferReplyTimeout{120000};
constexpr std::chrono::milliseconds kRunSlice{100};
constexpr std::size_t kNonceBytes = 32;

struct LinkTimeout : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct LinkAborted : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Synchronous socket with a deadline per operation. Each call drives a
// private io_context in short slices so an abort predicate stays responsive.
class BlockingLink {
public:
  BlockingLink(std::chrono::milliseconds timeout, std::function<bool()> abort = {})
    : socket_(io_), timeout_(timeout), abort_(std::move(abort)) {}

  ~BlockingLink() { close(); }

  void set_timeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }

  void connect(const HostPort& target) {
    tcp::resolver resolver(io_);
    std::error_code ec;
    auto endpoints = resolver.resolve(target.host, std::to_string(target.port), ec);
    if(ec) throw std::system_error(ec, "resolve " + target.host);
    asio::async_connect(socket_, endpoints,
      [&ec](const std::error_code& result, const tcp::endpoint&){ ec = result; });
    run("connect to " + format_host_port(target.host, target.port), ec);
  }

  void write_all(asio::const_buffer buffer) {
    std::error_code ec;
    asio::async_write(socket_, buffer,
      [&ec](const std::error_code& result, std::size_t){ ec = result; });
    run("write", ec);
  }

  void write_line(const json& message) {
    auto line = message.dump() + "\n";
    write_all(asio::buffer(line));
  }

  json read_line() {
    std::error_code ec;
    asio::async_read_until(socket_, buffer_, '\n',
      [&ec](const std::error_code& result, std::size_t){ ec = result; });
    run("read", ec);
    std::istream is(&buffer_);
    std::string line;
    std::getline(is, line);
    return json::parse(line);
  }

  void close() {
    std::error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

private:
  void run(const std::string& what, const std::error_code& ec) {
    io_.restart();
    auto deadline = std::chrono::steady_clock::now() + timeout_;
    bool timed_out = false;
    bool aborted = false;
    while(!io_.stopped()) {
      io_.run_for(kRunSlice);
      if(io_.stopped()) break;
      aborted = abort_ && abort_();
      timed_out = std::chrono::steady_clock::now() >= deadline;
      if(aborted || timed_out) {
        std::error_code ignored;
        socket_.close(ignored);
        io_.run();
        break;
      }
    }
    if(aborted) throw LinkAborted(what + " aborted");
    if(timed_out) throw LinkTimeout(what + " timed out");
    if(ec) throw std::system_error(ec, what);
  }

  asio::io_context io_;
  tcp::socket socket_;
  asio::streambuf buffer_;
  std::chrono::milliseconds timeout_;
  std::function<bool()> abort_;
};

double rate_since(std::chrono::steady_clock::time_point start, uint64_t bytes) {
  auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
  return elapsed > 0.0 ? static_cast<double>(bytes) / elapsed : 0.0;
}

// Never overwrite: "a.txt" becomes "a-1.txt", "a-2.txt", ...
std::filesystem::path unique_target(const std::filesystem::path& wanted) {
  std::error_code ec;
  if(!std::filesystem::exists(wanted, ec)) return wanted;
  auto stem = wanted.stem().string();
  auto extension = wanted.extension().string();
  for(int i = 1;; ++i) {
    auto candidate = wanted.parent_path() / (stem + "-" + std::to_string(i) + extension);
    if(!std::filesystem::exists(candidate, ec)) return candidate;
  }
}

// Offered names are reduced to a bare file name; anything that still points
// outside the output directory is refused.
std::optional<std::string> safe_file_name(const std::string& offered) {
  auto name = std::filesystem::path(offered).filename().string();
  if(name.empty() || name == "." || name == "..") return std::nullopt;
  return name;
}

} // namespace

// One accepted connection. Reads a JSON header line and serves either a file
// offer or an exec request, then closes.
class InboundSession : public std::enable_shared_from_this<InboundSession> {
public:
  InboundSession(PeerService& service, tcp::socket socket)
    : service_(service), socket_(std::move(socket)), chunk_(kChunkSize) {
    std::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    remote_ = ec ? std::string("unknown") : format_host_port(endpoint.address().to_string(), endpoint.port());
  }

  void start() {
    read_message([this](const json& message){ handle_message(message); });
  }

private:
  void read_message(std::function<void(const json&)> handler) {
    auto self = shared_from_this();
    asio::async_read_until(socket_, buffer_, '\n',
      [this, self, handler = std::move(handler)](std::error_code ec, std::size_t){
        if(ec) {
          if(ec != asio::error::eof) log_debug(service_.logger_.get(), "Read from {} failed: {}", remote_, ec.message());
          close();
          return;
        }
        std::istream is(&buffer_);
        std::string line;
        std::getline(is, line);
        json message;
        try {
          message = json::parse(line);
        } catch(const json::parse_error& e) {
          log_warn(service_.logger_.get(), "Malformed message from {}: {}", remote_, e.what());
          reply_and_close(make_error("malformed message"));
          return;
        }
        if(!message.is_object()) {
          reply_and_close(make_error("malformed message"));
          return;
        }
        handler(message);
      });
  }

  void handle_message(const json& message) {
    auto type = message.value("type", "");
    if(type == "file_offer") {
      handle_offer(message);
    } else if(type == "exec_request") {
      handle_exec(message);
    } else {
      log_debug(service_.logger_.get(), "Unsupported message '{}' from {}", type, remote_);
      reply_and_close(make_error("unsupported message type '" + type + "'"));
    }
  }

  void handle_offer(const json& offer) {
    auto operation_id = offer.value("operation_id", "");
    auto peer_id = offer.value("peer_id", "");
    if(peer_id.empty() || !service_.security_->is_connection_allowed(peer_id)) {
      log_info(service_.logger_.get(), "Refused offer from {} ({})", remote_, peer_id);
      reply_and_close(make_offer_reply(operation_id, false, "Connection not allowed"));
      return;
    }

    IncomingOffer incoming;
    incoming.operation_id = operation_id;
    incoming.peer_id = peer_id;
    for(auto file : offered_files(offer)) {
      auto name = safe_file_name(file.name);
      if(!name) {
        reply_and_close(make_offer_reply(operation_id, false, "Invalid file name '" + file.name + "'"));
        return;
      }
      file.name = *name;
      incoming.file_names.push_back(file.name);
      incoming.total_bytes += file.size;
      files_.push_back(std::move(file));
    }

    receive_ = service_.claim_receive();
    if(!receive_) {
      log_info(service_.logger_.get(), "Declined offer from {}: not receiving", peer_id);
      reply_and_close(make_offer_reply(operation_id, false, "Not accepting transfers"));
      return;
    }

    // The accept callback may prompt on the terminal.
    auto self = shared_from_this();
    asio::post(service_.blocking_pool_, [this, self, incoming]{
      bool accepted = false;
      std::string reason = "Declined by receiver";
      try {
        accepted = receive_->accept ? receive_->accept(incoming) : false;
      } catch(const std::exception& e) {
        log_warn(service_.logger_.get(), "Offer decision for {} failed: {}", incoming.peer_id, e.what());
        reason = e.what();
      }
      answer_offer(incoming, accepted, reason);
    });
  }

  void answer_offer(const IncomingOffer& incoming, bool accepted, const std::string& reason) {
    if(!accepted) {
      service_.release_receive(*receive_, false);
      receive_.reset();
      reply_and_close(make_offer_reply(incoming.operation_id, false, reason));
      return;
    }
    total_ = incoming.total_bytes;
    started_ = last_progress_ = std::chrono::steady_clock::now();
    TransferEvent event;
    event.type = TransferEvent::Type::Started;
    event.operation_id = receive_->operation_id;
    event.total_bytes = total_;
    service_.emit(event);
    log_info(service_.logger_.get(), "Receiving {} files ({} bytes) from {}",
             files_.size(), total_, incoming.peer_id);

    auto self = shared_from_this();
    send_line(make_offer_reply(incoming.operation_id, true), [this, self]{ next_file(); });
  }

  void next_file() {
    if(file_index_ >= files_.size()) {
      read_complete();
      return;
    }
    const auto& file = files_[file_index_];
    current_path_ = unique_target(receive_->output_dir / file.name);
    out_.open(current_path_, std::ios::binary | std::ios::trunc);
    if(!out_) {
      fail_receive("cannot write " + current_path_.string());
      return;
    }
    file_remaining_ = file.size;
    receive_chunk();
  }

  void receive_chunk() {
    if(file_remaining_ == 0) {
      out_.close();
      log_debug(service_.logger_.get(), "Stored {}", current_path_.string());
      current_path_.clear();
      ++file_index_;
      next_file();
      return;
    }

    // Bytes that arrived together with the header line.
    if(buffer_.size() > 0) {
      auto take = static_cast<std::size_t>(std::min<uint64_t>(buffer_.size(), file_remaining_));
      out_.write(static_cast<const char*>(buffer_.data().data()), static_cast<std::streamsize>(take));
      buffer_.consume(take);
      if(!store(take)) return;
      receive_chunk();
      return;
    }

    auto want = static_cast<std::size_t>(std::min<uint64_t>(file_remaining_, chunk_.size()));
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(chunk_.data(), want),
      [this, self](std::error_code ec, std::size_t n){
        if(ec) {
          fail_receive("connection lost: " + ec.message());
          return;
        }
        out_.write(chunk_.data(), static_cast<std::streamsize>(n));
        if(!store(n)) return;
        receive_chunk();
      });
  }

  bool store(std::size_t n) {
    if(!out_) {
      fail_receive("write to " + current_path_.string() + " failed");
      return false;
    }
    file_remaining_ -= n;
    received_ += n;
    auto now = std::chrono::steady_clock::now();
    if(now - last_progress_ >= PeerService::kProgressInterval) {
      last_progress_ = now;
      TransferEvent event;
      event.type = TransferEvent::Type::Progress;
      event.operation_id = receive_->operation_id;
      event.bytes_transferred = received_;
      event.total_bytes = total_;
      event.rate = rate_since(started_, received_);
      service_.emit(event);
    }
    return true;
  }

  void read_complete() {
    auto self = shared_from_this();
    asio::async_read_until(socket_, buffer_, '\n',
      [this, self](std::error_code ec, std::size_t){
        if(ec) {
          fail_receive("sender closed before completing: " + ec.message());
          return;
        }
        std::istream is(&buffer_);
        std::string line;
        std::getline(is, line);
        json message = json::parse(line, nullptr, false);
        if(message.is_discarded() || message.value("type", "") != "file_complete") {
          fail_receive("unexpected message after file data");
          return;
        }
        auto claimed = message.value("bytes", uint64_t{0});
        if(claimed != received_) {
          fail_receive("sender reported " + std::to_string(claimed) + " bytes, received " + std::to_string(received_));
          return;
        }
        TransferEvent event;
        event.type = TransferEvent::Type::Completed;
        event.operation_id = receive_->operation_id;
        event.bytes_transferred = received_;
        event.total_bytes = total_;
        event.rate = rate_since(started_, received_);
        service_.emit(event);
        log_info(service_.logger_.get(), "Received {} bytes into {}", received_, receive_->output_dir.string());
        service_.release_receive(*receive_, true);
        close();
      });
  }

  void fail_receive(const std::string& error) {
    out_.close();
    if(!current_path_.empty()) {
      std::error_code ignored;
      std::filesystem::remove(current_path_, ignored);
    }
    log_warn(service_.logger_.get(), "Receive from {} failed: {}", remote_, error);
    TransferEvent event;
    event.type = TransferEvent::Type::Failed;
    event.operation_id = receive_->operation_id;
    event.bytes_transferred = received_;
    event.total_bytes = total_;
    event.error = error;
    service_.emit(event);
    service_.release_receive(*receive_, true);
    close();
  }

  // The claimed peer id must be the one its public key derives, and the
  // caller must sign a fresh nonce with that key before anything runs.
  void handle_exec(const json& request) {
    auto peer_id = request.value("peer_id", "");
    auto public_key = request.value("public_key", "");
    auto command = request.value("command", "");
    if(!service_.allow_remote_exec()) {
      log_warn(service_.logger_.get(), "Refused exec from {}: remote execution disabled", peer_id);
      reply_and_close(make_error("Remote execution is disabled on this device"));
      return;
    }
    if(peer_id.empty() || peer_id_for_public_key(public_key) != peer_id) {
      log_warn(service_.logger_.get(), "Refused exec from {}: peer id {} does not match its key", remote_, peer_id);
      reply_and_close(make_error("Peer identity does not match its key"));
      return;
    }
    if(service_.security_->is_blocked(peer_id) || !service_.security_->is_trusted(peer_id)) {
      log_warn(service_.logger_.get(), "Refused exec from untrusted peer {}", peer_id);
      reply_and_close(make_error("Peer is not trusted"));
      return;
    }
    if(command.empty()) {
      reply_and_close(make_error("Empty command"));
      return;
    }

    auto nonce = random_hex(kNonceBytes);
    auto payload = exec_signing_payload(nonce, service_.node_.peer_id, command);
    auto self = shared_from_this();
    send_line(make_exec_challenge(nonce), [this, self, peer_id, public_key, payload, command]{
      read_message([this, self, peer_id, public_key, payload, command](const json& auth){
        if(auth.value("type", "") != "exec_auth" ||
           !verify_device_signature(public_key, payload, auth.value("signature", ""))) {
          log_warn(service_.logger_.get(), "Refused exec from {}: signature check failed", peer_id);
          reply_and_close(make_error("Peer authentication failed"));
          return;
        }
        run_exec(peer_id, command);
      });
    });
  }

  void run_exec(const std::string& peer_id, const std::string& command) {
    log_info(service_.logger_.get(), "Running '{}' for {}", command, peer_id);
    auto self = shared_from_this();
    asio::post(service_.blocking_pool_, [this, self, command]{
      json reply;
      try {
        auto outcome = PeerService::run_local_command(command);
        reply = make_exec_result(outcome.output, outcome.exit_code);
      } catch(const std::exception& e) {
        reply = make_error(e.what());
      }
      reply_and_close(reply);
    });
  }

  void send_line(const json& message, std::function<void()> then) {
    outgoing_ = message.dump() + "\n";
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(outgoing_),
      [this, self, then = std::move(then)](std::error_code ec, std::size_t){
        if(ec) {
          log_debug(service_.logger_.get(), "Write to {} failed: {}", remote_, ec.message());
          if(receive_) fail_receive("connection lost: " + ec.message());
          else close();
          return;
        }
        then();
      });
  }

  void reply_and_close(const json& message) {
    auto self = shared_from_this();
    send_line(message, [this, self]{ close(); });
  }

  void close() {
    std::error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

  PeerService& service_;
  tcp::socket socket_;
  asio::streambuf buffer_;
  std::string remote_;
  std::string outgoing_;

  std::optional<ReceiveArgs> receive_;
  std::vector<OfferedFile> files_;
  std::size_t file_index_ = 0;
  uint64_t file_remaining_ = 0;
  uint64_t received_ = 0;
  uint64_t total_ = 0;
  std::ofstream out_;
  std::filesystem::path current_path_;
  std::vector<char> chunk_;
  std::chrono::steady_clock::time_point started_;
  std::chrono::steady_clock::time_point last_progress_;
};

PeerService::PeerService(LocalNode node, std::shared_ptr<SecuritySystem> security)
  : node_(std::move(node)),
    security_(std::move(security)),
    logger_(component_logger("peer")),
    events_(std::make_shared<Channel<TransferEvent>>()) {}

PeerService::~PeerService() {
  stop();
}

void PeerService::listen(unsigned short port) {
  if(listening_) return;
  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  tcp::endpoint endpoint(tcp::v4(), port);
  std::error_code ec;
  acceptor_->open(endpoint.protocol(), ec);
  if(!ec) acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
  if(!ec) acceptor_->bind(endpoint, ec);
  if(!ec) acceptor_->listen(asio::socket_base::max_listen_connections, ec);
  if(ec) {
    acceptor_.reset();
    throw KizunaError::integration(IntegrationDomain::Transfer,
                                   "Cannot listen on port " + std::to_string(port) + ": " + ec.message());
  }
  node_.service_port = acceptor_->local_endpoint().port();
  listening_ = true;
  do_accept();
  work_.emplace(asio::make_work_guard(io_));
  io_thread_ = std::thread([this]{ io_.run(); });
  log_info(logger_.get(), "Listening for peers on port {}", node_.service_port);
}

void PeerService::do_accept() {
  acceptor_->async_accept([this](std::error_code ec, tcp::socket socket){
    if(!listening_) return;
    if(ec) {
      log_warn(logger_.get(), "Accept error: {}", ec.message());
    } else {
      std::make_shared<InboundSession>(*this, std::move(socket))->start();
    }
    do_accept();
  });
}

void PeerService::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for(auto& entry : jobs_) entry.second->cancelled = true;
    receive_.reset();
    receive_busy_ = false;
  }
  if(listening_.exchange(false)) {
    std::error_code ignored;
    if(acceptor_) acceptor_->close(ignored);
    work_.reset();
    io_.stop();
    if(io_thread_.joinable()) io_thread_.join();
    acceptor_.reset();
    log_debug(logger_.get(), "Peer service stopped");
  }

  std::map<std::string, std::shared_ptr<SendJob>> all;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    all.swap(jobs_);
    all.insert(finished_jobs_.begin(), finished_jobs_.end());
    finished_jobs_.clear();
  }
  for(auto& entry : all) {
    if(entry.second->worker.joinable()) entry.second->worker.join();
  }
}

void PeerService::emit(TransferEvent event) {
  events_->send(std::move(event));
}

std::optional<ReceiveArgs> PeerService::claim_receive() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!receive_ || receive_busy_) return std::nullopt;
  receive_busy_ = true;
  return receive_;
}

void PeerService::release_receive(const ReceiveArgs& args, bool finished) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!receive_ || receive_->operation_id != args.operation_id) return;
  receive_busy_ = false;
  if(finished) receive_.reset();
}

void PeerService::start_receiving(const ReceiveArgs& args) {
  if(!listening_) {
    throw KizunaError::integration(IntegrationDomain::Transfer, "Peer service is not listening");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if(receive_) {
    throw KizunaError::integration(IntegrationDomain::Transfer,
                                   "Already receiving as operation " + receive_->operation_id);
  }
  receive_ = args;
  receive_busy_ = false;
}

void PeerService::stop_receiving() {
  std::lock_guard<std::mutex> lock(mutex_);
  receive_.reset();
  receive_busy_ = false;
}

void PeerService::handle_send(const SendArgs& args) {
  reap_finished_jobs();
  if(args.files.empty()) {
    throw KizunaError::integration(IntegrationDomain::Transfer, "No files to send");
  }
  if(!parse_host_port(args.peer_address, kDefaultServicePort)) {
    throw KizunaError::integration(IntegrationDomain::Transfer,
                                   "No reachable address for peer " + args.peer_id);
  }
  auto job = std::make_shared<SendJob>();
  std::lock_guard<std::mutex> lock(mutex_);
  if(jobs_.count(args.operation_id) > 0) {
    throw KizunaError::integration(IntegrationDomain::Transfer, "Transfer " + args.operation_id + " already running");
  }
  jobs_[args.operation_id] = job;
  job->worker = std::thread([this, args, job]{ run_send(args, job); });
}

void PeerService::run_send(SendArgs args, std::shared_ptr<SendJob> job) {
  TransferEvent event;
  event.operation_id = args.operation_id;
  uint64_t sent = 0;
  uint64_t total = 0;
  try {
    std::vector<OfferedFile> files;
    for(const auto& path : args.files) {
      std::error_code ec;
      auto size = std::filesystem::file_size(path, ec);
      if(ec) throw std::runtime_error("cannot read " + path.string() + ": " + ec.message());
      files.push_back({path.filename().string(), size});
      total += size;
    }
    event.type = TransferEvent::Type::Started;
    event.total_bytes = total;
    emit(event);

    auto target = parse_host_port(args.peer_address, kDefaultServicePort);
    BlockingLink link(kIoTimeout, [job]{ return job->cancelled.load(); });
    link.connect(*target);
    link.write_line(make_file_offer(args.operation_id, node_, files, args.compression, args.encryption));

    link.set_timeout(kOfferReplyTimeout);
    auto reply = link.read_line();
    if(reply.value("type", "") == "error") {
      throw std::runtime_error(reply.value("message", "peer error"));
    }
    if(!reply.value("accepted", false)) {
      throw std::runtime_error("Peer declined the transfer: " + reply.value("reason", "no reason given"));
    }
    link.set_timeout(kIoTimeout);

    std::vector<char> chunk(kChunkSize);
    auto started = std::chrono::steady_clock::now();
    auto last_progress = started;
    for(std::size_t i = 0; i < args.files.size(); ++i) {
      std::ifstream in(args.files[i], std::ios::binary);
      if(!in) throw std::runtime_error("cannot open " + args.files[i].string());
      uint64_t remaining = files[i].size;
      while(remaining > 0) {
        while(job->paused && !job->cancelled) {
          std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if(job->cancelled) throw LinkAborted("cancelled");

        auto want = static_cast<std::size_t>(std::min<uint64_t>(remaining, chunk.size()));
        in.read(chunk.data(), static_cast<std::streamsize>(want));
        if(static_cast<std::size_t>(in.gcount()) != want) {
          throw std::runtime_error(args.files[i].string() + " changed while sending");
        }
        auto chunk_start = std::chrono::steady_clock::now();
        link.write_all(asio::buffer(chunk.data(), want));
        sent += want;
        remaining -= want;

        auto limit = job->limit.load();
        if(limit > 0) {
          auto budget = std::chrono::duration<double>(static_cast<double>(want) / static_cast<double>(limit));
          auto spent = std::chrono::steady_clock::now() - chunk_start;
          if(spent < budget) {
            std::this_thread::sleep_for(std::chrono::duration_cast<std::chrono::milliseconds>(budget - spent));
          }
        }

        auto now = std::chrono::steady_clock::now();
        if(now - last_progress >= kProgressInterval) {
          last_progress = now;
          event.type = TransferEvent::Type::Progress;
          event.bytes_transferred = sent;
          event.rate = rate_since(started, sent);
          emit(event);
        }
      }
    }
    link.write_line(make_file_complete(args.operation_id, sent));

    event.type = TransferEvent::Type::Completed;
    event.bytes_transferred = sent;
    event.rate = rate_since(started, sent);
    emit(event);
    log_info(logger_.get(), "Sent {} bytes to {}", sent, args.peer_id);
  } catch(const LinkAborted&) {
    event.type = TransferEvent::Type::Cancelled;
    event.bytes_transferred = sent;
    emit(event);
    log_info(logger_.get(), "Transfer {} cancelled after {} bytes", args.operation_id, sent);
  } catch(const std::exception& e) {
    event.type = job->cancelled ? TransferEvent::Type::Cancelled : TransferEvent::Type::Failed;
    event.bytes_transferred = sent;
    event.error = e.what();
    emit(event);
    log_warn(logger_.get(), "Transfer {} to {} failed: {}", args.operation_id, args.peer_id, e.what());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(args.operation_id);
  if(it != jobs_.end()) {
    finished_jobs_[it->first] = it->second;
    jobs_.erase(it);
  }
}

void PeerService::reap_finished_jobs() {
  std::map<std::string, std::shared_ptr<SendJob>> finished;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    finished.swap(finished_jobs_);
  }
  for(auto& entry : finished) {
    if(entry.second->worker.joinable()) entry.second->worker.join();
  }
}

std::shared_ptr<PeerService::SendJob> PeerService::find_job(const std::string& operation_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(operation_id);
  return it == jobs_.end() ? nullptr : it->second;
}

void PeerService::cancel(const std::string& operation_id) {
  if(auto job = find_job(operation_id)) {
    job->cancelled = true;
    return;
  }
  bool disarmed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(receive_ && receive_->operation_id == operation_id && !receive_busy_) {
      receive_.reset();
      disarmed = true;
    }
  }
  if(disarmed) {
    TransferEvent event;
    event.type = TransferEvent::Type::Cancelled;
    event.operation_id = operation_id;
    emit(event);
    return;
  }
  throw KizunaError::integration(IntegrationDomain::Transfer, "Transfer " + operation_id + " is not active");
}

void PeerService::pause(const std::string& operation_id) {
  auto job = find_job(operation_id);
  if(!job) {
    throw KizunaError::integration(IntegrationDomain::Transfer, "Only active sends can be paused");
  }
  job->paused = true;
}

void PeerService::resume(const std::string& operation_id) {
  auto job = find_job(operation_id);
  if(!job) {
    throw KizunaError::integration(IntegrationDomain::Transfer, "Only active sends can be resumed");
  }
  job->paused = false;
}

void PeerService::set_bandwidth_limit(const std::string& operation_id, std::optional<uint64_t> bytes_per_sec) {
  auto job = find_job(operation_id);
  if(!job) {
    throw KizunaError::integration(IntegrationDomain::Transfer, "Transfer " + operation_id + " is not an active send");
  }
  job->limit = bytes_per_sec.value_or(0);
}

ExecOutcome PeerService::execute(const ExecRequest& request) {
  auto target = parse_host_port(request.peer_address, kDefaultServicePort);
  if(!target) {
    throw KizunaError::execution("No reachable address for peer " + request.peer_id);
  }
  auto timeout = request.timeout.value_or(kDefaultExecTimeout);
  std::optional<int64_t> timeout_ms;
  if(request.timeout) timeout_ms = request.timeout->count();

  auto identity = security_->get_or_create_identity();
  json reply;
  try {
    BlockingLink link(kIoTimeout);
    link.connect(*target);
    link.write_line(make_exec_request(node_.peer_id, identity.public_key, request.command, timeout_ms));
    reply = link.read_line();
    if(reply.value("type", "") == "exec_challenge") {
      auto payload = exec_signing_payload(reply.value("nonce", ""), request.peer_id, request.command);
      link.write_line(make_exec_auth(security_->sign(payload)));
      link.set_timeout(timeout);
      reply = link.read_line();
    }
  } catch(const LinkTimeout& e) {
    throw KizunaError::execution("Command on " + request.peer_id + " timed out (" + e.what() + ")");
  } catch(const std::system_error& e) {
    throw KizunaError::execution("Cannot reach " + request.peer_address + ": " + e.what());
  } catch(const json::exception& e) {
    throw KizunaError::execution(std::string("Malformed reply from peer: ") + e.what());
  }

  auto type = reply.value("type", "");
  if(type == "error") {
    throw KizunaError::execution(reply.value("message", "remote error"));
  }
  if(type != "exec_result") {
    throw KizunaError::execution("Unexpected reply '" + type + "' from peer");
  }
  ExecOutcome outcome;
  outcome.output = reply.value("output", "");
  outcome.exit_code = reply.value("exit_code", -1);
  return outcome;
}

ExecOutcome PeerService::run_local_command(const std::string& command) {
  auto full = command + " 2>&1";
  FILE* pipe = popen(full.c_str(), "r");
  if(!pipe) {
    throw KizunaError::execution("cannot run '" + command + "'");
  }
  ExecOutcome outcome;
  char buffer[4096];
  std::size_t n = 0;
  while((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
    outcome.output.append(buffer, n);
  }
  int status = pclose(pipe);
  if(status == -1) {
    throw KizunaError::execution("lost track of '" + command + "'");
  }
  if(WIFEXITED(status)) {
    outcome.exit_code = WEXITSTATUS(status);
  } else if(WIFSIGNALED(status)) {
    outcome.exit_code = 128 + WTERMSIG(status);
  }
  return outcome;
}
