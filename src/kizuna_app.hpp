#pragma once

#include <chrono>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "collaborators.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "types.hpp"

class DiscoverHandler;
struct CLIConfig;

// One CLI invocation: parse, resolve configuration, wire the bundled
// collaborators into the handlers, route, render and record history.
class KizunaApp {
public:
  static constexpr std::chrono::seconds kResolveTimeout{2};

  KizunaApp(std::istream& in, std::ostream& out, std::ostream& err);

  // args excludes the program name. Returns the process exit code.
  int run(const std::vector<std::string>& args);

  // y/N question on err, answered from in. Serialized across threads.
  bool ask(const std::string& question);

  // Peers for transfer, exec and clipboard: the discovery cache first, then
  // one short broadcast query.
  static std::optional<PeerInfo> resolve_peer(DiscoverHandler& discover, const std::string& name_or_id);

  static LocalNode local_node(const CLIConfig& config, const std::string& peer_id);
  // Verbs that serve peers while they run.
  static bool serves_peers(const std::string& verb);
  static bool records_history(const std::string& verb);

private:
  std::istream& in_;
  std::ostream& out_;
  std::ostream& err_;
  bool stdin_terminal_;
  bool stderr_terminal_;
  std::mutex prompt_mutex_;
  std::shared_ptr<Logger> logger_;
};
