#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Verb table. kind is "flag", "value" or "int"; positionals is "none" or "any".
inline const nlohmann::json COMMAND_SPECIFICATION = nlohmann::json::array({
  {{"verb","discover"}, {"description","Discover available peers"}, {"positionals","none"},
   {"subcommands", nlohmann::json::array()}, {"subcommand_required", false},
   {"options", nlohmann::json::array({
     {{"name","type"},    {"short","t"}, {"kind","value"}, {"description","Filter by device type"}},
     {{"name","name"},    {"short","n"}, {"kind","value"}, {"description","Filter by device name"}},
     {{"name","timeout"}, {"short",""},  {"kind","int"},   {"description","Discovery timeout in seconds (default 10)"}},
     {{"name","watch"},   {"short","w"}, {"kind","flag"},  {"description","Continuously watch for peers"}}
   })}},
  {{"verb","send"}, {"description","Send files to a peer"}, {"positionals","any"},
   {"subcommands", nlohmann::json::array()}, {"subcommand_required", false},
   {"options", nlohmann::json::array({
     {{"name","peer"},           {"short","p"}, {"kind","value"}, {"description","Target peer name or ID (comma separated for several)"}},
     {{"name","no-compression"}, {"short",""},  {"kind","flag"},  {"description","Disable compression"}},
     {{"name","no-encryption"},  {"short",""},  {"kind","flag"},  {"description","Disable encryption"}},
     {{"name","batch"},          {"short",""},  {"kind","flag"},  {"description","Read a JSON batch object from stdin"}},
     {{"name","parallel"},       {"short",""},  {"kind","flag"},  {"description","Run batch transfers in parallel"}},
     {{"name","max-concurrent"}, {"short",""},  {"kind","int"},   {"description","Parallel batch limit (default 4)"}},
     {{"name","queue"},          {"short",""},  {"kind","flag"},  {"description","Enqueue instead of sending now"}},
     {{"name","priority"},       {"short",""},  {"kind","value"}, {"description","Queue priority: low|normal|high|urgent"}},
     {{"name","no-wait"},        {"short",""},  {"kind","flag"},  {"description","Return once the transfer is accepted"}}
   })}},
  {{"verb","receive"}, {"description","Receive incoming file transfers"}, {"positionals","none"},
   {"subcommands", nlohmann::json::array()}, {"subcommand_required", false},
   {"options", nlohmann::json::array({
     {{"name","output"},      {"short","o"}, {"kind","value"}, {"description","Output directory"}},
     {{"name","auto-accept"}, {"short","a"}, {"kind","flag"},  {"description","Auto-accept from trusted peers"}},
     {{"name","from"},        {"short","f"}, {"kind","value"}, {"description","Only accept from a specific peer"}}
   })}},
  {{"verb","stream"}, {"description","Manage media streaming"}, {"positionals","none"},
   {"subcommands", nlohmann::json::array({"camera"})}, {"subcommand_required", true},
   {"options", nlohmann::json::array({
     {{"name","camera"},  {"short","c"}, {"kind","value"}, {"description","Camera device"}},
     {{"name","quality"}, {"short","q"}, {"kind","value"}, {"description","low|medium|high|ultra (default medium)"}},
     {{"name","record"},  {"short","r"}, {"kind","flag"},  {"description","Record the stream"}},
     {{"name","output"},  {"short","o"}, {"kind","value"}, {"description","Recording output file"}}
   })}},
  {{"verb","exec"}, {"description","Execute a command on a remote peer"}, {"positionals","any"},
   {"subcommands", nlohmann::json::array()}, {"subcommand_required", false},
   {"options", nlohmann::json::array({
     {{"name","peer"},        {"short","p"}, {"kind","value"}, {"description","Target peer name or ID"}},
     {{"name","interactive"}, {"short","i"}, {"kind","flag"},  {"description","Interactive mode"}},
     {{"name","timeout"},     {"short",""},  {"kind","int"},   {"description","Timeout in seconds"}}
   })}},
  {{"verb","peers"}, {"description","List and manage peers"}, {"positionals","none"},
   {"subcommands", nlohmann::json::array()}, {"subcommand_required", false},
   {"options", nlohmann::json::array({
     {{"name","watch"},    {"short","w"}, {"kind","flag"},  {"description","Watch for peer changes"}},
     {{"name","filter"},   {"short","f"}, {"kind","value"}, {"description","Filter peers by name, type or id"}},
     {{"name","trust"},    {"short",""},  {"kind","value"}, {"description","Add a peer to the trusted list"}},
     {{"name","untrust"},  {"short",""},  {"kind","value"}, {"description","Remove a peer from the trusted list"}},
     {{"name","block"},    {"short",""},  {"kind","value"}, {"description","Block a peer"}},
     {{"name","nickname"}, {"short",""},  {"kind","value"}, {"description","Nickname for --trust / --verify"}},
     {{"name","pair"},     {"short",""},  {"kind","flag"},  {"description","Generate a pairing code"}},
     {{"name","verify"},   {"short",""},  {"kind","value"}, {"description","Verify a pairing code (with --peer)"}},
     {{"name","peer"},     {"short","p"}, {"kind","value"}, {"description","Peer for --verify"}},
     {{"name","private"},  {"short",""},  {"kind","value"}, {"description","Private mode on|off"}},
     {{"name","invite"},   {"short",""},  {"kind","value"}, {"description","Generate an invite code for a peer"}}
   })}},
  {{"verb","status"}, {"description","Show system status"}, {"positionals","none"},
   {"subcommands", nlohmann::json::array()}, {"subcommand_required", false},
   {"options", nlohmann::json::array({
     {{"name","detailed"}, {"short","d"}, {"kind","flag"}, {"description","Show detailed information"}},
     {{"name","queue"},    {"short",""},  {"kind","flag"}, {"description","Show transfer queue statistics"}}
   })}},
  {{"verb","clipboard"}, {"description","Manage clipboard sharing"}, {"positionals","none"},
   {"subcommands", nlohmann::json::array({"share","status","history"})}, {"subcommand_required", true},
   {"options", nlohmann::json::array({
     {{"name","peer"},    {"short","p"}, {"kind","value"}, {"description","Peer to share with"}},
     {{"name","enable"},  {"short","e"}, {"kind","flag"},  {"description","Enable sharing"}},
     {{"name","disable"}, {"short","d"}, {"kind","flag"},  {"description","Disable sharing"}},
     {{"name","limit"},   {"short","l"}, {"kind","int"},   {"description","History entries to show"}},
     {{"name","search"},  {"short",""},  {"kind","value"}, {"description","Search clipboard history"}},
     {{"name","restore"}, {"short",""},  {"kind","value"}, {"description","Restore a history entry"}},
     {{"name","clear"},   {"short",""},  {"kind","flag"},  {"description","Clear clipboard history"}}
   })}},
  {{"verb","tui"}, {"description","Launch the interactive TUI"}, {"positionals","none"},
   {"subcommands", nlohmann::json::array()}, {"subcommand_required", false},
   {"options", nlohmann::json::array()}},
  {{"verb","config"}, {"description","Manage configuration"}, {"positionals","any"},
   {"subcommands", nlohmann::json::array({"get","set","list"})}, {"subcommand_required", true},
   {"options", nlohmann::json::array()}},
  {{"verb","completion"}, {"description","Generate shell completion scripts"}, {"positionals","none"},
   {"subcommands", nlohmann::json::array({"bash","zsh","fish","powershell"})}, {"subcommand_required", false},
   {"options", nlohmann::json::array({
     {{"name","line"}, {"short",""}, {"kind","value"}, {"description","Print completions for a partial command line"}}
   })}}
});

inline const nlohmann::json GLOBAL_OPTIONS = nlohmann::json::array({
  {{"name","format"},   {"short","f"}, {"kind","value"}, {"description","Output format: table|json|csv|minimal"}},
  {{"name","json"},     {"short","j"}, {"kind","flag"},  {"description","Shorthand for --format json"}},
  {{"name","verbose"},  {"short","v"}, {"kind","flag"},  {"description","Verbose diagnostics"}},
  {{"name","quiet"},    {"short","q"}, {"kind","flag"},  {"description","Suppress warnings"}},
  {{"name","pipeline"}, {"short",""},  {"kind","flag"},  {"description","Machine-readable output without decoration"}},
  {{"name","color"},    {"short",""},  {"kind","value"}, {"description","always|never|auto"}},
  {{"name","no-color"}, {"short",""},  {"kind","flag"},  {"description","Disable colour"}},
  {{"name","config"},   {"short",""},  {"kind","value"}, {"description","Configuration file path"}},
  {{"name","profile"},  {"short",""},  {"kind","value"}, {"description","Configuration profile to apply"}},
  {{"name","yes"},      {"short","y"}, {"kind","flag"},  {"description","Answer yes to confirmations"}},
  {{"name","help"},     {"short","h"}, {"kind","flag"},  {"description","Show help and exit"}}
});

struct ParsedCommand {
  std::string verb;
  std::optional<std::string> subcommand;
  std::vector<std::string> positional;
  std::map<std::string, std::string> options;
  std::set<std::string> flags;

  bool has_flag(const std::string& name) const { return flags.count(name) > 0; }
  std::optional<std::string> option(const std::string& name) const;
  std::optional<long long> int_option(const std::string& name) const;

  bool operator==(const ParsedCommand& other) const;
  bool operator!=(const ParsedCommand& other) const { return !(*this == other); }
};

class CommandParser {
public:
  explicit CommandParser(std::string process_name = "kizuna",
                         nlohmann::json command_spec = COMMAND_SPECIFICATION,
                         nlohmann::json global_spec = GLOBAL_OPTIONS);

  // Throws KizunaError (Parse, InvalidCommand, MissingArgument,
  // InvalidArgumentValue) with ranked suggestions where possible.
  ParsedCommand parse(const std::vector<std::string>& args) const;
  ParsedCommand parse(int argc, char* argv[]) const;

  // Inverse of parse: parse(format(cmd)) == cmd.
  std::vector<std::string> format(const ParsedCommand& command) const;

  std::string usage() const;
  std::string verb_usage(const std::string& verb) const;

  std::vector<std::string> verbs() const;
  std::vector<std::string> subcommands(const std::string& verb) const;
  std::vector<std::string> option_names(const std::string& verb) const;
  std::string verb_description(const std::string& verb) const;
  struct OptionRef {
    std::string name; // long name without dashes
    std::string kind;
  };
  // Looks up a "--name" or "-x" token; nullopt if unknown.
  std::optional<OptionRef> resolve_option(const std::string& verb, const std::string& token) const;

private:
  struct OptionSpec {
    std::string name;
    std::string short_name;
    std::string kind;
    std::string description;
  };

  struct VerbSpec {
    std::string verb;
    std::string description;
    std::string positionals;
    std::vector<std::string> subcommands;
    bool subcommand_required = false;
    std::vector<OptionSpec> options;
  };

  static std::vector<OptionSpec> build_option_specs(const nlohmann::json& spec);
  static std::vector<VerbSpec> build_verb_specs(const nlohmann::json& spec);

  const VerbSpec* find_verb(const std::string& verb) const;
  const OptionSpec* find_long(const VerbSpec* verb, const std::string& name) const;
  const OptionSpec* find_short(const VerbSpec* verb, const std::string& name) const;

  std::string process_name_;
  std::vector<VerbSpec> verbs_;
  std::vector<OptionSpec> globals_;
};
