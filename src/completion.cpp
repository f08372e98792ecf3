#include "completion.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>
#include <system_error>

#include "command_validator.hpp"
#include "errors.hpp"
#include "history.hpp"
#include "utils.hpp"

namespace {

bool starts_with_icase(const std::string& value, const std::string& prefix) {
  if(prefix.size() > value.size()) return false;
  for(std::size_t i = 0; i < prefix.size(); ++i) {
    if(std::tolower(static_cast<unsigned char>(value[i])) != std::tolower(static_cast<unsigned char>(prefix[i]))) {
      return false;
    }
  }
  return true;
}

std::vector<std::string> filter_prefix(const std::vector<std::string>& candidates, const std::string& prefix) {
  std::vector<std::string> out;
  for(const auto& candidate : candidates) {
    if(starts_with_icase(candidate, prefix)) out.push_back(candidate);
  }
  return out;
}

std::vector<std::string> split_words(const std::string& line) {
  std::vector<std::string> words;
  std::string current;
  for(char c : line) {
    if(std::isspace(static_cast<unsigned char>(c))) {
      if(!current.empty()) words.push_back(std::move(current));
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  if(!current.empty()) words.push_back(std::move(current));
  return words;
}

bool is_program_name(const std::string& word) {
  return word == "kizuna" || std::filesystem::path(word).filename() == "kizuna";
}

const std::set<std::string>& peer_valued_options() {
  static const std::set<std::string> options = {"peer", "from", "trust", "untrust", "block", "invite"};
  return options;
}

} // namespace

CompletionEngine::CompletionEngine(const CommandParser& parser, Sources sources)
  : parser_(parser),
    sources_(std::move(sources)),
    clock_([]{ return std::chrono::steady_clock::now(); }) {}

void CompletionEngine::set_clock(Clock clock) {
  clock_ = std::move(clock);
}

std::vector<std::string> CompletionEngine::complete(const std::string& line) {
  auto now = clock_();
  {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = cache_.find(line);
    if(it != cache_.end()) {
      if(now - it->second.stored_at < kCacheTtl) return it->second.candidates;
      cache_.erase(it);
    }
  }

  auto words = split_words(line);
  if(!words.empty() && is_program_name(words.front())) words.erase(words.begin());
  std::string current;
  bool trailing_space = !line.empty() && std::isspace(static_cast<unsigned char>(line.back()));
  if(!trailing_space && !words.empty()) {
    current = words.back();
    words.pop_back();
  }

  auto candidates = complete_words(words, current);
  std::lock_guard<std::mutex> lock(cache_mutex_);
  cache_[line] = CacheEntry{candidates, now};
  return candidates;
}

std::vector<std::string> CompletionEngine::complete_words(const std::vector<std::string>& words,
                                                          const std::string& current) const {
  if(words.empty()) {
    if(!current.empty() && current[0] == '-') return complete_option("", current);
    return complete_verb(current);
  }

  const auto& verb = words.front();
  auto known = parser_.verbs();
  if(std::find(known.begin(), known.end(), verb) == known.end()) {
    return complete_from_history(words, current);
  }

  const auto& previous = words.back();
  if(words.size() > 1 && !previous.empty() && previous[0] == '-') {
    auto option = parser_.resolve_option(verb, previous);
    if(option && option->kind != "flag") return complete_value(option->name, current);
  }

  if(!current.empty() && current[0] == '-') return complete_option(verb, current);

  auto subcommands = parser_.subcommands(verb);
  if(!subcommands.empty()) {
    bool has_sub = std::any_of(words.begin() + 1, words.end(), [&](const std::string& word){
      return std::find(subcommands.begin(), subcommands.end(), word) != subcommands.end();
    });
    if(!has_sub) return filter_prefix(subcommands, current);
    if(verb == "config" && sources_.config_keys && words.size() == 2 && words[1] != "list") {
      return filter_prefix(sources_.config_keys(), current);
    }
  }

  if(verb == "send") return complete_path(current);

  auto suggestions = complete_from_history(words, current);
  if(!suggestions.empty()) return suggestions;
  return complete_option(verb, current);
}

std::vector<std::string> CompletionEngine::complete_verb(const std::string& prefix) const {
  auto verbs = parser_.verbs();
  auto matches = filter_prefix(verbs, prefix);
  if(!matches.empty() || prefix.empty()) return matches;
  return rank_suggestions(to_lower(prefix), verbs, 2);
}

std::vector<std::string> CompletionEngine::complete_option(const std::string& verb, const std::string& prefix) const {
  std::vector<std::string> options;
  for(const auto& name : parser_.option_names(verb)) options.push_back("--" + name);
  return filter_prefix(options, prefix);
}

std::vector<std::string> CompletionEngine::complete_value(const std::string& option, const std::string& prefix) const {
  if(option == "format") return filter_prefix({"table", "json", "csv", "minimal"}, prefix);
  if(option == "color") return filter_prefix({"always", "never", "auto"}, prefix);
  if(option == "quality") return filter_prefix({"low", "medium", "high", "ultra"}, prefix);
  if(option == "priority") return filter_prefix({"low", "normal", "high", "urgent"}, prefix);
  if(option == "private") return filter_prefix({"on", "off"}, prefix);
  if(option == "type") return filter_prefix(CommandValidator::known_device_types(), prefix);
  if(option == "output" || option == "config") return complete_path(prefix);
  if(peer_valued_options().count(option) > 0) return complete_peer(prefix);
  return {};
}

std::vector<std::string> CompletionEngine::complete_path(const std::string& prefix) const {
  namespace fs = std::filesystem;
  fs::path typed(prefix);
  fs::path dir;
  std::string base;
  std::string shown_dir;
  if(prefix.empty()) {
    dir = ".";
  } else if(prefix.back() == '/') {
    dir = typed;
    shown_dir = prefix;
  } else {
    dir = typed.has_parent_path() ? typed.parent_path() : fs::path(".");
    base = typed.filename().string();
    if(typed.has_parent_path()) {
      shown_dir = typed.parent_path().string();
      if(shown_dir.back() != '/') shown_dir += "/";
    }
  }

  std::vector<std::string> out;
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if(ec) return out;
  for(const auto& entry : it) {
    auto name = entry.path().filename().string();
    if(name.rfind(base, 0) != 0) continue;
    if(!name.empty() && name[0] == '.' && (base.empty() || base[0] != '.')) continue;
    std::error_code type_ec;
    bool is_dir = entry.is_directory(type_ec);
    out.push_back(shown_dir + name + (is_dir ? "/" : ""));
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<std::string> CompletionEngine::complete_peer(const std::string& prefix) const {
  if(!sources_.peer_names) return {};
  auto names = sources_.peer_names();
  std::sort(names.begin(), names.end());
  names.erase(std::unique(names.begin(), names.end()), names.end());
  return filter_prefix(names, prefix);
}

std::vector<std::string> CompletionEngine::complete_from_history(const std::vector<std::string>& words,
                                                                 const std::string& current) const {
  if(!sources_.history) return {};
  auto typed = join(words, " ");
  std::vector<std::string> out;
  std::set<std::string> seen;
  for(const auto& command : sources_.history->suggest(typed)) {
    auto parts = split_words(command);
    if(parts.size() <= words.size()) continue;
    bool same = std::equal(words.begin(), words.end(), parts.begin());
    if(!same) continue;
    const auto& next = parts[words.size()];
    if(!starts_with_icase(next, current)) continue;
    if(seen.insert(next).second) out.push_back(next);
  }
  return out;
}

void CompletionEngine::clear_cache() {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  cache_.clear();
}

std::size_t CompletionEngine::cache_size() const {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  return cache_.size();
}

const std::vector<std::string>& CompletionEngine::shells() {
  static const std::vector<std::string> supported = {"bash", "zsh", "fish", "powershell"};
  return supported;
}

std::string CompletionEngine::script(const std::string& shell) {
  if(shell == "bash") {
    return R"(_kizuna_complete() {
  local IFS=$'\n'
  COMPREPLY=( $(kizuna completion --line "${COMP_LINE:0:$COMP_POINT}" 2>/dev/null) )
}
complete -o default -F _kizuna_complete kizuna
)";
  }
  if(shell == "zsh") {
    return R"(#compdef kizuna
_kizuna() {
  local -a candidates
  candidates=("${(@f)$(kizuna completion --line "$BUFFER" 2>/dev/null)}")
  compadd -a candidates
}
compdef _kizuna kizuna
)";
  }
  if(shell == "fish") {
    return R"(complete -c kizuna -f -a '(kizuna completion --line (commandline -cp) 2>/dev/null)'
)";
  }
  if(shell == "powershell") {
    return R"ps(Register-ArgumentCompleter -Native -CommandName kizuna -ScriptBlock {
  param($wordToComplete, $commandAst, $cursorPosition)
  kizuna completion --line "$($commandAst.ToString())" 2>$null | ForEach-Object {
    [System.Management.Automation.CompletionResult]::new($_, $_, 'ParameterValue', $_)
  }
}
)ps";
  }
  throw KizunaError::invalid_argument_value("shell", "expected one of bash, zsh, fish, powershell");
}
