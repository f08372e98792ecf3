#include "command_parser.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include "errors.hpp"
#include "utils.hpp"

namespace {

bool parse_integer(const std::string& text, long long& out) {
  if(text.empty()) return false;
  try {
    std::size_t consumed = 0;
    out = std::stoll(text, &consumed);
    return consumed == text.size();
  } catch(const std::exception&) {
    return false;
  }
}

} // namespace

std::optional<std::string> ParsedCommand::option(const std::string& name) const {
  auto it = options.find(name);
  if(it == options.end()) return std::nullopt;
  return it->second;
}

std::optional<long long> ParsedCommand::int_option(const std::string& name) const {
  auto value = option(name);
  if(!value) return std::nullopt;
  long long parsed = 0;
  if(!parse_integer(*value, parsed)) return std::nullopt;
  return parsed;
}

bool ParsedCommand::operator==(const ParsedCommand& other) const {
  return verb == other.verb &&
         subcommand == other.subcommand &&
         positional == other.positional &&
         options == other.options &&
         flags == other.flags;
}

CommandParser::CommandParser(std::string process_name,
                             nlohmann::json command_spec,
                             nlohmann::json global_spec)
  : process_name_(std::move(process_name)),
    verbs_(build_verb_specs(command_spec)),
    globals_(build_option_specs(global_spec)) {}

std::vector<CommandParser::OptionSpec> CommandParser::build_option_specs(const nlohmann::json& spec) {
  std::vector<OptionSpec> result;
  for(const auto& entry : spec) {
    OptionSpec out;
    out.name = entry.at("name").get<std::string>();
    out.short_name = entry.value("short", "");
    out.kind = entry.at("kind").get<std::string>();
    out.description = entry.value("description", "");
    if(out.kind != "flag" && out.kind != "value" && out.kind != "int") {
      throw std::runtime_error("Option specification '" + out.name + "' has unknown kind '" + out.kind + "'");
    }
    result.push_back(std::move(out));
  }
  return result;
}

std::vector<CommandParser::VerbSpec> CommandParser::build_verb_specs(const nlohmann::json& spec) {
  std::vector<VerbSpec> result;
  for(const auto& entry : spec) {
    VerbSpec out;
    out.verb = entry.at("verb").get<std::string>();
    out.description = entry.value("description", "");
    out.positionals = entry.value("positionals", "none");
    out.subcommands = entry.value("subcommands", std::vector<std::string>{});
    out.subcommand_required = entry.value("subcommand_required", false);
    out.options = build_option_specs(entry.value("options", nlohmann::json::array()));
    result.push_back(std::move(out));
  }
  return result;
}

const CommandParser::VerbSpec* CommandParser::find_verb(const std::string& verb) const {
  for(const auto& spec : verbs_) {
    if(spec.verb == verb) return &spec;
  }
  return nullptr;
}

const CommandParser::OptionSpec* CommandParser::find_long(const VerbSpec* verb, const std::string& name) const {
  if(verb) {
    for(const auto& spec : verb->options) {
      if(spec.name == name) return &spec;
    }
  }
  for(const auto& spec : globals_) {
    if(spec.name == name) return &spec;
  }
  return nullptr;
}

std::optional<CommandParser::OptionRef> CommandParser::resolve_option(const std::string& verb, const std::string& token) const {
  const auto* verb_spec = find_verb(verb);
  const OptionSpec* spec = nullptr;
  if(token.rfind("--", 0) == 0) {
    spec = find_long(verb_spec, token.substr(2));
  } else if(token.size() == 2 && token[0] == '-') {
    spec = find_short(verb_spec, token.substr(1));
  }
  if(!spec) return std::nullopt;
  return OptionRef{spec->name, spec->kind};
}

const CommandParser::OptionSpec* CommandParser::find_short(const VerbSpec* verb, const std::string& name) const {
  if(name.empty()) return nullptr;
  if(verb) {
    for(const auto& spec : verb->options) {
      if(spec.short_name == name) return &spec;
    }
  }
  for(const auto& spec : globals_) {
    if(spec.short_name == name) return &spec;
  }
  return nullptr;
}

std::vector<std::string> CommandParser::verbs() const {
  std::vector<std::string> out;
  for(const auto& spec : verbs_) out.push_back(spec.verb);
  return out;
}

std::vector<std::string> CommandParser::subcommands(const std::string& verb) const {
  if(const auto* spec = find_verb(verb)) return spec->subcommands;
  return {};
}

std::vector<std::string> CommandParser::option_names(const std::string& verb) const {
  std::vector<std::string> out;
  if(const auto* spec = find_verb(verb)) {
    for(const auto& opt : spec->options) out.push_back(opt.name);
  }
  for(const auto& opt : globals_) {
    if(std::find(out.begin(), out.end(), opt.name) == out.end()) out.push_back(opt.name);
  }
  return out;
}

std::string CommandParser::verb_description(const std::string& verb) const {
  if(const auto* spec = find_verb(verb)) return spec->description;
  return {};
}

ParsedCommand CommandParser::parse(int argc, char* argv[]) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  return parse(args);
}

ParsedCommand CommandParser::parse(const std::vector<std::string>& args) const {
  ParsedCommand cmd;
  const VerbSpec* verb = nullptr;
  bool positional_only = false;

  auto add_positional = [&](const std::string& token){
    if(!verb) {
      throw KizunaError::missing_argument("command");
    }
    if(verb->positionals == "none") {
      throw KizunaError::parse("Unexpected argument '" + token + "' for '" + verb->verb + "'", token);
    }
    cmd.positional.push_back(token);
  };

  auto unknown_option = [&](const std::string& token, const std::string& name){
    std::vector<std::string> suggestions;
    for(auto& candidate : rank_suggestions(name, option_names(verb ? verb->verb : std::string()), 2)) {
      suggestions.push_back("--" + candidate);
    }
    std::string context = verb ? " for '" + verb->verb + "'" : std::string();
    throw KizunaError::parse("Unknown option '" + token + "'" + context, token, std::move(suggestions));
  };

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(positional_only) {
      add_positional(token);
      continue;
    }

    if(token == "--") {
      positional_only = true;
      continue;
    }

    const OptionSpec* spec = nullptr;
    std::optional<std::string> inline_value;
    if(token.rfind("--", 0) == 0) {
      std::string name = token.substr(2);
      auto eq = name.find('=');
      if(eq != std::string::npos) {
        inline_value = name.substr(eq + 1);
        name = name.substr(0, eq);
      }
      spec = find_long(verb, name);
      if(!spec) unknown_option(token, name);
    } else if(token.size() > 1 && token[0] == '-') {
      spec = find_short(verb, token.substr(1));
      if(!spec) unknown_option(token, token.substr(1));
    }

    if(spec) {
      if(spec->kind == "flag") {
        if(inline_value) {
          throw KizunaError::parse("Option '--" + spec->name + "' does not take a value", token);
        }
        cmd.flags.insert(spec->name);
        continue;
      }
      std::string value;
      if(inline_value) {
        value = *inline_value;
      } else {
        if(i + 1 >= args.size()) {
          throw KizunaError::missing_argument("value for --" + spec->name);
        }
        value = args[++i];
      }
      if(spec->kind == "int") {
        long long parsed = 0;
        if(!parse_integer(value, parsed)) {
          throw KizunaError::invalid_argument_value("--" + spec->name,
                                                    "expected an integer, got '" + value + "'");
        }
      }
      cmd.options[spec->name] = value;
      continue;
    }

    if(!verb) {
      if(token == "help") {
        cmd.flags.insert("help");
        continue;
      }
      verb = find_verb(token);
      if(!verb) {
        throw KizunaError::invalid_command(token, rank_suggestions(token, verbs(), 3));
      }
      cmd.verb = token;
      continue;
    }

    if(!verb->subcommands.empty() && !cmd.subcommand && cmd.positional.empty()) {
      if(std::find(verb->subcommands.begin(), verb->subcommands.end(), token) != verb->subcommands.end()) {
        cmd.subcommand = token;
        continue;
      }
      if(verb->subcommand_required || verb->positionals == "none") {
        throw KizunaError::invalid_command(verb->verb + " " + token,
                                           rank_suggestions(token, verb->subcommands, 3));
      }
    }
    add_positional(token);
  }

  if(!verb) {
    if(cmd.has_flag("help")) return cmd;
    throw KizunaError::missing_argument("command");
  }
  if(verb->subcommand_required && !cmd.subcommand && !cmd.has_flag("help")) {
    throw KizunaError::missing_argument(verb->verb + " subcommand (" + join(verb->subcommands, "|") + ")");
  }
  return cmd;
}

std::vector<std::string> CommandParser::format(const ParsedCommand& command) const {
  std::vector<std::string> tokens;
  if(!command.verb.empty()) tokens.push_back(command.verb);
  if(command.subcommand) tokens.push_back(*command.subcommand);
  for(const auto& [name, value] : command.options) {
    tokens.push_back("--" + name);
    tokens.push_back(value);
  }
  for(const auto& flag : command.flags) {
    tokens.push_back("--" + flag);
  }
  if(!command.positional.empty()) {
    tokens.push_back("--");
    tokens.insert(tokens.end(), command.positional.begin(), command.positional.end());
  }
  return tokens;
}

namespace {

void append_options(std::ostringstream& out, const std::vector<std::string>& lines) {
  for(const auto& line : lines) out << line << "\n";
}

} // namespace

std::string CommandParser::usage() const {
  std::ostringstream out;
  out << process_name_ << " - peer-to-peer device connectivity\n";
  out << "Usage:\n";
  out << "  " << process_name_ << " <command> [subcommand] [options] [arguments]\n\n";
  out << "Commands:\n";
  for(const auto& spec : verbs_) {
    std::string label = spec.verb;
    if(!spec.subcommands.empty()) label += " {" + join(spec.subcommands, "|") + "}";
    out << "  " << label << std::string(label.size() < 34 ? 34 - label.size() : 1, ' ')
        << spec.description << "\n";
  }
  out << "\nGlobal options:\n";
  std::vector<std::string> lines;
  for(const auto& opt : globals_) {
    std::string label = "--" + opt.name;
    if(!opt.short_name.empty()) label = "-" + opt.short_name + ", " + label;
    if(opt.kind != "flag") label += opt.kind == "int" ? " <n>" : " <value>";
    lines.push_back("  " + label + std::string(label.size() < 34 ? 34 - label.size() : 1, ' ') + opt.description);
  }
  append_options(out, lines);
  out << "\nRun '" << process_name_ << " <command> --help' for command options.\n";
  return out.str();
}

std::string CommandParser::verb_usage(const std::string& verb) const {
  const auto* spec = find_verb(verb);
  if(!spec) return usage();
  std::ostringstream out;
  out << process_name_ << " " << spec->verb << " - " << spec->description << "\n";
  out << "Usage:\n  " << process_name_ << " " << spec->verb;
  if(!spec->subcommands.empty()) out << " {" << join(spec->subcommands, "|") << "}";
  out << " [options]";
  if(spec->positionals != "none") out << " [arguments...]";
  out << "\n\nOptions:\n";
  std::vector<std::string> lines;
  for(const auto& opt : spec->options) {
    std::string label = "--" + opt.name;
    if(!opt.short_name.empty()) label = "-" + opt.short_name + ", " + label;
    if(opt.kind != "flag") label += opt.kind == "int" ? " <n>" : " <value>";
    lines.push_back("  " + label + std::string(label.size() < 34 ? 34 - label.size() : 1, ' ') + opt.description);
  }
  if(lines.empty()) lines.push_back("  (none)");
  append_options(out, lines);
  return out.str();
}
