#include "command_parser.hpp"
#include "command_validator.hpp"
#include "completion.hpp"
#include "config_manager.hpp"
#include "errors.hpp"
#include "history.hpp"
#include "json_store.hpp"
#include "lan_discovery.hpp"
#include "local_clipboard.hpp"
#include "local_security.hpp"
#include "output_formatter.hpp"
#include "pipeline_io.hpp"
#include "protocol.hpp"
#include "stream_registry.hpp"
#include "test_runner_utils.hpp"
#include "types.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <sstream>
#include <string>
#include <vector>

using kizuna::test::TestCase;
using kizuna::test::TestContext;
using kizuna::test::ScratchDir;
using kizuna::test::caught;
using kizuna::test::check;
using kizuna::test::contains;
using kizuna::test::throws_kind;
using kizuna::test::write_file;

namespace {

bool has(const std::vector<std::string>& values, const std::string& value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

// ---- errors and types ------------------------------------------------------

bool test_error_exit_codes(TestContext& ctx) {
  auto usage = KizunaError::invalid_command("sned", {"send"});
  auto integration = KizunaError::integration(IntegrationDomain::Discovery, "no route");
  auto security = KizunaError::integration(IntegrationDomain::Security, "denied");
  auto cancelled = KizunaError::cancelled();

  bool ok = true;
  ok &= check(ctx, std::string(usage.what()) == "Invalid command: sned", "invalid command message");
  ok &= check(ctx, usage.exit_code() == kExitUsage && usage.is_usage_error(), "usage exit");
  ok &= check(ctx, usage.suggestions() == std::vector<std::string>{"send"}, "suggestions kept");
  ok &= check(ctx, integration.exit_code() == kExitIntegration, "integration exit");
  ok &= check(ctx, contains(integration.what(), "Discovery"), "domain in message");
  ok &= check(ctx, integration.is_transient() && !security.is_transient(), "transient domains");
  ok &= check(ctx, cancelled.exit_code() == kExitCancelled, "cancel exit");
  ok &= check(ctx, KizunaError::config("bad").exit_code() == kExitUsage, "config exit");
  ok &= check(ctx, KizunaError::invalid_argument_value("--timeout", "must be positive").field() == "--timeout",
              "field recorded");
  return ok;
}

bool test_progress_percentage(TestContext& ctx) {
  ProgressInfo progress;
  progress.current = 50;
  bool ok = check(ctx, !progress.percentage(), "no total");
  progress.total = 0;
  ok &= check(ctx, !progress.percentage(), "zero total");
  progress.total = 200;
  ok &= check(ctx, progress.percentage() && *progress.percentage() == 25.0, "quarter");
  progress.current = 500;
  ok &= check(ctx, *progress.percentage() == 100.0, "clamped");
  ok &= check(ctx, OperationState::failed("x").is_terminal() && !OperationState::in_progress().is_terminal(),
              "terminal states");
  return ok;
}

bool test_peer_json(TestContext& ctx) {
  PeerInfo peer;
  peer.id = "abc";
  peer.name = "laptop";
  peer.capabilities = {"file_transfer"};
  peer.connection_status = ConnectionStatus::Connected;
  peer.trust_status = TrustStatus::Trusted;
  nlohmann::json j = peer;
  auto back = j.get<PeerInfo>();
  bool ok = check(ctx, j["connection_status"] == "Connected", "status rendered");
  ok &= check(ctx, back.id == "abc" && back.trust_status == TrustStatus::Trusted, "peer read back");
  auto minimal = nlohmann::json{{"id", "xyz"}}.get<PeerInfo>();
  ok &= check(ctx, minimal.name == "xyz" && minimal.device_type == "unknown", "defaults for sparse peer");
  return ok;
}

// ---- output ----------------------------------------------------------------

bool test_format_helpers(TestContext& ctx) {
  bool ok = true;
  ok &= check(ctx, format_bytes(512) == "512 B", "bytes");
  ok &= check(ctx, format_bytes(1536) == "1.50 KB", "kilobytes");
  ok &= check(ctx, format_bytes(1048576) == "1.00 MB", "megabytes");
  ok &= check(ctx, format_rate(2048.0) == "2.00 KB/s", "rate");
  ok &= check(ctx, format_duration(std::chrono::seconds(42)) == "42s", "seconds");
  ok &= check(ctx, format_duration(std::chrono::seconds(75)) == "1m 15s", "minutes");
  ok &= check(ctx, format_duration(std::chrono::seconds(3725)) == "1h 2m", "hours");
  ok &= check(ctx, truncate_display("abcdefgh", 5) == "ab...", "truncate");
  ok &= check(ctx, display_width("✓ ok") == 4, "utf8 width");
  return ok;
}

bool test_table_rendering(TestContext& ctx) {
  StyleManager plain(ColorMode::Never, false);
  TableData table{{"name", "type"}, {{"laptop", "desktop"}, {"phone", "mobile"}}};
  auto rendered = TableFormatter(plain, 80).render(table);
  bool ok = check(ctx, contains(rendered, "┌") && contains(rendered, "└"), "borders");
  ok &= check(ctx, contains(rendered, "│ laptop │"), "padded cell");
  ok &= check(ctx, !contains(rendered, "\x1b["), "no colour");

  TableData wide{{"a", "b"}, {{std::string(100, 'x'), std::string(100, 'y')}}};
  auto widths = TableFormatter(plain, 40).column_widths(wide);
  ok &= check(ctx, widths[0] + widths[1] + 7 <= 40, "fits narrow terminal");

  TableData crowded;
  for(int i = 0; i < 8; ++i) {
    crowded.headers.push_back("column" + std::to_string(i));
  }
  crowded.rows.push_back(std::vector<std::string>(8, std::string(12, 'z')));
  auto crowded_widths = TableFormatter(plain, 30).column_widths(crowded);
  std::size_t crowded_total = 3 * crowded_widths.size() + 1;
  for(auto w : crowded_widths) crowded_total += w;
  ok &= check(ctx, crowded_total <= 30 && !crowded_widths.empty(), "many columns capped to the width");
  bool lines_fit = true;
  for(const auto& line : split(TableFormatter(plain, 30).render(crowded), '\n')) {
    lines_fit = lines_fit && display_width(line) <= 30;
  }
  ok &= check(ctx, lines_fit, "rendered lines fit");
  return ok;
}

bool test_formatter_modes(TestContext& ctx) {
  TableData table{{"id", "note"}, {{"1", "a,b"}, {"2", "say \"hi\""}}};
  auto output = CommandOutput::make_table(table);

  auto json_text = OutputFormatter(OutputFormat::Json, ColorMode::Never).render(output);
  auto parsed = nlohmann::json::parse(json_text);
  bool ok = check(ctx, parsed.is_array() && parsed[0]["note"] == "a,b", "json rows");

  auto csv = OutputFormatter(OutputFormat::Csv, ColorMode::Never).render(output);
  ok &= check(ctx, contains(csv, "\"a,b\"") && contains(csv, "\"say \"\"hi\"\"\""), "csv quoting");
  auto back = parse_csv(csv);
  ok &= check(ctx, back.headers == table.headers && back.rows == table.rows, "csv read back");

  TableData sparse{{"note"}, {{"x"}, {""}, {"y"}}};
  auto sparse_back = parse_csv(OutputFormatter(OutputFormat::Csv, ColorMode::Never).render(CommandOutput::make_table(sparse)));
  ok &= check(ctx, sparse_back.rows.size() == 3 && sparse_back.rows == sparse.rows, "empty single-column cell kept");
  TableData gaps{{"id", "note"}, {{"1", ""}, {"", ""}}};
  auto gaps_back = parse_csv(OutputFormatter(OutputFormat::Csv, ColorMode::Never).render(CommandOutput::make_table(gaps)));
  ok &= check(ctx, gaps_back.rows == gaps.rows, "empty cells read back");

  auto minimal = OutputFormatter(OutputFormat::Minimal, ColorMode::Never).render(output);
  ok &= check(ctx, minimal == "1\ta,b\n2\tsay \"hi\"\n", "minimal");

  auto text = OutputFormatter(OutputFormat::Json, ColorMode::Never, true).render(CommandOutput::make_text("done"));
  ok &= check(ctx, text == "{\"message\":\"done\"}", "text as json in pipeline");
  ok &= check(ctx, throws_kind(ErrorKind::Format, []{ parse_csv("a,\"b\n"); }), "unterminated csv");
  return ok;
}

bool test_progress_rendering(TestContext& ctx) {
  StyleManager plain(ColorMode::Never, false);
  ProgressRenderer renderer(plain);
  ProgressInfo progress;
  progress.current = 512;
  progress.total = 1024;
  progress.rate = 1024.0;
  progress.eta = std::chrono::seconds(1);
  auto line = renderer.render(progress, std::chrono::milliseconds(0));
  bool ok = check(ctx, contains(line, "50.0%"), "percent");
  ok &= check(ctx, contains(line, "512 B / 1.00 KB | 1.00 KB/s | ETA: 1s"), "status line");
  progress.total.reset();
  auto spinner = renderer.render(progress, std::chrono::milliseconds(300));
  ok &= check(ctx, !contains(spinner, "%"), "indeterminate has no percent");
  ok &= check(ctx, contains(renderer.render_bar(150.0), "100.0%"), "bar clamps");
  return ok;
}

// ---- parser and validator --------------------------------------------------

bool test_parse_send(TestContext& ctx) {
  CommandParser parser;
  auto cmd = parser.parse({"send", "a.txt", "b.txt", "--peer", "laptop", "--no-compression", "-j"});
  bool ok = check(ctx, cmd.verb == "send", "verb");
  ok &= check(ctx, cmd.positional == std::vector<std::string>{"a.txt", "b.txt"}, "files");
  ok &= check(ctx, cmd.option("peer") == std::optional<std::string>("laptop"), "peer");
  ok &= check(ctx, cmd.has_flag("no-compression") && cmd.has_flag("json"), "flags");
  ok &= check(ctx, parser.parse(parser.format(cmd)) == cmd, "format inverts parse");

  auto inline_value = parser.parse({"discover", "--timeout=5", "--type", "laptop"});
  ok &= check(ctx, inline_value.int_option("timeout") == std::optional<long long>(5), "inline value");
  auto dashed = parser.parse({"exec", "--peer", "srv", "--", "ls", "-la"});
  ok &= check(ctx, dashed.positional == std::vector<std::string>{"ls", "-la"}, "after --");
  auto stdin_marker = parser.parse({"send", "-", "--peer", "x"});
  ok &= check(ctx, stdin_marker.positional == std::vector<std::string>{"-"}, "lone dash is positional");
  return ok;
}

bool test_parse_errors(TestContext& ctx) {
  CommandParser parser;
  auto typo = caught([&]{ parser.parse({"sned", "x"}); });
  bool ok = check(ctx, typo && typo->kind() == ErrorKind::InvalidCommand, "unknown verb");
  ok &= check(ctx, typo && has(typo->suggestions(), "send"), "verb suggestion");

  auto option = caught([&]{ parser.parse({"discover", "--colr", "never"}); });
  ok &= check(ctx, option && option->kind() == ErrorKind::Parse && has(option->suggestions(), "--color"),
              "option suggestion");
  ok &= check(ctx, throws_kind(ErrorKind::InvalidArgumentValue, [&]{ parser.parse({"discover", "--timeout", "soon"}); }),
              "int option");
  ok &= check(ctx, throws_kind(ErrorKind::MissingArgument, [&]{ parser.parse({"send", "--peer"}); }), "missing value");
  ok &= check(ctx, throws_kind(ErrorKind::MissingArgument, [&]{ parser.parse({"clipboard"}); }), "missing subcommand");
  ok &= check(ctx, throws_kind(ErrorKind::InvalidCommand, [&]{ parser.parse({"stream", "screen"}); }), "bad subcommand");
  ok &= check(ctx, throws_kind(ErrorKind::Parse, [&]{ parser.parse({"status", "extra"}); }), "unexpected positional");
  ok &= check(ctx, throws_kind(ErrorKind::Parse, [&]{ parser.parse({"status", "--detailed=yes"}); }), "flag with value");
  ok &= check(ctx, throws_kind(ErrorKind::MissingArgument, [&]{ parser.parse(std::vector<std::string>{}); }), "empty");
  return ok;
}

bool test_usage_text(TestContext& ctx) {
  CommandParser parser("kizuna");
  auto usage = parser.usage();
  bool ok = check(ctx, contains(usage, "clipboard {share|status|history}"), "subcommands listed");
  ok &= check(ctx, contains(usage, "--format <value>"), "globals listed");
  auto verb = parser.verb_usage("send");
  ok &= check(ctx, contains(verb, "-p, --peer <value>") && contains(verb, "[arguments...]"), "verb usage");
  auto help = parser.parse({"send", "--help"});
  ok &= check(ctx, help.has_flag("help"), "help flag parsed");
  return ok;
}

bool test_validate_send(TestContext& ctx) {
  ScratchDir dir("validate_send");
  write_file(dir / "a.txt", "hello");
  CommandParser parser;
  auto file = (dir / "a.txt").string();

  auto no_peer = parser.parse({"send", file});
  bool ok = check(ctx, throws_kind(ErrorKind::MissingArgument, [&]{ CommandValidator().validate(no_peer); }),
                  "peer required");
  CommandValidator::Context with_default;
  with_default.default_peer = "laptop";
  ok &= check(ctx, CommandValidator(with_default).validate(no_peer).warnings.empty(), "default peer used");

  auto missing = parser.parse({"send", (dir / "nope.txt").string(), "--peer", "x"});
  ok &= check(ctx, throws_kind(ErrorKind::InvalidArgumentValue, [&]{ CommandValidator().validate(missing); }),
              "missing file");
  auto directory = parser.parse({"send", dir.path().string(), "--peer", "x"});
  ok &= check(ctx, throws_kind(ErrorKind::InvalidArgumentValue, [&]{ CommandValidator().validate(directory); }),
              "directory rejected");

  auto insecure = CommandValidator().validate(parser.parse({"send", file, "--peer", "x", "--no-encryption"}));
  ok &= check(ctx, insecure.warnings.size() == 1 && insecure.warnings[0].suggestion.has_value(), "encryption warning");

  auto batch = parser.parse({"send", "--batch"});
  ok &= check(ctx, CommandValidator().validate(batch).warnings.empty(), "batch needs no peer");
  auto batch_files = parser.parse({"send", "--batch", file});
  ok &= check(ctx, throws_kind(ErrorKind::Parse, [&]{ CommandValidator().validate(batch_files); }),
              "batch with files");
  auto priority = parser.parse({"send", file, "--peer", "x", "--priority", "asap", "--queue"});
  ok &= check(ctx, throws_kind(ErrorKind::InvalidArgumentValue, [&]{ CommandValidator().validate(priority); }),
              "bad priority");
  return ok;
}

bool test_validate_other_verbs(TestContext& ctx) {
  CommandParser parser;
  CommandValidator validator;
  bool ok = true;

  auto risky = validator.validate(parser.parse({"exec", "--peer", "srv", "--", "rm", "-rf", "/tmp/x"}));
  ok &= check(ctx, risky.warnings.size() == 1 && risky.warnings[0].field == "command", "destructive warning");
  ok &= check(ctx, throws_kind(ErrorKind::InvalidArgumentValue, [&]{
    validator.validate(parser.parse({"exec", "--peer", "srv", "--timeout", "0", "uptime"}));
  }), "exec timeout");

  auto phone = validator.validate(parser.parse({"discover", "--type", "laptp"}));
  ok &= check(ctx, phone.warnings.size() == 1 && phone.warnings[0].suggestion &&
                   contains(*phone.warnings[0].suggestion, "laptop"), "device type hint");
  ok &= check(ctx, throws_kind(ErrorKind::InvalidArgumentValue, [&]{
    validator.validate(parser.parse({"discover", "--timeout", "0"}));
  }), "discover timeout");

  ok &= check(ctx, throws_kind(ErrorKind::Parse, [&]{
    validator.validate(parser.parse({"peers", "--trust", "a", "--block", "b"}));
  }), "one peers action");
  ok &= check(ctx, throws_kind(ErrorKind::MissingArgument, [&]{
    validator.validate(parser.parse({"peers", "--verify", "123456"}));
  }), "verify needs peer");
  ok &= check(ctx, throws_kind(ErrorKind::InvalidArgumentValue, [&]{
    validator.validate(parser.parse({"clipboard", "share", "--enable", "--disable"}));
  }), "share exclusive");
  ok &= check(ctx, throws_kind(ErrorKind::InvalidArgumentValue, [&]{
    validator.validate(parser.parse({"status", "--format", "xml"}));
  }), "format value");
  ok &= check(ctx, throws_kind(ErrorKind::MissingArgument, [&]{
    validator.validate(parser.parse({"config", "set", "compression"}));
  }), "config set arity");

  auto record = validator.validate(parser.parse({"stream", "camera", "--record", "--output", "clip.txt"}));
  ok &= check(ctx, std::any_of(record.warnings.begin(), record.warnings.end(),
                               [](const ValidationWarning& w){ return w.suggestion.has_value(); }),
              "video extension hint");
  auto both = validator.validate(parser.parse({"status", "-v", "-q"}));
  ok &= check(ctx, both.warnings.size() == 1, "verbose and quiet");
  return ok;
}

// ---- configuration ---------------------------------------------------------

const char* kSampleConfig = R"(
default_peer = "laptop"
output_format = "json"

[transfer_settings]
compression = false
max_concurrent = 2

[network]
device_name = "studio"

[profiles.base]
description = "Base"
[profiles.base.settings]
color_mode = "never"

[profiles.work]
description = "Work"
parent = "base"
[profiles.work.settings]
output_format = "csv"
compression = true
)";

bool test_config_defaults_and_parse(TestContext& ctx) {
  ScratchDir dir("config_parse");
  ConfigManager manager(dir / "config.toml");
  bool ok = check(ctx, manager.load() == CLIConfig{}, "missing file gives defaults");

  auto config = manager.parse(kSampleConfig);
  ok &= check(ctx, config.default_peer == std::optional<std::string>("laptop"), "default peer");
  ok &= check(ctx, config.output_format == OutputFormat::Json, "format");
  ok &= check(ctx, !config.transfer.compression && config.transfer.max_concurrent == 2, "transfer table");
  ok &= check(ctx, config.transfer.encryption, "unset keys keep defaults");
  ok &= check(ctx, config.network.device_name == "studio" && config.network.listen_port == 47801, "network");
  ok &= check(ctx, config.profiles.size() == 2 && config.profiles.at("work").parent == std::optional<std::string>("base"),
              "profiles");

  auto work = manager.apply_profile(config, "work");
  ok &= check(ctx, work.output_format == OutputFormat::Csv && work.transfer.compression, "profile settings");
  ok &= check(ctx, work.color_mode == ColorMode::Never, "parent settings");
  auto unknown = caught([&]{ manager.apply_profile(config, "wrk"); });
  ok &= check(ctx, unknown && unknown->kind() == ErrorKind::Config && has(unknown->suggestions(), "work"),
              "profile suggestion");
  return ok;
}

bool test_config_errors(TestContext& ctx) {
  ConfigManager manager("/nonexistent/kizuna.toml");
  bool ok = true;
  ok &= check(ctx, throws_kind(ErrorKind::Config, [&]{ manager.parse("output_format = "); }), "syntax error");
  ok &= check(ctx, throws_kind(ErrorKind::Config, [&]{ manager.parse("[transfer_settings]\nmax_concurrent = 0\n"); }),
              "max_concurrent floor");
  ok &= check(ctx, throws_kind(ErrorKind::Config, [&]{ manager.parse("[network]\nlisten_port = 70000\n"); }),
              "port range");
  ok &= check(ctx, throws_kind(ErrorKind::Config, [&]{ manager.parse("[transfer_settings]\ncompression = \"yes\"\n"); }),
              "type mismatch");
  ok &= check(ctx, throws_kind(ErrorKind::Config, [&]{
    manager.parse("[profiles.a]\nparent = \"b\"\n[profiles.b]\nparent = \"c\"\n[profiles.c]\n");
  }), "one level of inheritance");

  CLIConfig config;
  ok &= check(ctx, throws_kind(ErrorKind::Config, [&]{ manager.set_value(config, "compression", "maybe"); }),
              "bool literal");
  auto typo = caught([&]{ manager.get_value(config, "compresion"); });
  ok &= check(ctx, typo && !typo->suggestions().empty() && typo->suggestions().front() == "compression",
              "key suggestion");
  return ok;
}

bool test_config_values_and_save(TestContext& ctx) {
  ScratchDir dir("config_save");
  ConfigManager manager(dir / "nested" / "config.toml");
  CLIConfig config;
  manager.set_value(config, "peer", "desk");
  manager.set_value(config, "quality", "HIGH");
  manager.set_value(config, "port", "50000");
  manager.set_value(config, "allow_remote", "yes");
  bool ok = check(ctx, manager.get_value(config, "default_peer") == "desk", "alias set");
  ok &= check(ctx, manager.get_value(config, "stream_settings.default_quality") == "high", "quality lowered");
  ok &= check(ctx, manager.get_value(config, "listen_port") == "50000", "int value");
  ok &= check(ctx, manager.get_value(config, "exec.allow_remote") == "true", "bool value");
  ok &= check(ctx, manager.list(config).size() == manager.keys().size(), "list covers keys");

  manager.save(config);
  ok &= check(ctx, manager.exists() && manager.load() == config, "saved config reloads");
  ok &= check(ctx, !manager.write_default_file(), "template not written over config");

  ConfigManager fresh(dir / "fresh.toml");
  ok &= check(ctx, fresh.write_default_file(), "template written");
  ok &= check(ctx, fresh.load() == CLIConfig{}, "template is all defaults");
  return ok;
}

bool test_config_precedence(TestContext& ctx) {
  ScratchDir dir("config_resolve");
  write_file(dir / "config.toml", kSampleConfig);
  ConfigManager manager(dir / "config.toml");
  CommandParser parser;

  auto plain = manager.resolve(parser.parse({"status"}));
  bool ok = check(ctx, plain.output_format == OutputFormat::Json, "file layer");
  auto profile = manager.resolve(parser.parse({"status", "--profile", "work"}));
  ok &= check(ctx, profile.output_format == OutputFormat::Csv, "profile layer");
  auto cli = manager.resolve(parser.parse({"status", "--profile", "work", "--format", "minimal"}));
  ok &= check(ctx, cli.output_format == OutputFormat::Minimal, "command line layer");
  auto send = manager.resolve(parser.parse({"send", "x", "--peer", "p", "--no-encryption", "--pipeline"}));
  ok &= check(ctx, !send.transfer.encryption && send.color_mode == ColorMode::Never, "send flags and pipeline");
  return ok;
}

// ---- stdin and pipeline ----------------------------------------------------

bool test_pipeline_input(TestContext& ctx) {
  std::istringstream files("a.txt\n\n  b.txt  \n");
  auto list = parse_file_list(files);
  bool ok = check(ctx, list.size() == 2 && list[1] == "b.txt", "file list trimmed");

  auto request = parse_batch_json(R"({"files":["a","b"],"peers":["p"],"parallel":true,"max_concurrent":3,"compression":false})");
  ok &= check(ctx, request.files.size() == 2 && request.peers.size() == 1, "batch lists");
  ok &= check(ctx, request.parallel && request.max_concurrent == std::optional<std::size_t>(3), "batch options");
  ok &= check(ctx, request.compression == std::optional<bool>(false) && !request.encryption, "batch flags");
  ok &= check(ctx, throws_kind(ErrorKind::Parse, []{ parse_batch_json("{not json"); }), "bad json");
  ok &= check(ctx, throws_kind(ErrorKind::Parse, []{ parse_batch_json(R"({"files":["a"]})"); }), "missing peers");
  ok &= check(ctx, throws_kind(ErrorKind::InvalidArgumentValue, []{
    parse_batch_json(R"({"files":[],"peers":[],"max_concurrent":-1})");
  }), "negative concurrency");
  return ok;
}

bool test_pipeline_output(TestContext& ctx) {
  PeerInfo a;
  a.id = "1";
  a.name = "laptop";
  PeerInfo b;
  b.id = "2";
  b.name = "phone, old";
  std::vector<PeerInfo> peers{a, b};

  std::ostringstream minimal;
  PipelineOutput(minimal, OutputFormat::Minimal).write_peer_list(peers);
  bool ok = check(ctx, minimal.str() == "laptop\nphone, old\n", "names per line");

  std::ostringstream csv;
  PipelineOutput(csv, OutputFormat::Csv).write_peer_list(peers);
  ok &= check(ctx, contains(csv.str(), "\"phone, old\""), "csv escaping");

  std::ostringstream json;
  PipelineOutput(json, OutputFormat::Json).write_peer_list(peers);
  auto parsed = nlohmann::json::parse(json.str());
  ok &= check(ctx, parsed.size() == 2 && json.str().find('\n') == json.str().size() - 1, "single json line");
  return ok;
}

// ---- history and completion ------------------------------------------------

bool test_history_persistence(TestContext& ctx) {
  ScratchDir dir("history");
  HistoryManager history(dir / "history");
  history.add_with_details("kizuna send a.txt --peer laptop", 0, 120);
  history.add_with_details("kizuna discover", 2, 3000);
  history.add("kizuna status");
  history.add_with_details("kizuna send b.txt --peer laptop", 0, 80);

  HistoryManager reloaded(dir / "history");
  reloaded.load();
  auto all = reloaded.get_all();
  bool ok = check(ctx, all.size() == 4, "entries persisted");
  ok &= check(ctx, all[1].exit_code == std::optional<int>(2) && all[1].duration_ms == std::optional<uint64_t>(3000),
              "details persisted");
  ok &= check(ctx, !all[2].exit_code, "plain entry");
  ok &= check(ctx, contains(all[0].format(), "(exit: 0)"), "format shows exit");

  auto recent = reloaded.get_recent(2);
  ok &= check(ctx, recent.size() == 2 && recent[1].command == "kizuna send b.txt --peer laptop", "recent order");
  auto hits = reloaded.search("kizuna status");
  ok &= check(ctx, !hits.empty() && hits.front().command == "kizuna status", "exact match first");
  auto suggestions = reloaded.suggest("kizuna send");
  ok &= check(ctx, suggestions.size() == 2 && suggestions[0] == "kizuna send b.txt --peer laptop", "suggest newest first");

  auto stats = reloaded.statistics();
  ok &= check(ctx, stats.total_commands == 4 && stats.unique_commands == 4, "counts");
  ok &= check(ctx, stats.success_rate > 66.0 && stats.success_rate < 67.0, "success rate over coded entries");
  return ok;
}

bool test_history_limits(TestContext& ctx) {
  ScratchDir dir("history_limits");
  std::string lines;
  for(std::size_t i = 0; i < HistoryManager::kMaxEntries + 5; ++i) {
    nlohmann::json entry{{"command", "kizuna status " + std::to_string(i)},
                         {"timestamp", format_rfc3339(std::chrono::system_clock::now())}};
    lines += entry.dump() + "\n";
  }
  lines += "this is not json\n";
  write_file(dir / "history", lines);

  HistoryManager history(dir / "history");
  history.load();
  auto all = history.get_all();
  bool ok = check(ctx, all.size() == HistoryManager::kMaxEntries, "capped on load");
  ok &= check(ctx, all.front().command == "kizuna status 5", "oldest dropped");

  history.clear();
  ok &= check(ctx, history.get_all().empty(), "cleared");
  history.add("kizuna peers");
  history.prune_old(0);
  ok &= check(ctx, history.get_all().empty(), "prune by age");
  return ok;
}

bool test_completion(TestContext& ctx) {
  CommandParser parser;
  CompletionEngine::Sources sources;
  std::vector<std::string> peers{"laptop", "desktop"};
  sources.peer_names = [&]{ return peers; };
  CompletionEngine engine(parser, sources);

  bool ok = check(ctx, engine.complete("kizuna se") == std::vector<std::string>{"send"}, "verb");
  ok &= check(ctx, has(engine.complete("kizuna send --p"), "--peer"), "option");
  ok &= check(ctx, engine.complete("kizuna discover --format j") == std::vector<std::string>{"json"}, "value");
  ok &= check(ctx, engine.complete("kizuna clipboard ") == std::vector<std::string>{"share", "status", "history"},
              "subcommands");
  ok &= check(ctx, engine.complete("kizuna send --peer la") == std::vector<std::string>{"laptop"}, "peer names");
  ok &= check(ctx, has(engine.complete("kizuna stream camera --quality "), "ultra"), "quality values");
  ok &= check(ctx, has(engine.complete_verb("sedn"), "send"), "fuzzy verb");
  return ok;
}

bool test_completion_cache(TestContext& ctx) {
  CommandParser parser;
  CompletionEngine::Sources sources;
  std::vector<std::string> peers{"laptop"};
  sources.peer_names = [&]{ return peers; };
  CompletionEngine engine(parser, sources);
  auto now = std::chrono::steady_clock::now();
  engine.set_clock([&]{ return now; });

  auto first = engine.complete("kizuna exec --peer ");
  peers.push_back("lab");
  auto cached = engine.complete("kizuna exec --peer ");
  bool ok = check(ctx, first == cached && engine.cache_size() == 1, "served from cache");
  now += CompletionEngine::kCacheTtl + std::chrono::seconds(1);
  auto fresh = engine.complete("kizuna exec --peer ");
  ok &= check(ctx, fresh.size() == 2, "expired entry recomputed");
  engine.clear_cache();
  ok &= check(ctx, engine.cache_size() == 0, "cache cleared");

  ok &= check(ctx, contains(CompletionEngine::script("bash"), "complete -o default"), "bash script");
  ok &= check(ctx, throws_kind(ErrorKind::InvalidArgumentValue, []{ CompletionEngine::script("tcsh"); }),
              "unsupported shell");
  return ok;
}

// ---- wire helpers and stores -----------------------------------------------

bool test_host_port(TestContext& ctx) {
  auto v4 = parse_host_port("10.0.0.2:47801");
  bool ok = check(ctx, v4 && v4->host == "10.0.0.2" && v4->port == 47801, "v4");
  auto v6 = parse_host_port("[::1]:9000");
  ok &= check(ctx, v6 && v6->host == "::1" && v6->port == 9000, "bracketed v6");
  ok &= check(ctx, !parse_host_port("laptop"), "no port, no default");
  auto bare = parse_host_port("laptop", kDefaultServicePort);
  ok &= check(ctx, bare && bare->port == kDefaultServicePort, "default port");
  ok &= check(ctx, !parse_host_port("host:0") && !parse_host_port("host:http") && !parse_host_port(""), "invalid");
  ok &= check(ctx, format_host_port("::1", 80) == "[::1]:80", "format v6");

  LocalNode node;
  node.peer_id = "p1";
  auto offer = make_file_offer("op", node, {{"a.txt", 10}, {"b.txt", 5}}, true, false);
  ok &= check(ctx, offer["total_bytes"] == 15 && offered_files(offer).size() == 2, "offer totals");
  return ok;
}

bool test_json_store(TestContext& ctx) {
  ScratchDir dir("json_store");
  auto path = dir / "sub" / "doc.json";
  bool ok = check(ctx, !read_json_file(path), "missing is nullopt");
  write_json_file(path, {{"a", 1}});
  auto doc = read_json_file(path);
  ok &= check(ctx, doc && (*doc)["a"] == 1, "written and read");
  write_file(path, "{broken");
  ok &= check(ctx, throws_kind(ErrorKind::Io, [&]{ read_json_file(path); }), "malformed is io error");
  return ok;
}

bool test_local_clipboard(TestContext& ctx) {
  ScratchDir dir("clipboard");
  auto path = dir / "clipboard.json";
  {
    LocalClipboard clipboard(path);
    clipboard.set_content("first", "local");
    clipboard.set_content("first", "local");
    clipboard.set_content("Second Value", "peer-1");
    clipboard.set_sharing_enabled(true);
    clipboard.enable_device("peer-1");
  }
  LocalClipboard clipboard(path);
  auto history = clipboard.get_history(10);
  bool ok = check(ctx, history.size() == 2, "duplicate content not recorded");
  ok &= check(ctx, history[0].content == "Second Value" && history[0].source_peer == "peer-1", "newest first");
  ok &= check(ctx, clipboard.is_sharing_enabled() && clipboard.enabled_devices() == std::vector<std::string>{"peer-1"},
              "sharing persisted");
  ok &= check(ctx, clipboard.search_history("second").size() == 1, "case-insensitive search");

  clipboard.restore(history[1].id);
  ok &= check(ctx, clipboard.get_content() == "first", "restored");
  ok &= check(ctx, throws_kind(ErrorKind::Integration, [&]{ clipboard.restore("missing"); }), "unknown entry");

  for(std::size_t i = 0; i < LocalClipboard::kMaxHistory + 5; ++i) {
    clipboard.set_content("item " + std::to_string(i), "local");
  }
  ok &= check(ctx, clipboard.get_history(1000).size() == LocalClipboard::kMaxHistory, "history capped");
  clipboard.clear_history();
  ok &= check(ctx, clipboard.get_history(10).empty(), "cleared");
  return ok;
}

bool test_security_identity_and_trust(TestContext& ctx) {
  ScratchDir dir("security");
  std::string peer_id;
  {
    LocalSecuritySystem security(dir.path(), "studio");
    auto identity = security.get_or_create_identity();
    peer_id = identity.derive_peer_id();
    security.add_trusted_peer("peer-a", "Laptop");
    security.block_peer("peer-b");
  }
  LocalSecuritySystem security(dir.path(), "studio");
  bool ok = check(ctx, peer_id.size() == 32, "peer id length");
  ok &= check(ctx, security.get_or_create_identity().derive_peer_id() == peer_id, "identity stable");
  ok &= check(ctx, security.is_trusted("peer-a") && !security.is_trusted("peer-b"), "trust persisted");
  ok &= check(ctx, security.is_blocked("peer-b") && !security.is_connection_allowed("peer-b"), "block persisted");
  ok &= check(ctx, security.get_trusted_peers().size() == 1, "blocked peers not listed as trusted");
  ok &= check(ctx, security.is_connection_allowed("stranger"), "open mode admits strangers");

  security.enable_private_mode();
  ok &= check(ctx, !security.is_connection_allowed("stranger"), "private mode");
  security.generate_invite_code("stranger");
  ok &= check(ctx, security.is_connection_allowed("stranger"), "invite admits");
  security.remove_trusted_peer("peer-a");
  ok &= check(ctx, !security.is_trusted("peer-a"), "untrusted");
  ok &= check(ctx, throws_kind(ErrorKind::Integration, [&]{ security.remove_trusted_peer("peer-a"); }),
              "remove unknown");

  write_file(security.identity_path(), R"({"secret":"short"})");
  LocalSecuritySystem corrupt(dir.path());
  ok &= check(ctx, throws_kind(ErrorKind::Integration, [&]{ corrupt.get_or_create_identity(); }), "corrupt identity");
  return ok;
}

bool test_device_key_signatures(TestContext& ctx) {
  ScratchDir dir("device_key");
  LocalSecuritySystem security(dir.path(), "studio");
  auto identity = security.get_or_create_identity();
  bool ok = check(ctx, identity.public_key.size() == DeviceKey::kPublicKeyBytes * 2, "public key hex");
  ok &= check(ctx, identity.derive_peer_id() == peer_id_for_public_key(identity.public_key),
              "peer id follows the public key");

  auto signature = security.sign("run ls");
  ok &= check(ctx, verify_device_signature(identity.public_key, "run ls", signature), "signature verifies");
  ok &= check(ctx, !verify_device_signature(identity.public_key, "run rm", signature), "other message rejected");
  auto other = DeviceKey::generate();
  ok &= check(ctx, !verify_device_signature(other.public_key(), "run ls", signature), "other key rejected");
  ok &= check(ctx, !verify_device_signature(identity.public_key, "run ls", "zz"), "garbage signature rejected");
  ok &= check(ctx, peer_id_for_public_key("").empty() && peer_id_for_public_key("abc").empty(),
              "no peer id for a malformed key");

  LocalSecuritySystem reopened(dir.path(), "studio");
  ok &= check(ctx, reopened.get_or_create_identity().public_key == identity.public_key, "key persisted");
  ok &= check(ctx, verify_device_signature(identity.public_key, "again", reopened.sign("again")), "reloaded key signs");
  return ok;
}

bool test_security_pairing(TestContext& ctx) {
  ScratchDir dir("pairing");
  LocalSecuritySystem security(dir.path(), "studio");
  auto now = std::chrono::system_clock::now();
  security.set_clock([&]{ return now; });

  auto code = security.generate_pairing_code();
  bool ok = check(ctx, code.code.size() == 6 && code.code.find_first_not_of("0123456789") == std::string::npos,
                  "six digits");
  ok &= check(ctx, !security.verify_and_trust_peer("not-it", "peer-a", "A"), "wrong code");
  ok &= check(ctx, security.verify_and_trust_peer(code.code, "peer-a", "A"), "verified");
  ok &= check(ctx, security.is_trusted("peer-a"), "verified peer trusted");
  ok &= check(ctx, !security.verify_and_trust_peer(code.code, "peer-c", "C"), "single use");

  auto late = security.generate_pairing_code();
  now += LocalSecuritySystem::kPairingLifetime + std::chrono::seconds(1);
  ok &= check(ctx, !security.verify_and_trust_peer(late.code, "peer-d", "D"), "expired");
  return ok;
}

bool test_security_encryption(TestContext& ctx) {
  ScratchDir dir("crypto");
  LocalSecuritySystem security(dir.path());
  auto session = security.establish_session("peer-a");
  std::string text = "clipboard payload";
  std::vector<unsigned char> plaintext(text.begin(), text.end());
  auto sealed = security.encrypt_message(session, plaintext);
  bool ok = check(ctx, sealed.size() == plaintext.size() + LocalSecuritySystem::kIvBytes + LocalSecuritySystem::kTagBytes,
                  "sealed layout");
  ok &= check(ctx, security.decrypt_message(session, sealed) == plaintext, "opened");
  sealed[LocalSecuritySystem::kIvBytes] ^= 0x01;
  ok &= check(ctx, throws_kind(ErrorKind::Integration, [&]{ security.decrypt_message(session, sealed); }), "tamper");
  ok &= check(ctx, throws_kind(ErrorKind::Integration, [&]{ security.encrypt_message("nope", plaintext); }),
              "unknown session");
  return ok;
}

bool test_stream_registry(TestContext& ctx) {
  StreamRegistry streams;
  StreamConfig config;
  config.camera = "/dev/video0";
  config.quality = StreamQuality::High;
  auto session = streams.start_camera_stream(config);
  bool ok = check(ctx, streams.session(session.session_id)->state == StreamSessionState::Active, "active");
  auto first = streams.events()->try_receive();
  ok &= check(ctx, first && first->type == StreamEvent::Type::SessionStarted, "started event");

  streams.pause_stream(session.session_id);
  ok &= check(ctx, throws_kind(ErrorKind::Integration, [&]{ streams.pause_stream(session.session_id); }),
              "pause twice");
  streams.resume_stream(session.session_id);
  auto viewer = streams.add_viewer(session.session_id, "peer-a");
  ok &= check(ctx, streams.viewer_count(session.session_id) == 1, "viewer added");
  streams.remove_viewer(session.session_id, viewer);
  ok &= check(ctx, throws_kind(ErrorKind::Integration, [&]{ streams.remove_viewer(session.session_id, viewer); }),
              "viewer gone");

  streams.stop_stream(session.session_id);
  ok &= check(ctx, streams.session(session.session_id)->state == StreamSessionState::Stopped, "stopped");
  ok &= check(ctx, throws_kind(ErrorKind::Integration, [&]{ streams.add_viewer(session.session_id, "peer-b"); }),
              "no viewers after stop");
  ok &= check(ctx, throws_kind(ErrorKind::Integration, [&]{ streams.stop_stream("missing"); }), "unknown session");
  ok &= check(ctx, StreamRegistry::nominal_bitrate(StreamQuality::Ultra) > StreamRegistry::nominal_bitrate(StreamQuality::Low),
              "bitrate ordering");
  return ok;
}

bool test_lan_announces(TestContext& ctx) {
  LocalNode self;
  self.peer_id = "self";
  LanDiscovery discovery(self, 0);

  LocalNode other;
  other.peer_id = "peer-1";
  other.name = "laptop";
  other.device_type = "laptop";
  other.capabilities = {"file_transfer", "exec"};
  other.service_port = 47801;

  auto record = discovery.parse_announce(make_announce(other).dump(), "192.168.1.5");
  bool ok = check(ctx, record && record->addresses == std::vector<std::string>{"192.168.1.5:47801"}, "address");
  ok &= check(ctx, record && record->capabilities.at("capabilities") == "file_transfer,exec", "capabilities");
  ok &= check(ctx, record && record->capabilities.at("device_type") == "laptop", "device type");
  ok &= check(ctx, !discovery.parse_announce(make_announce(self).dump(), "127.0.0.1"), "own announce ignored");
  ok &= check(ctx, !discovery.parse_announce(make_query("peer-1").dump(), "127.0.0.1"), "query is not an announce");
  ok &= check(ctx, !discovery.parse_announce("garbage", "127.0.0.1"), "garbage ignored");
  other.service_port = 0;
  ok &= check(ctx, !discovery.parse_announce(make_announce(other).dump(), "10.0.0.1"), "port zero ignored");
  ok &= check(ctx, throws_kind(ErrorKind::Integration, []{ LanDiscovery(LocalNode{}, 0).initialize(); }),
              "needs a peer id");
  return ok;
}

bool test_lan_peer_table(TestContext& ctx) {
  LocalNode self;
  self.peer_id = "self";
  LanDiscovery discovery(self, 0);
  ServiceRecord record;
  record.peer_id = "peer-1";
  record.name = "laptop";
  record.addresses = {"10.0.0.2:47801"};

  auto t0 = std::chrono::steady_clock::now();
  bool ok = check(ctx, discovery.remember(record, t0), "new peer");
  ok &= check(ctx, !discovery.remember(record, t0 + std::chrono::seconds(4)), "unchanged announce");
  record.name = "laptop-2";
  ok &= check(ctx, discovery.remember(record, t0 + std::chrono::seconds(8)), "renamed peer");
  ok &= check(ctx, discovery.get_cached_peers().size() == 1, "cached");

  ok &= check(ctx, discovery.expire_silent(t0 + std::chrono::seconds(20)).empty(), "still fresh");
  auto lost = discovery.expire_silent(t0 + std::chrono::seconds(8) + LanDiscovery::kPeerTimeout + std::chrono::seconds(1));
  ok &= check(ctx, lost == std::vector<std::string>{"peer-1"}, "expired");
  ok &= check(ctx, discovery.get_cached_peers().empty(), "forgotten");
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"error_exit_codes", test_error_exit_codes},
    {"progress_percentage", test_progress_percentage},
    {"peer_json", test_peer_json},
    {"format_helpers", test_format_helpers},
    {"table_rendering", test_table_rendering},
    {"formatter_modes", test_formatter_modes},
    {"progress_rendering", test_progress_rendering},
    {"parse_send", test_parse_send},
    {"parse_errors", test_parse_errors},
    {"usage_text", test_usage_text},
    {"validate_send", test_validate_send},
    {"validate_other_verbs", test_validate_other_verbs},
    {"config_defaults_and_parse", test_config_defaults_and_parse},
    {"config_errors", test_config_errors},
    {"config_values_and_save", test_config_values_and_save},
    {"config_precedence", test_config_precedence},
    {"pipeline_input", test_pipeline_input},
    {"pipeline_output", test_pipeline_output},
    {"history_persistence", test_history_persistence},
    {"history_limits", test_history_limits},
    {"completion", test_completion},
    {"completion_cache", test_completion_cache},
    {"host_port", test_host_port},
    {"json_store", test_json_store},
    {"local_clipboard", test_local_clipboard},
    {"security_identity_and_trust", test_security_identity_and_trust},
    {"security_pairing", test_security_pairing},
    {"security_encryption", test_security_encryption},
    {"device_key_signatures", test_device_key_signatures},
    {"stream_registry", test_stream_registry},
    {"lan_announces", test_lan_announces},
    {"lan_peer_table", test_lan_peer_table},
  };
  return kizuna::test::run_tests("core", tests, argc, argv);
}
