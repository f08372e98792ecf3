#include "tui_render.hpp"

#include <algorithm>
#include <fmt/format.h>

#include "status_handler.hpp"
#include "utils.hpp"

namespace {

// First visible index so that the selection stays on screen.
std::size_t window_start(std::size_t selected, std::size_t count, std::size_t rows) {
  if(rows == 0 || count <= rows || selected < rows) return 0;
  return std::min(selected - rows + 1, count - rows);
}

std::string pad_right(const std::string& text, std::size_t width) {
  auto shown = display_width(text);
  if(shown >= width) return text;
  return text + std::string(width - shown, ' ');
}

std::string short_id(const std::string& id) {
  return id.size() > 8 ? id.substr(0, 8) : id;
}

std::string percent_text(const OperationStatus& op) {
  if(!op.progress) return "-";
  auto pct = op.progress->percentage();
  if(!pct) return format_bytes(op.progress->current);
  return fmt::format("{:.0f}%", *pct);
}

} // namespace

const char* TuiRenderer::trust_icon(TrustStatus status) {
  switch(status) {
    case TrustStatus::Trusted: return "✓";
    case TrustStatus::Untrusted: return "?";
    case TrustStatus::Blocked: return "✗";
  }
  return "?";
}

const char* TuiRenderer::connection_icon(ConnectionStatus status) {
  switch(status) {
    case ConnectionStatus::Connected: return "●";
    case ConnectionStatus::Disconnected: return "○";
    case ConnectionStatus::Connecting: return "◐";
    case ConnectionStatus::Error: return "✗";
  }
  return "○";
}

std::string TuiRenderer::sparkline(const std::deque<double>& samples, std::size_t width) {
  static const char* kBlocks[] = {"▁", "▂", "▃", "▄", "▅", "▆", "▇", "█"};
  if(samples.empty() || width == 0) return {};
  auto count = std::min(samples.size(), width);
  auto first = samples.size() - count;
  double peak = *std::max_element(samples.begin() + first, samples.end());
  std::string out;
  for(std::size_t i = first; i < samples.size(); ++i) {
    std::size_t level = 0;
    if(peak > 0.0) {
      level = static_cast<std::size_t>(samples[i] / peak * 7.0 + 0.5);
      if(level > 7) level = 7;
    }
    out += kBlocks[level];
  }
  return out;
}

std::string TuiRenderer::fit(const std::string& text, std::size_t width) {
  return pad_right(truncate_display(text, width), width);
}

std::string TuiRenderer::row(const std::string& text, std::size_t width, bool selected) const {
  auto line = fit((selected ? "> " : "  ") + text, width);
  if(!selected) return line;
  return style_.bold(style_.colorize(line, Color::Cyan));
}

std::vector<std::string> TuiRenderer::render(const TuiState& state, std::size_t width, std::size_t height) const {
  if(width < 20) width = 20;
  if(height < 8) height = 8;

  Lines frame;
  frame.push_back(style_.bold(fit(fmt::format(" Kizuna {}", kizuna_version()), width)));
  frame.push_back(tabs(state, width));
  frame.push_back(fit(std::string(width, '-'), width));

  auto footer = status_bar(state, width);
  std::size_t body_height = height - frame.size() - footer.size();

  Lines body;
  switch(state.current_view()) {
    case ViewType::PeerList: body = peer_view(state, width, body_height); break;
    case ViewType::FileBrowser: body = file_view(state, width, body_height); break;
    case ViewType::TransferProgress: body = transfer_view(state, width, body_height); break;
    case ViewType::StreamViewer: body = stream_view(state, width, body_height); break;
    case ViewType::CommandTerminal: body = terminal_view(state, width, body_height); break;
    case ViewType::Settings: body = settings_view(state, width, body_height); break;
  }
  body.resize(body_height, std::string(width, ' '));

  frame.insert(frame.end(), body.begin(), body.end());
  frame.insert(frame.end(), footer.begin(), footer.end());
  return frame;
}

std::string TuiRenderer::tabs(const TuiState& state, std::size_t width) const {
  static const ViewType kViews[] = {
    ViewType::PeerList, ViewType::FileBrowser, ViewType::TransferProgress,
    ViewType::StreamViewer, ViewType::CommandTerminal, ViewType::Settings
  };
  std::string plain;
  std::string styled;
  int number = 1;
  for(auto view : kViews) {
    auto label = fmt::format(" {} {} ", number++, to_string(view));
    if(display_width(plain) + display_width(label) + 1 > width) break;
    plain += label + "|";
    if(view == state.current_view()) {
      styled += style_.style(style_.colorize(label, Color::Yellow), TextStyle::Underline) + "|";
    } else {
      styled += label + "|";
    }
  }
  return styled + std::string(width - display_width(plain), ' ');
}

TuiRenderer::Lines TuiRenderer::peer_view(const TuiState& state, std::size_t width, std::size_t height) const {
  const auto& view = state.peer_view();
  const auto& peers = view.peers();
  Lines out;
  bool details = view.show_details() && view.selected().has_value();
  std::size_t list_width = details ? width / 2 : width;

  Lines list;
  list.push_back(fit(fmt::format(" Peers ({})", peers.size()), list_width));
  if(peers.empty()) {
    list.push_back(fit("  No peers discovered yet. Press r to refresh.", list_width));
  }
  auto rows = height > 1 ? height - 1 : 0;
  auto start = window_start(view.selection().index(), peers.size(), rows);
  for(std::size_t i = start; i < peers.size() && list.size() < height; ++i) {
    const auto& peer = peers[i];
    auto text = fmt::format("{} {} {}  ({})",
                            trust_icon(peer.trust_status),
                            connection_icon(peer.connection_status),
                            peer.name.empty() ? short_id(peer.id) : peer.name,
                            peer.device_type);
    list.push_back(row(text, list_width, i == view.selection().index()));
  }

  if(!details) return list;

  auto peer = *view.selected();
  std::size_t detail_width = width - list_width;
  Lines pane;
  pane.push_back(style_.bold(fit("| Details", detail_width)));
  pane.push_back(fit("| Name: " + peer.name, detail_width));
  pane.push_back(fit("| ID: " + peer.id, detail_width));
  pane.push_back(fit(std::string("| Type: ") + peer.device_type, detail_width));
  pane.push_back(fit(std::string("| Status: ") + to_string(peer.connection_status), detail_width));
  pane.push_back(fit(std::string("| Trust: ") + to_string(peer.trust_status), detail_width));
  if(!peer.addresses.empty()) pane.push_back(fit("| Addresses: " + join(peer.addresses, ", "), detail_width));
  pane.push_back(fit("| Capabilities:", detail_width));
  for(const auto& capability : peer.capabilities) pane.push_back(fit("|   - " + capability, detail_width));
  pane.push_back(fit("| Actions:", detail_width));
  for(auto action : available_actions(peer.connection_status)) {
    pane.push_back(fit(std::string("|   ") + to_string(action), detail_width));
  }

  auto lines = std::max(list.size(), pane.size());
  for(std::size_t i = 0; i < lines && i < height; ++i) {
    auto left = i < list.size() ? list[i] : std::string(list_width, ' ');
    auto right = i < pane.size() ? pane[i] : fit("|", detail_width);
    out.push_back(left + right);
  }
  return out;
}

TuiRenderer::Lines TuiRenderer::file_view(const TuiState& state, std::size_t width, std::size_t height) const {
  const auto& browser = state.file_browser();
  const auto& entries = browser.entries();
  Lines out;
  out.push_back(style_.bold(fit(" " + browser.directory().string(), width)));
  auto selected = browser.selected_files();
  out.push_back(fit(fmt::format(" Selected: {} files, {}{}",
                                selected.size(),
                                format_bytes(browser.selected_bytes()),
                                browser.show_hidden() ? "  (showing hidden)" : ""), width));
  if(!browser.error().empty()) {
    out.push_back(style_.colorize(fit("  " + browser.error(), width), Color::Red));
    return out;
  }

  auto rows = height > out.size() ? height - out.size() : 0;
  auto start = window_start(browser.cursor().index(), entries.size(), rows);
  for(std::size_t i = start; i < entries.size() && out.size() < height; ++i) {
    const auto& entry = entries[i];
    std::string text;
    if(entry.is_directory) {
      text = "    " + entry.name + "/";
    } else {
      text = std::string(browser.is_selected(entry.path) ? "[✓] " : "[ ] ") + entry.name
           + "  " + format_bytes(entry.size);
    }
    out.push_back(row(text, width, i == browser.cursor().index()));
  }
  return out;
}

std::string TuiRenderer::operation_row(const OperationStatus& op, std::size_t width, bool selected) const {
  std::string rate = op.progress && op.progress->rate ? format_rate(*op.progress->rate) : "";
  auto text = fmt::format("{:<8} {:<16} {:<8} {:<14} {:>6} {}",
                          short_id(op.operation_id),
                          to_string(op.kind),
                          short_id(op.peer_id),
                          describe(op.state),
                          percent_text(op),
                          rate);
  auto line = row(text, width, selected);
  if(selected) return line;
  switch(op.state.kind) {
    case OperationState::Kind::Completed: return style_.colorize(line, Color::Green);
    case OperationState::Kind::Failed: return style_.colorize(line, Color::Red);
    case OperationState::Kind::Cancelled: return style_.colorize(line, Color::Gray);
    default: return line;
  }
}

TuiRenderer::Lines TuiRenderer::transfer_view(const TuiState& state, std::size_t width, std::size_t height) const {
  const auto& monitor = state.monitor();
  auto stats = monitor.stats();
  Lines out;

  std::size_t box = width / 4;
  auto stat_box = [&](const std::string& label, std::size_t value, Color color) {
    return style_.colorize(fit(fmt::format(" {}: {}", label, value), box), color);
  };
  out.push_back(stat_box("Total", stats.total, Color::White)
              + stat_box("Active", stats.active, Color::Cyan)
              + stat_box("Completed", stats.completed, Color::Green)
              + stat_box("Failed", stats.failed, Color::Red)
              + std::string(width - box * 4, ' '));
  out.push_back(fit(std::string(width, '-'), width));

  std::size_t footer_lines = 3;
  std::size_t middle = height > out.size() + footer_lines ? height - out.size() - footer_lines : 0;

  Lines list;
  if(monitor.show_logs()) {
    const auto& logs = monitor.logs();
    list.push_back(style_.bold(fit(fmt::format(" Logs ({})", logs.size()), width)));
    std::size_t shown = middle > 1 ? middle - 1 : 0;
    std::size_t first = logs.size() > shown ? logs.size() - shown : 0;
    for(std::size_t i = first; i < logs.size(); ++i) {
      const auto& entry = logs[i];
      auto text = fmt::format(" {} {:<5} {}{}",
                              format_local_time(entry.timestamp).substr(11),
                              to_string(entry.level),
                              entry.operation_id.empty() ? "" : "[" + short_id(entry.operation_id) + "] ",
                              entry.message);
      auto line = fit(text, width);
      if(entry.level == LogLevel::Error) line = style_.colorize(line, Color::Red);
      if(entry.level == LogLevel::Warning) line = style_.colorize(line, Color::Yellow);
      if(entry.level == LogLevel::Debug) line = style_.style(line, TextStyle::Dim);
      list.push_back(line);
    }
  } else {
    const auto& ops = monitor.operations();
    list.push_back(style_.bold(fit(fmt::format("  {:<8} {:<16} {:<8} {:<14} {:>6} {}",
                                               "ID", "KIND", "PEER", "STATE", "DONE", "RATE"), width)));
    if(ops.empty()) list.push_back(fit("  No operations", width));
    std::size_t rows = middle > 1 ? middle - 1 : 0;
    auto start = window_start(monitor.selection().index(), ops.size(), rows);
    for(std::size_t i = start; i < ops.size() && list.size() < middle; ++i) {
      list.push_back(operation_row(ops[i], width, i == monitor.selection().index()));
    }
  }
  list.resize(middle, std::string(width, ' '));
  out.insert(out.end(), list.begin(), list.end());

  out.push_back(fit(std::string(width, '-'), width));
  std::string label = " Bandwidth ";
  out.push_back(fit(label, display_width(label))
              + style_.colorize(sparkline(monitor.bandwidth_history(), OperationMonitorState::kMaxSamples), Color::Cyan));
  out.push_back(fit(fmt::format(" Current: {}  Average: {}  Total: {}",
                                format_rate(monitor.current_bandwidth()),
                                format_rate(monitor.average_bandwidth()),
                                format_bytes(monitor.total_transferred())), width));
  return out;
}

TuiRenderer::Lines TuiRenderer::stream_view(const TuiState& state, std::size_t width, std::size_t height) const {
  const auto& streams = state.streams();
  Lines out;
  out.push_back(style_.bold(fit(fmt::format(" Active streams ({})", streams.size()), width)));
  if(streams.empty()) out.push_back(fit("  No active streams", width));
  auto start = window_start(state.stream_selection().index(), streams.size(), height > 1 ? height - 1 : 0);
  for(std::size_t i = start; i < streams.size() && out.size() < height; ++i) {
    out.push_back(operation_row(streams[i], width, i == state.stream_selection().index()));
  }
  return out;
}

TuiRenderer::Lines TuiRenderer::terminal_view(const TuiState& state, std::size_t width, std::size_t height) const {
  const auto& history = state.history();
  Lines out;
  out.push_back(style_.bold(fit(" Recent commands", width)));
  if(history.empty()) out.push_back(fit("  No command history", width));
  auto start = window_start(state.history_selection().index(), history.size(), height > 1 ? height - 1 : 0);
  for(std::size_t i = start; i < history.size() && out.size() < height; ++i) {
    out.push_back(row(history[i], width, i == state.history_selection().index()));
  }
  return out;
}

TuiRenderer::Lines TuiRenderer::settings_view(const TuiState& state, std::size_t width, std::size_t height) const {
  const auto& settings = state.settings();
  Lines out;
  out.push_back(style_.bold(fit(" Configuration", width)));
  std::size_t key_width = 0;
  for(const auto& entry : settings) key_width = std::max(key_width, entry.first.size());
  auto start = window_start(state.settings_selection().index(), settings.size(), height > 1 ? height - 1 : 0);
  for(std::size_t i = start; i < settings.size() && out.size() < height; ++i) {
    auto text = fmt::format("{:<{}}  {}", settings[i].first, key_width, settings[i].second);
    out.push_back(row(text, width, i == state.settings_selection().index()));
  }
  return out;
}

TuiRenderer::Lines TuiRenderer::status_bar(const TuiState& state, std::size_t width) const {
  std::string hints;
  switch(state.current_view()) {
    case ViewType::PeerList: hints = "Enter details  r refresh  c connect  d disconnect  t trust  b block"; break;
    case ViewType::FileBrowser: hints = "Enter open  Space select  h hidden  s send  Backspace up"; break;
    case ViewType::TransferProgress: hints = "c cancel  p pause  r resume  x clear finished  l logs"; break;
    default: hints = "Up/Down select"; break;
  }
  Lines out;
  out.push_back(style_.style(fit(fmt::format(" [{}] {}  |  Tab views  q quit",
                                             to_string(state.current_view()), hints), width),
                             TextStyle::Dim));
  out.push_back(fit(" " + state.status_message(), width));
  return out;
}

std::string compose_frame(const std::vector<std::string>& lines) {
  std::string out = "\x1b[H";
  for(std::size_t i = 0; i < lines.size(); ++i) {
    out += lines[i];
    out += "\x1b[K";
    if(i + 1 < lines.size()) out += "\r\n";
  }
  out += "\x1b[J";
  return out;
}
