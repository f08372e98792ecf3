#include "output_formatter.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <sstream>

#include "errors.hpp"

namespace {

const char* color_code(Color color) {
  switch(color) {
    case Color::Black: return "30";
    case Color::Red: return "31";
    case Color::Green: return "32";
    case Color::Yellow: return "33";
    case Color::Blue: return "34";
    case Color::Magenta: return "35";
    case Color::Cyan: return "36";
    case Color::White: return "37";
    case Color::Gray: return "90";
  }
  return "37";
}

const char* style_code(TextStyle style) {
  switch(style) {
    case TextStyle::Bold: return "1";
    case TextStyle::Dim: return "2";
    case TextStyle::Italic: return "3";
    case TextStyle::Underline: return "4";
    case TextStyle::Normal: return "0";
  }
  return "0";
}

bool is_continuation(unsigned char ch) {
  return (ch & 0xC0) == 0x80;
}

std::string repeat(const std::string& unit, std::size_t count) {
  std::string out;
  out.reserve(unit.size() * count);
  for(std::size_t i = 0; i < count; ++i) out += unit;
  return out;
}

std::string pad_right(const std::string& text, std::size_t width) {
  auto w = display_width(text);
  return w >= width ? text : text + std::string(width - w, ' ');
}

std::string center(const std::string& text, std::size_t width) {
  auto w = display_width(text);
  if(w >= width) return text;
  std::size_t left = (width - w) / 2;
  return std::string(left, ' ') + text + std::string(width - w - left, ' ');
}

std::string border(const std::vector<std::size_t>& widths,
                   const char* left, const char* mid, const char* right) {
  std::string line = left;
  for(std::size_t i = 0; i < widths.size(); ++i) {
    line += repeat("─", widths[i] + 2);
    line += (i + 1 < widths.size()) ? mid : right;
  }
  return line;
}

} // namespace

StyleManager::StyleManager(ColorMode mode)
  : StyleManager(mode, isatty(STDOUT_FILENO) == 1) {}

StyleManager::StyleManager(ColorMode mode, bool terminal)
  : mode_(mode) {
  switch(mode) {
    case ColorMode::Always: enabled_ = true; break;
    case ColorMode::Never: enabled_ = false; break;
    case ColorMode::Auto: enabled_ = auto_detect(terminal); break;
  }
}

bool StyleManager::auto_detect(bool terminal) {
  if(!terminal) return false;
  if(std::getenv("NO_COLOR") != nullptr) return false;
  if(const char* term = std::getenv("TERM"); term && std::string(term) == "dumb") return false;
  return true;
}

std::string StyleManager::colorize(const std::string& text, Color color) const {
  if(!enabled_) return text;
  return std::string("\x1b[") + color_code(color) + "m" + text + "\x1b[0m";
}

std::string StyleManager::style(const std::string& text, TextStyle style) const {
  if(!enabled_ || style == TextStyle::Normal) return text;
  return std::string("\x1b[") + style_code(style) + "m" + text + "\x1b[0m";
}

std::string StyleManager::status_symbol(StatusKind kind) const {
  switch(kind) {
    case StatusKind::Success: return colorize("✓", Color::Green);
    case StatusKind::Error: return colorize("✗", Color::Red);
    case StatusKind::Warning: return colorize("⚠", Color::Yellow);
    case StatusKind::Info: return colorize("ℹ", Color::Blue);
    case StatusKind::InProgress: return colorize("⟳", Color::Cyan);
  }
  return "";
}

std::string StyleManager::status_line(StatusKind kind, const std::string& message) const {
  return status_symbol(kind) + " " + message;
}

std::size_t display_width(const std::string& text) {
  std::size_t width = 0;
  for(unsigned char ch : text) {
    if(!is_continuation(ch)) ++width;
  }
  return width;
}

std::string truncate_display(const std::string& text, std::size_t width) {
  if(display_width(text) <= width) return text;
  if(width <= 3) return std::string(width, '.');
  std::size_t keep = width - 3;
  std::size_t seen = 0;
  std::size_t cut = 0;
  for(; cut < text.size(); ++cut) {
    if(!is_continuation(static_cast<unsigned char>(text[cut]))) {
      if(seen == keep) break;
      ++seen;
    }
  }
  return text.substr(0, cut) + "...";
}

std::size_t terminal_width() {
  winsize ws{};
  if(ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
    return ws.ws_col;
  }
  if(const char* cols = std::getenv("COLUMNS")) {
    try {
      auto value = std::stoul(cols);
      if(value > 0) return value;
    } catch(const std::exception&) {
      // fall through to default
    }
  }
  return 80;
}

std::string format_bytes(uint64_t bytes) {
  static const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};
  if(bytes < 1024) return std::to_string(bytes) + " B";
  double value = static_cast<double>(bytes);
  std::size_t unit = 0;
  while(value >= 1024.0 && unit < 4) {
    value /= 1024.0;
    ++unit;
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << value << " " << kUnits[unit];
  return oss.str();
}

std::string format_rate(double bytes_per_second) {
  if(bytes_per_second < 0) bytes_per_second = 0;
  return format_bytes(static_cast<uint64_t>(bytes_per_second)) + "/s";
}

std::string format_duration(std::chrono::seconds duration) {
  auto secs = duration.count();
  if(secs < 0) secs = 0;
  if(secs < 60) return std::to_string(secs) + "s";
  if(secs < 3600) return std::to_string(secs / 60) + "m " + std::to_string(secs % 60) + "s";
  return std::to_string(secs / 3600) + "h " + std::to_string((secs % 3600) / 60) + "m";
}

TableFormatter::TableFormatter(const StyleManager& style, std::size_t width)
  : style_(style), width_(width == 0 ? terminal_width() : width) {}

std::vector<std::size_t> TableFormatter::column_widths(const TableData& table) const {
  std::vector<std::size_t> widths(table.headers.size(), 0);
  for(std::size_t i = 0; i < table.headers.size(); ++i) {
    widths[i] = display_width(table.headers[i]);
  }
  for(const auto& row : table.rows) {
    for(std::size_t i = 0; i < row.size() && i < widths.size(); ++i) {
      widths[i] = std::max(widths[i], display_width(row[i]));
    }
  }

  if(widths.empty()) return widths;

  // Trailing columns that cannot get a single cell are dropped.
  std::size_t columns = widths.size();
  while(columns > 1 && 4 * columns + 1 > width_) --columns;
  widths.resize(columns);

  const std::size_t overhead = 3 * columns + 1;
  std::size_t content = 0;
  for(auto w : widths) content += w;
  if(content + overhead <= width_) return widths;

  std::size_t available = std::max(width_ > overhead ? width_ - overhead : 0, columns);
  std::size_t total = 0;
  for(auto& w : widths) {
    std::size_t scaled = content == 0 ? 0 : (w * available) / content;
    w = std::min(w, std::max<std::size_t>(3, scaled));
    total += w;
  }
  while(total > available) {
    auto widest = std::max_element(widths.begin(), widths.end());
    if(*widest <= 1) break;
    --*widest;
    --total;
  }
  return widths;
}

std::string TableFormatter::render(const TableData& table) const {
  if(table.headers.empty()) return "";
  auto widths = column_widths(table);

  std::ostringstream out;
  out << border(widths, "┌", "┬", "┐") << "\n";
  out << "│";
  for(std::size_t i = 0; i < widths.size(); ++i) {
    auto cell = center(truncate_display(table.headers[i], widths[i]), widths[i]);
    out << " " << style_.bold(cell) << " │";
  }
  out << "\n";
  out << border(widths, "├", "┼", "┤") << "\n";
  for(const auto& row : table.rows) {
    out << "│";
    for(std::size_t i = 0; i < widths.size(); ++i) {
      std::string value = i < row.size() ? row[i] : std::string();
      out << " " << pad_right(truncate_display(value, widths[i]), widths[i]) << " │";
    }
    out << "\n";
  }
  out << border(widths, "└", "┴", "┘");
  return out.str();
}

nlohmann::json table_to_json(const TableData& table) {
  auto array = nlohmann::json::array();
  for(const auto& row : table.rows) {
    nlohmann::json obj = nlohmann::json::object();
    for(std::size_t i = 0; i < table.headers.size(); ++i) {
      if(i < row.size()) obj[table.headers[i]] = row[i];
    }
    array.push_back(std::move(obj));
  }
  return array;
}

std::string render_json(const nlohmann::json& value, bool pretty) {
  try {
    return pretty ? value.dump(2) : value.dump();
  } catch(const nlohmann::json::exception& e) {
    throw KizunaError::format(std::string("Failed to serialize JSON: ") + e.what());
  }
}

std::string csv_escape(const std::string& field) {
  // A bare empty field in a one-column row would be a blank line.
  if(field.empty()) return "\"\"";
  if(field.find_first_of(",\"\n\r") == std::string::npos) return field;
  std::string out = "\"";
  for(char ch : field) {
    if(ch == '"') out += "\"\"";
    else out += ch;
  }
  out += "\"";
  return out;
}

std::string render_csv(const TableData& table) {
  std::ostringstream out;
  auto write_row = [&](const std::vector<std::string>& row){
    for(std::size_t i = 0; i < row.size(); ++i) {
      if(i > 0) out << ",";
      out << csv_escape(row[i]);
    }
    out << "\n";
  };
  write_row(table.headers);
  for(const auto& row : table.rows) write_row(row);
  return out.str();
}

TableData parse_csv(const std::string& text) {
  std::vector<std::vector<std::string>> records;
  std::vector<std::string> record;
  std::string field;
  bool quoted = false;
  bool field_started = false;
  for(std::size_t i = 0; i < text.size(); ++i) {
    char ch = text[i];
    if(quoted) {
      if(ch == '"') {
        if(i + 1 < text.size() && text[i + 1] == '"') {
          field += '"';
          ++i;
        } else {
          quoted = false;
        }
      } else {
        field += ch;
      }
      continue;
    }
    if(ch == '"') {
      quoted = true;
      field_started = true;
    } else if(ch == ',') {
      record.push_back(std::move(field));
      field.clear();
      field_started = true;
    } else if(ch == '\n' || ch == '\r') {
      if(ch == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
      if(field_started || !field.empty() || !record.empty()) {
        record.push_back(std::move(field));
        records.push_back(std::move(record));
      }
      field.clear();
      record.clear();
      field_started = false;
    } else {
      field += ch;
      field_started = true;
    }
  }
  if(quoted) {
    throw KizunaError::format("Unterminated quoted CSV field");
  }
  if(field_started || !field.empty() || !record.empty()) {
    record.push_back(std::move(field));
    records.push_back(std::move(record));
  }

  TableData table;
  if(records.empty()) return table;
  table.headers = std::move(records.front());
  table.rows.assign(std::make_move_iterator(records.begin() + 1),
                    std::make_move_iterator(records.end()));
  return table;
}

std::string render_minimal(const TableData& table) {
  std::ostringstream out;
  for(const auto& row : table.rows) {
    for(std::size_t i = 0; i < row.size(); ++i) {
      if(i > 0) out << "\t";
      out << row[i];
    }
    out << "\n";
  }
  return out.str();
}

std::string ProgressRenderer::render_bar(double percent) const {
  double clamped = std::clamp(percent, 0.0, 100.0);
  auto filled = static_cast<std::size_t>((clamped / 100.0) * kBarWidth);
  if(filled > kBarWidth) filled = kBarWidth;
  std::string bar = repeat("█", filled) + repeat("░", kBarWidth - filled);
  Color color = clamped >= 100.0 ? Color::Green
              : clamped >= 50.0 ? Color::Cyan
              : Color::Yellow;
  std::ostringstream out;
  out << "[" << style_.colorize(bar, color) << "] "
      << std::fixed << std::setprecision(1) << clamped << "%";
  return out.str();
}

std::string ProgressRenderer::render_indeterminate(std::chrono::milliseconds elapsed) const {
  auto position = static_cast<std::size_t>((elapsed.count() / 100) % static_cast<long long>(kBarWidth));
  std::string bar;
  for(std::size_t i = 0; i < kBarWidth; ++i) {
    bool marker = i >= position && i < position + kMarkerWidth;
    bar += marker ? "█" : "░";
  }
  return "[" + style_.colorize(bar, Color::Cyan) + "]";
}

std::string ProgressRenderer::render_status(const ProgressInfo& progress) const {
  std::vector<std::string> parts;
  if(progress.total) {
    parts.push_back(format_bytes(progress.current) + " / " + format_bytes(*progress.total));
  } else {
    parts.push_back(format_bytes(progress.current));
  }
  if(progress.rate) parts.push_back(format_rate(*progress.rate));
  if(progress.eta) parts.push_back("ETA: " + format_duration(*progress.eta));
  std::string line;
  for(std::size_t i = 0; i < parts.size(); ++i) {
    if(i > 0) line += " | ";
    line += parts[i];
  }
  if(progress.message) line += "  " + *progress.message;
  return line;
}

std::string ProgressRenderer::render(const ProgressInfo& progress,
                                     std::chrono::milliseconds elapsed) const {
  auto pct = progress.percentage();
  std::string bar = pct ? render_bar(*pct) : render_indeterminate(elapsed);
  return bar + " " + render_status(progress);
}

OutputFormatter::OutputFormatter(OutputFormat format, ColorMode color, bool pipeline)
  : format_(format),
    style_(pipeline ? StyleManager(ColorMode::Never) : StyleManager(color)),
    pipeline_(pipeline) {}

OutputFormatter::OutputFormatter(OutputFormat format, StyleManager style, bool pipeline)
  : format_(format),
    style_(pipeline ? StyleManager(ColorMode::Never, false) : style),
    pipeline_(pipeline) {}

std::string OutputFormatter::render_table(const TableData& table) const {
  switch(format_) {
    case OutputFormat::Table:
      if(pipeline_) return render_minimal(table);
      return TableFormatter(style_).render(table);
    case OutputFormat::Json:
      return render_json(table_to_json(table), !pipeline_);
    case OutputFormat::Csv:
      return render_csv(table);
    case OutputFormat::Minimal:
      return render_minimal(table);
  }
  return render_minimal(table);
}

std::string OutputFormatter::render(const CommandOutput& output) const {
  switch(output.type) {
    case CommandOutput::Type::Text:
      if(format_ == OutputFormat::Json) {
        return render_json(nlohmann::json{{"message", output.text}}, !pipeline_);
      }
      return output.text;
    case CommandOutput::Type::Table:
      return render_table(output.table);
    case CommandOutput::Type::Json:
      if(format_ == OutputFormat::Json || format_ == OutputFormat::Table) {
        return render_json(output.json, !pipeline_);
      }
      return render_json(output.json, false);
    case CommandOutput::Type::Progress: {
      if(format_ == OutputFormat::Json) {
        return render_json(nlohmann::json(output.progress), !pipeline_);
      }
      ProgressRenderer renderer(style_);
      if(pipeline_) return renderer.render_status(output.progress);
      return renderer.render(output.progress, std::chrono::milliseconds(0));
    }
    case CommandOutput::Type::Interactive:
      return "";
  }
  return "";
}
