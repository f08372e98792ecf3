#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

enum class StatusKind { Success, Error, Warning, Info, InProgress };

class StyleManager {
public:
  explicit StyleManager(ColorMode mode = ColorMode::Auto);
  // terminal overrides the isatty check used by ColorMode::Auto.
  StyleManager(ColorMode mode, bool terminal);

  bool colors_enabled() const { return enabled_; }
  ColorMode mode() const { return mode_; }

  std::string colorize(const std::string& text, Color color) const;
  std::string style(const std::string& text, TextStyle style) const;
  std::string bold(const std::string& text) const { return style(text, TextStyle::Bold); }

  std::string status_symbol(StatusKind kind) const;
  std::string status_line(StatusKind kind, const std::string& message) const;

  static bool auto_detect(bool terminal);

private:
  ColorMode mode_;
  bool enabled_ = false;
};

std::size_t display_width(const std::string& text);
std::string truncate_display(const std::string& text, std::size_t width);
std::size_t terminal_width();

std::string format_bytes(uint64_t bytes);
std::string format_rate(double bytes_per_second);
std::string format_duration(std::chrono::seconds duration);

class TableFormatter {
public:
  explicit TableFormatter(const StyleManager& style, std::size_t width = 0);

  std::string render(const TableData& table) const;
  std::vector<std::size_t> column_widths(const TableData& table) const;

private:
  const StyleManager& style_;
  std::size_t width_;
};

nlohmann::json table_to_json(const TableData& table);
std::string render_json(const nlohmann::json& value, bool pretty);
std::string csv_escape(const std::string& field);
std::string render_csv(const TableData& table);
TableData parse_csv(const std::string& text);
std::string render_minimal(const TableData& table);

class ProgressRenderer {
public:
  static constexpr std::size_t kBarWidth = 40;
  static constexpr std::size_t kMarkerWidth = 5;

  explicit ProgressRenderer(const StyleManager& style) : style_(style) {}

  std::string render_bar(double percent) const;
  std::string render_indeterminate(std::chrono::milliseconds elapsed) const;
  std::string render_status(const ProgressInfo& progress) const;
  // Bar (or marker) plus status line.
  std::string render(const ProgressInfo& progress, std::chrono::milliseconds elapsed) const;

private:
  const StyleManager& style_;
};

// Chooses the renderer by OutputFormat. Pipeline mode drops colour and
// decorative chrome so each record is a single line.
class OutputFormatter {
public:
  OutputFormatter(OutputFormat format, ColorMode color, bool pipeline = false);
  OutputFormatter(OutputFormat format, StyleManager style, bool pipeline);

  OutputFormat format() const { return format_; }
  bool pipeline() const { return pipeline_; }
  const StyleManager& style() const { return style_; }

  std::string render(const CommandOutput& output) const;
  std::string render_table(const TableData& table) const;

private:
  OutputFormat format_;
  StyleManager style_;
  bool pipeline_ = false;
};
