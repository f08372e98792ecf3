#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

#include "output_formatter.hpp"
#include "tui_state.hpp"

// Draws TuiState into fixed-size frames. Lines are fitted to the width before
// colour is applied so that escape codes never count against the layout.
class TuiRenderer {
public:
  explicit TuiRenderer(StyleManager style) : style_(style) {}

  std::vector<std::string> render(const TuiState& state, std::size_t width, std::size_t height) const;

  static const char* trust_icon(TrustStatus status);
  static const char* connection_icon(ConnectionStatus status);
  // One block glyph per sample, scaled to the largest sample.
  static std::string sparkline(const std::deque<double>& samples, std::size_t width);
  static std::string fit(const std::string& text, std::size_t width);

private:
  using Lines = std::vector<std::string>;

  std::string tabs(const TuiState& state, std::size_t width) const;
  Lines peer_view(const TuiState& state, std::size_t width, std::size_t height) const;
  Lines file_view(const TuiState& state, std::size_t width, std::size_t height) const;
  Lines transfer_view(const TuiState& state, std::size_t width, std::size_t height) const;
  Lines stream_view(const TuiState& state, std::size_t width, std::size_t height) const;
  Lines terminal_view(const TuiState& state, std::size_t width, std::size_t height) const;
  Lines settings_view(const TuiState& state, std::size_t width, std::size_t height) const;
  Lines status_bar(const TuiState& state, std::size_t width) const;

  std::string row(const std::string& text, std::size_t width, bool selected) const;
  std::string operation_row(const OperationStatus& op, std::size_t width, bool selected) const;

  StyleManager style_;
};

// Whole-screen redraw: cursor home, each line cleared to the end.
std::string compose_frame(const std::vector<std::string>& lines);
