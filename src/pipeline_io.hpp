#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

#include "batch_orchestrator.hpp"
#include "types.hpp"

// ---- stdin -----------------------------------------------------------------

bool stdin_is_terminal();
std::string read_all(std::istream& in);
// Non-empty, trimmed lines.
std::vector<std::string> read_lines(std::istream& in);
std::vector<std::filesystem::path> parse_file_list(std::istream& in);
std::vector<std::string> parse_peer_list(std::istream& in);
// {files[], peers[], compression?, encryption?, parallel?, max_concurrent?}
BatchRequest parse_batch_json(const std::string& text);

// ---- machine-readable records ---------------------------------------------

TableData peers_table(const std::vector<PeerInfo>& peers);
TableData operations_table(const std::vector<OperationStatus>& operations);
TableData batch_table(const BatchResult& result);

// Writes one record per line (or one JSON document) with no decoration.
class PipelineOutput {
public:
  PipelineOutput(std::ostream& out, OutputFormat format);

  void write_peer_list(const std::vector<PeerInfo>& peers);
  void write_batch_result(const BatchResult& result);

private:
  void write(const std::string& text);

  std::ostream& out_;
  OutputFormat format_;
};
