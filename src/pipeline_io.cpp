#include "pipeline_io.hpp"

#include <istream>
#include <iterator>
#include <ostream>

#include <spdlog/fmt/fmt.h>
#include <unistd.h>

#include "errors.hpp"
#include "output_formatter.hpp"
#include "utils.hpp"

bool stdin_is_terminal() {
  return ::isatty(STDIN_FILENO) == 1;
}

std::string read_all(std::istream& in) {
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if(in.bad()) throw KizunaError::io("failed to read standard input");
  return content;
}

std::vector<std::string> read_lines(std::istream& in) {
  std::vector<std::string> lines;
  std::string line;
  while(std::getline(in, line)) {
    auto trimmed = trim_copy(line);
    if(!trimmed.empty()) lines.push_back(std::move(trimmed));
  }
  if(in.bad()) throw KizunaError::io("failed to read standard input");
  return lines;
}

std::vector<std::filesystem::path> parse_file_list(std::istream& in) {
  std::vector<std::filesystem::path> files;
  for(auto& line : read_lines(in)) files.emplace_back(line);
  return files;
}

std::vector<std::string> parse_peer_list(std::istream& in) {
  return read_lines(in);
}

BatchRequest parse_batch_json(const std::string& text) {
  nlohmann::json input;
  try {
    input = nlohmann::json::parse(text);
  } catch(const nlohmann::json::parse_error& e) {
    throw KizunaError::parse(std::string("Failed to parse JSON input: ") + e.what());
  }
  if(!input.is_object()) throw KizunaError::parse("Failed to parse JSON input: expected an object");

  BatchRequest request;
  try {
    for(const auto& file : input.at("files")) request.files.emplace_back(file.get<std::string>());
    for(const auto& peer : input.at("peers")) request.peers.push_back(peer.get<std::string>());
    if(input.contains("compression") && !input["compression"].is_null()) {
      request.compression = input["compression"].get<bool>();
    }
    if(input.contains("encryption") && !input["encryption"].is_null()) {
      request.encryption = input["encryption"].get<bool>();
    }
    request.parallel = input.value("parallel", false);
    if(input.contains("max_concurrent") && !input["max_concurrent"].is_null()) {
      auto value = input["max_concurrent"].get<int64_t>();
      if(value < 0) throw KizunaError::invalid_argument_value("max_concurrent", "must not be negative");
      request.max_concurrent = static_cast<std::size_t>(value);
    }
  } catch(const nlohmann::json::exception& e) {
    throw KizunaError::parse(std::string("Failed to parse JSON input: ") + e.what());
  }
  return request;
}

TableData peers_table(const std::vector<PeerInfo>& peers) {
  TableData table;
  table.headers = {"id", "name", "device_type", "connection_status", "trust_status"};
  for(const auto& peer : peers) {
    table.rows.push_back({peer.id, peer.name, peer.device_type,
                          to_string(peer.connection_status), to_string(peer.trust_status)});
  }
  return table;
}

TableData operations_table(const std::vector<OperationStatus>& operations) {
  TableData table;
  table.headers = {"id", "kind", "peer", "state", "progress"};
  for(const auto& op : operations) {
    std::string progress;
    if(op.progress) {
      if(auto percent = op.progress->percentage()) {
        progress = fmt::format("{:.1f}%", *percent);
      } else if(op.progress->message) {
        progress = *op.progress->message;
      }
    }
    table.rows.push_back({op.operation_id, to_string(op.kind), op.peer_id, describe(op.state), progress});
  }
  return table;
}

TableData batch_table(const BatchResult& result) {
  TableData table;
  table.headers = {"operation_id", "file", "peer", "status", "error"};
  for(const auto& item : result.operations) {
    table.rows.push_back({item.operation_id, item.file.string(), item.peer,
                          describe(item.state), item.error.value_or("")});
  }
  return table;
}

PipelineOutput::PipelineOutput(std::ostream& out, OutputFormat format)
  : out_(out),
    format_(format) {}

void PipelineOutput::write(const std::string& text) {
  out_ << text;
  if(!text.empty() && text.back() != '\n') out_ << '\n';
  out_.flush();
  if(!out_) throw KizunaError::io("failed to write standard output");
}

void PipelineOutput::write_peer_list(const std::vector<PeerInfo>& peers) {
  switch(format_) {
    case OutputFormat::Json:
      write(render_json(nlohmann::json(peers), false));
      break;
    case OutputFormat::Csv:
      write(render_csv(peers_table(peers)));
      break;
    case OutputFormat::Minimal:
    case OutputFormat::Table: {
      std::string out;
      for(const auto& peer : peers) out += peer.name + "\n";
      write(out);
      break;
    }
  }
}

void PipelineOutput::write_batch_result(const BatchResult& result) {
  switch(format_) {
    case OutputFormat::Json:
      write(render_json(nlohmann::json(result), false));
      break;
    case OutputFormat::Csv:
      write(render_csv(batch_table(result)));
      break;
    case OutputFormat::Minimal:
    case OutputFormat::Table:
      write(result.batch_id + " " + std::to_string(result.successful) + " " + std::to_string(result.failed));
      break;
  }
}
