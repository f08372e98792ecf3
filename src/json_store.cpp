#include "json_store.hpp"

#include <fstream>
#include <system_error>

#include "errors.hpp"

std::optional<nlohmann::json> read_json_file(const std::filesystem::path& path) {
  std::error_code ec;
  if(!std::filesystem::exists(path, ec)) return std::nullopt;
  std::ifstream in(path);
  if(!in) throw KizunaError::io("unable to read " + path.string());
  try {
    nlohmann::json doc;
    in >> doc;
    return doc;
  } catch(const nlohmann::json::exception& e) {
    throw KizunaError::io("failed to parse " + path.string() + ": " + e.what());
  }
}

void write_json_file(const std::filesystem::path& path, const nlohmann::json& doc) {
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if(ec) throw KizunaError::io("unable to create " + path.parent_path().string() + ": " + ec.message());
  }
  auto temp = path;
  temp += ".tmp";
  {
    std::ofstream out(temp, std::ios::trunc);
    if(!out) throw KizunaError::io("unable to write " + temp.string());
    out << doc.dump(2);
    if(!out) throw KizunaError::io("unable to write " + temp.string());
  }
  std::filesystem::rename(temp, path, ec);
  if(ec) throw KizunaError::io("unable to replace " + path.string() + ": " + ec.message());
}
