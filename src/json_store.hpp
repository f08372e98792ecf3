#pragma once

#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

// Small JSON documents kept on disk (identity, trust list, clipboard).
// A missing file reads as nullopt; unreadable or malformed files and failed
// writes throw KizunaError(Io).
std::optional<nlohmann::json> read_json_file(const std::filesystem::path& path);
// Writes through a temporary file so a crash never leaves half a document.
void write_json_file(const std::filesystem::path& path, const nlohmann::json& doc);
