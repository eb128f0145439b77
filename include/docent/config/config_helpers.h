#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace docent::config {

/// Keys of a TOML-style file flattened to "section.key", values unquoted.
using ConfigMap = std::map<std::string, std::string>;

/**
 * @brief Reads the flat subset of TOML the engine understands.
 *
 * Supports [section] headers, key = value pairs, quoted strings and # comments. Nested tables,
 * arrays and multi-line strings are not recognised. A missing file yields an empty map.
 */
ConfigMap parse_config_file(const std::filesystem::path& config_path);

/// One value from parse_config_file, or "" when absent.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// "~" or "~/x" relative to $HOME; other paths are returned unchanged.
std::filesystem::path expand_tilde(std::string_view path);

/// Explicit path, then $DOCENT_CONFIG, then $XDG_CONFIG_HOME (or ~/.config)/docent/config.toml.
std::filesystem::path get_config_path(const std::string& override_path = "");

/// $XDG_DATA_HOME/docent, ~/.local/share/docent, or ./docent_data without a home directory.
std::filesystem::path get_data_dir();

} // namespace docent::config
