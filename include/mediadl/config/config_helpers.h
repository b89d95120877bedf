#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace mediadl::config {

// Strip leading and trailing whitespace in place
void trim(std::string& s);

// Trim, then drop one pair of matching surrounding quotes ("..." or '...')
std::string unquote(std::string val);

// "~" and "~/..." relative to $HOME; anything else unchanged
std::filesystem::path expand_tilde(const std::string& path);

// Replace control and non-ASCII bytes with '?' before printing remote text
std::string sanitize_for_terminal(std::string_view in);

/**
 * Read every key of one [section] of a TOML-style file. Values are unquoted and stripped of
 * trailing comments. "section.key = value" lines outside any section are accepted too.
 * A missing file yields an empty map.
 */
std::map<std::string, std::string> parse_config_section(const std::filesystem::path& config_path,
                                                        const std::string& section);

/// Returns the user config directory: $XDG_CONFIG_HOME/mediadl or ~/.config/mediadl
std::filesystem::path get_config_dir();

// <config dir>/config.toml unless overridden
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace mediadl::config
