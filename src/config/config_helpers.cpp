#include <mediadl/config/config_helpers.h>

#include <cctype>
#include <cstdlib>
#include <fstream>

namespace mediadl::config {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Drop a trailing "# comment" that is not inside quotes
void strip_inline_comment(std::string& v) {
    char quote = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        const char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            v.resize(i);
            break;
        }
    }
    trim(v);
}

} // namespace

void trim(std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && is_space(s[b]))
        ++b;
    while (e > b && is_space(s[e - 1]))
        --e;
    s = s.substr(b, e - b);
}

std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') &&
        val.back() == val.front()) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

std::filesystem::path expand_tilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/'))
        return path;
    const char* home = std::getenv("HOME");
    if (!home || !*home)
        return path;
    std::filesystem::path out(home);
    if (path.size() > 2)
        out /= path.substr(2);
    return out;
}

std::string sanitize_for_terminal(std::string_view in) {
    std::string out(in);
    for (auto& c : out) {
        const auto u = static_cast<unsigned char>(c);
        const bool printable = (u >= 0x20 && u < 0x7F) || c == '\n' || c == '\t';
        if (!printable)
            c = '?';
    }
    return out;
}

std::map<std::string, std::string> parse_config_section(const std::filesystem::path& config_path,
                                                        const std::string& section) {
    std::map<std::string, std::string> values;
    std::ifstream file(config_path);
    if (!file) {
        return values;
    }

    std::string line;
    std::string currentSection;
    const std::string dotted = section + ".";

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        strip_inline_comment(v);

        if (currentSection == section) {
            values[k] = unquote(v);
        } else if (currentSection.empty() && k.rfind(dotted, 0) == 0) {
            values[k.substr(dotted.size())] = unquote(v);
        }
    }

    return values;
}

std::filesystem::path get_config_dir() {
    if (const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME"); xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "mediadl";
    }
    if (const char* homeEnv = std::getenv("HOME"); homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "mediadl";
    }
    return std::filesystem::path("~/.config") / "mediadl";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    return get_config_dir() / "config.toml";
}

} // namespace mediadl::config
