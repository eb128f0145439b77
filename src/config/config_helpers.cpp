#include <docent/config/config_helpers.h>

#include <cstdlib>
#include <fstream>

namespace docent::config {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\f\v";

std::string_view stripped(std::string_view text) {
    auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos)
        return {};
    auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return value && *value ? value : nullptr;
}

// Drops a trailing comment and surrounding quotes from the right-hand side of "key = value".
std::string cleanValue(std::string_view raw) {
    raw = stripped(raw);
    if (raw.empty())
        return {};

    char quote = raw.front();
    if (quote == '"' || quote == '\'') {
        auto closing = raw.find(quote, 1);
        if (closing == std::string_view::npos)
            return std::string(raw);
        return std::string(raw.substr(1, closing - 1));
    }

    if (auto hash = raw.find('#'); hash != std::string_view::npos)
        raw = stripped(raw.substr(0, hash));
    return std::string(raw);
}

} // namespace

ConfigMap parse_config_file(const std::filesystem::path& config_path) {
    ConfigMap values;
    std::ifstream in(config_path);
    if (!in)
        return values;

    std::string section;
    std::string buffer;
    while (std::getline(in, buffer)) {
        std::string_view line = stripped(buffer);
        if (line.empty() || line.front() == '#')
            continue;

        if (line.front() == '[') {
            auto close = line.find(']');
            if (close != std::string_view::npos)
                section = std::string(stripped(line.substr(1, close - 1)));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string_view::npos)
            continue;

        auto key = std::string(stripped(line.substr(0, eq)));
        if (key.empty())
            continue;
        values[section.empty() ? key : section + "." + key] = cleanValue(line.substr(eq + 1));
    }
    return values;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    const auto values = parse_config_file(config_path);
    auto found = values.find(section.empty() ? key : section + "." + key);
    return found != values.end() ? found->second : std::string{};
}

std::filesystem::path expand_tilde(std::string_view path) {
    const char* home = env("HOME");
    if (!home || path.empty() || path.front() != '~')
        return std::filesystem::path(path);
    if (path.size() == 1)
        return std::filesystem::path(home);
    if (path[1] != '/')
        return std::filesystem::path(path);
    return std::filesystem::path(home) / path.substr(2);
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty())
        return override_path;
    if (const char* explicitPath = env("DOCENT_CONFIG"))
        return explicitPath;

    std::filesystem::path base;
    if (const char* xdg = env("XDG_CONFIG_HOME")) {
        base = xdg;
    } else if (const char* home = env("HOME")) {
        base = std::filesystem::path(home) / ".config";
    } else {
        base = ".config";
    }
    return base / "docent" / "config.toml";
}

std::filesystem::path get_data_dir() {
    if (const char* xdg = env("XDG_DATA_HOME"))
        return std::filesystem::path(xdg) / "docent";
    if (const char* home = env("HOME"))
        return std::filesystem::path(home) / ".local" / "share" / "docent";
    return std::filesystem::current_path() / "docent_data";
}

} // namespace docent::config
