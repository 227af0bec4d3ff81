#include <codectx/config/config_helpers.h>

#include <charconv>
#include <cstdlib>
#include <fstream>

namespace codectx::config {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Splits "key = value # comment" into a trimmed key and unquoted value
bool split_key_value(const std::string& line, std::string& key, std::string& value) {
    size_t eq = line.find('=');
    if (eq == std::string::npos) {
        return false;
    }
    key = line.substr(0, eq);
    value = line.substr(eq + 1);
    trim(key);
    trim(value);

    // Inline comments only outside quotes
    if (!value.empty() && value.front() != '"' && value.front() != '\'') {
        size_t comment = value.find('#');
        if (comment != std::string::npos) {
            value = value.substr(0, comment);
            trim(value);
        }
    }
    value = unquote(value);
    return !key.empty();
}

} // namespace

Result<bool> parse_bool(std::string_view raw) {
    std::string v = lowercase(unquote(std::string(raw)));
    if (v == "true" || v == "yes" || v == "on" || v == "1") {
        return true;
    }
    if (v == "false" || v == "no" || v == "off" || v == "0") {
        return false;
    }
    return Error{ErrorCode::Config, fmt::format("invalid boolean value '{}'", raw)};
}

Result<int64_t> parse_int(std::string_view raw) {
    std::string v = unquote(std::string(raw));
    int64_t out = 0;
    const char* first = v.data();
    const char* last = v.data() + v.size();
    if (first != last && *first == '+') {
        ++first;
    }
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last || first == last) {
        return Error{ErrorCode::Config, fmt::format("invalid integer value '{}'", raw)};
    }
    return out;
}

Result<std::map<std::string, std::string>>
parse_config_file(const std::filesystem::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        return Error{ErrorCode::Config,
                     fmt::format("cannot open config file '{}'", config_path.string())};
    }

    std::map<std::string, std::string> values;
    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        std::string k;
        std::string v;
        if (!split_key_value(line, k, v)) {
            continue;
        }
        values[currentSection.empty() ? k : currentSection + "." + k] = v;
    }

    return values;
}

std::filesystem::path get_data_dir() {
    if (const char* xdgData = std::getenv("XDG_DATA_HOME"); xdgData && *xdgData) {
        return std::filesystem::path(xdgData) / "codectx";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".local" / "share" / "codectx";
    }
    return std::filesystem::path(".codectx");
}

} // namespace codectx::config
