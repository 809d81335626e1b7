#include <fmt/format.h>

#include <fstream>
#include <cvpipe/config/config_helpers.h>

namespace cvpipe::config {

namespace {

// Strip an inline '#' comment that is not inside quotes
void strip_inline_comment(std::string& v) {
    char quote = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            v.erase(i);
            break;
        }
    }
    trim(v);
}

} // namespace

Result<ConfigSections> parse_config_file(const std::filesystem::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        return Error{ErrorCode::FileNotFound,
                     fmt::format("Cannot open config file: {}", config_path.string())};
    }

    ConfigSections sections;
    std::string line;
    std::string currentSection;
    size_t lineNo = 0;

    while (std::getline(file, line)) {
        ++lineNo;
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                return Error{ErrorCode::InvalidArgument,
                             fmt::format("{}:{}: unterminated section header",
                                         config_path.string(), lineNo)};
            }
            currentSection = line.substr(1, end - 1);
            trim(currentSection);
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("{}:{}: expected key = value", config_path.string(), lineNo)};
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        strip_inline_comment(v);

        std::string section = currentSection;
        if (section.empty()) {
            if (auto dot = k.find('.'); dot != std::string::npos) {
                section = k.substr(0, dot);
                k = k.substr(dot + 1);
            }
        }
        sections[section][k] = unquote(v);
    }

    return sections;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto parsed = parse_config_file(config_path);
    if (!parsed) {
        return "";
    }
    const auto& sections = parsed.value();
    auto sec = sections.find(section);
    if (sec == sections.end()) {
        return "";
    }
    auto it = sec->second.find(key);
    return it != sec->second.end() ? it->second : "";
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::vector<std::string> out;
    std::string s = raw;
    trim(s);
    if (!s.empty() && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }

    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        std::string item =
            s.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        item = unquote(item);
        if (!item.empty()) {
            out.push_back(item);
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

std::optional<bool> parse_bool(std::string value) {
    trim(value);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "true" || value == "yes" || value == "on" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off" || value == "0") {
        return false;
    }
    return std::nullopt;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "cvpipe" / "config.toml";
    }

    return configHome / "cvpipe" / "config.toml";
}

} // namespace cvpipe::config
