#include <ranklab/config/config_helpers.h>

#include <exception>
#include <fstream>

namespace ranklab::config {

namespace {

// Drop a trailing "# comment" that is not inside quotes
void strip_inline_comment(std::string& v) {
    char quote = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
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

Result<ConfigValues> parse_config_file(const std::filesystem::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open config file: " + config_path.string()};
    }

    ConfigValues values;
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

        // Section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                return Error{ErrorCode::ParseError, config_path.string() + ":" +
                                                        std::to_string(lineNo) +
                                                        ": unterminated section header"};
            }
            currentSection = line.substr(1, end - 1);
            trim(currentSection);
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return Error{ErrorCode::ParseError, config_path.string() + ":" +
                                                    std::to_string(lineNo) +
                                                    ": expected key = value"};
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        strip_inline_comment(v);
        if (k.empty()) {
            return Error{ErrorCode::ParseError,
                         config_path.string() + ":" + std::to_string(lineNo) + ": empty key"};
        }

        values[currentSection.empty() ? k : currentSection + "." + k] = unquote(v);
    }

    return values;
}

Result<double> parse_double(const std::string& key, const std::string& value) {
    auto invalid = [&]() {
        return Error{ErrorCode::ConfigurationError,
                     "Invalid number for " + key + ": '" + value + "'"};
    };
    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            return invalid();
        }
        return parsed;
    } catch (const std::exception&) {
        return invalid();
    }
}

Result<int64_t> parse_int(const std::string& key, const std::string& value) {
    auto invalid = [&]() {
        return Error{ErrorCode::ConfigurationError,
                     "Invalid integer for " + key + ": '" + value + "'"};
    };
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            return invalid();
        }
        return static_cast<int64_t>(parsed);
    } catch (const std::exception&) {
        return invalid();
    }
}

std::filesystem::path get_config_dir() {
    if (const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
        xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "ranklab";
    }
    if (const char* homeEnv = std::getenv("HOME"); homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "ranklab";
    }
    return std::filesystem::path("~/.config") / "ranklab";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* cfg_env = std::getenv("RANKLAB_CONFIG"); cfg_env && *cfg_env) {
        return expand_tilde(cfg_env);
    }
    return get_config_dir() / "config.toml";
}

} // namespace ranklab::config
