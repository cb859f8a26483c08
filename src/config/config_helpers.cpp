#include <ragloop/config/config_helpers.h>

#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>

namespace ragloop::config {

namespace {

std::string trimmed(std::string_view raw) {
    std::string s(raw);
    trim(s);
    return s;
}

// Strip a trailing "# comment" that is not inside a quoted string
std::string strip_inline_comment(const std::string& v) {
    char quote = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return v.substr(0, i);
        }
    }
    return v;
}

} // namespace

Result<long long> parse_integer(std::string_view raw) {
    const std::string s = trimmed(raw);
    long long out = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size()) {
        return Error{ErrorCode::InvalidArgument, "not an integer: '" + s + "'"};
    }
    return out;
}

Result<double> parse_double(std::string_view raw) {
    const std::string s = trimmed(raw);
    if (s.empty()) {
        return Error{ErrorCode::InvalidArgument, "not a number: ''"};
    }
    std::istringstream in(s);
    in.imbue(std::locale::classic());
    double out = 0.0;
    in >> out;
    if (in.fail() || !in.eof()) {
        return Error{ErrorCode::InvalidArgument, "not a number: '" + s + "'"};
    }
    return out;
}

Result<bool> parse_bool(std::string_view raw) {
    std::string s = trimmed(raw);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "true" || s == "1" || s == "yes" || s == "on")
        return true;
    if (s == "false" || s == "0" || s == "no" || s == "off")
        return false;
    return Error{ErrorCode::InvalidArgument, "not a boolean: '" + s + "'"};
}

Result<std::chrono::milliseconds> parse_ms(std::string_view raw) {
    auto v = parse_integer(raw);
    if (!v) {
        return v.error();
    }
    if (v.value() < 0) {
        return Error{ErrorCode::InvalidArgument, "negative duration: " + std::string(raw)};
    }
    return std::chrono::milliseconds(v.value());
}

ConfigValues parse_config_text(std::string_view text) {
    ConfigValues values;
    std::istringstream in{std::string(text)};
    std::string line;
    std::string currentSection;

    while (std::getline(in, line)) {
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
        std::string v = strip_inline_comment(line.substr(eq + 1));
        trim(k);
        if (k.empty()) {
            continue;
        }

        // Support both "retrieval.policy" and "[retrieval] policy"
        const std::string fullKey =
            (currentSection.empty() || k.find('.') != std::string::npos) ? k
                                                                         : currentSection + "." + k;
        values[fullKey] = unquote(v);
    }
    return values;
}

Result<ConfigValues> parse_config_file(const std::filesystem::path& config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        return ConfigValues{};
    }
    std::ifstream file(config_path);
    if (!file) {
        return Error{ErrorCode::PermissionDenied,
                     "cannot open config file: " + config_path.string()};
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_config_text(buffer.str());
}

std::filesystem::path get_config_dir() {
    if (auto xdg = env_value("XDG_CONFIG_HOME")) {
        return std::filesystem::path(*xdg) / "ragloop";
    }
    if (auto home = env_value("HOME")) {
        return std::filesystem::path(*home) / ".config" / "ragloop";
    }
    return std::filesystem::path("~/.config") / "ragloop";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (auto env = env_value("RAGLOOP_CONFIG")) {
        return expand_tilde(*env);
    }
    return get_config_dir() / "config.toml";
}

} // namespace ragloop::config
