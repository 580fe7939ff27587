#include <fstream>
#include <segdl/config/config_helpers.h>

namespace segdl::config {

namespace {

std::string lowercase(std::string_view in) {
    std::string out(in);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::optional<bool> parse_bool(std::string_view s) {
    std::string v = lowercase(s);
    trim(v);
    if (v == "true" || v == "yes" || v == "on" || v == "1")
        return true;
    if (v == "false" || v == "no" || v == "off" || v == "0")
        return false;
    return std::nullopt;
}

std::optional<std::uint64_t> parse_size(std::string_view s) {
    std::string v = lowercase(s);
    trim(v);
    if (v.empty())
        return std::nullopt;

    std::uint64_t mult = 1;
    if (v.size() > 1 && v.back() == 'b' && !std::isdigit(static_cast<unsigned char>(v[v.size() - 2])))
        v.pop_back(); // "kb", "mb", "gb"
    switch (v.back()) {
        case 'k':
            mult = 1024ULL;
            break;
        case 'm':
            mult = 1024ULL * 1024ULL;
            break;
        case 'g':
            mult = 1024ULL * 1024ULL * 1024ULL;
            break;
        default:
            break;
    }
    if (mult != 1)
        v.pop_back();

    auto n = parse_u64(v);
    if (!n)
        return std::nullopt;
    if (*n > UINT64_MAX / mult)
        return std::nullopt;
    return *n * mult;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    const std::string dotted = section.empty() ? key : section + "." + key;
    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments (outside quotes)
        if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos)
                v = v.substr(0, close + 1);
        } else if (size_t comment = v.find('#'); comment != std::string::npos) {
            v = v.substr(0, comment);
            trim(v);
        }

        const bool inSection = section.empty() ? currentSection.empty() : currentSection == section;
        if ((inSection && k == key) || (currentSection.empty() && k == dotted)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "segdl";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "segdl";
    }
    return std::filesystem::path("~/.config") / "segdl";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("SEGDL_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

} // namespace segdl::config
