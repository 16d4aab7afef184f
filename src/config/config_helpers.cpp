#include <tensorwire/config/config_helpers.h>

#include <spdlog/spdlog.h>
#include <fstream>

namespace tensorwire::config {

namespace {

std::string lowercase(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Env first, then the config file
std::string lookup_setting(const char* env_name, const std::filesystem::path& config_path,
                           const std::string& section, const std::string& key) {
    if (const char* env = std::getenv(env_name); env && *env) {
        return env;
    }
    return parse_config_value(config_path, section, key);
}

} // namespace

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

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
                in_target_section = (section.empty() || currentSection == section);
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
        trim(v);

        // Remove inline comments
        size_t comment = v.find('#');
        if (comment != std::string::npos) {
            v = v.substr(0, comment);
            trim(v);
        }

        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* cfg_env = std::getenv("TENSORWIRE_CONFIG"); cfg_env && *cfg_env) {
        return expand_tilde(cfg_env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "tensorwire" / "config.toml";
    }

    return configHome / "tensorwire" / "config.toml";
}

std::optional<codec::PaddingPolicy> parse_padding_policy(std::string_view value) {
    const auto v = lowercase(value);
    if (v == "edge" || v == "edge_replicate" || v == "pad")
        return codec::PaddingPolicy::EdgeReplicate;
    if (v == "reject" || v == "strict")
        return codec::PaddingPolicy::Reject;
    return std::nullopt;
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view value) {
    const auto v = lowercase(value);
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

codec::CodecOptions resolve_codec_options_from_config(const std::string& override_path) {
    codec::CodecOptions options;
    const auto config_path = get_config_path(override_path);

    if (auto raw = lookup_setting("TENSORWIRE_PADDING_POLICY", config_path, "decode", "padding");
        !raw.empty()) {
        if (auto policy = parse_padding_policy(raw)) {
            options.padding = *policy;
        } else {
            spdlog::warn("Ignoring unknown padding policy '{}'", raw);
        }
    }

    if (auto raw = lookup_setting("TENSORWIRE_SAMPLE_TYPE", config_path, "assemble", "sample_type");
        !raw.empty()) {
        if (auto type = codec::parseElementType(raw)) {
            options.sampleType = *type;
        } else {
            spdlog::warn("Ignoring unknown sample element type '{}'", raw);
        }
    }

    return options;
}

spdlog::level::level_enum apply_log_level_from_env(const std::string& override_path) {
    const auto raw =
        lookup_setting("TENSORWIRE_LOG_LEVEL", get_config_path(override_path), "logging", "level");
    if (!raw.empty()) {
        if (auto lvl = parse_log_level(raw)) {
            spdlog::set_level(*lvl);
        } else {
            spdlog::warn("Ignoring unknown log level '{}'", raw);
        }
    }
    return spdlog::get_level();
}

} // namespace tensorwire::config
