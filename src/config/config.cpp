// ==============================================================================
// config.cpp - Конфигурация читателя
// ==============================================================================

#include <artifacts/config.hpp>
#include <artifacts/platform.hpp>

#include <initializer_list>
#include <string>

#include <yaml-cpp/yaml.h>

namespace artifacts {

namespace {

/// Ошибка разбора конкретного ключа
struct KeyError {
    std::string message;
    std::string key;
};

void check_keys(const YAML::Node& node, std::initializer_list<const char*> known,
                const std::string& scope) {
    for (const auto& item : node) {
        std::string key = item.first.as<std::string>();
        bool found = false;
        for (const char* k : known) {
            if (key == k) {
                found = true;
                break;
            }
        }
        if (!found) {
            throw KeyError{"unknown key", scope.empty() ? key : scope + "." + key};
        }
    }
}

std::size_t positive_size(const YAML::Node& node, const std::string& key) {
    long long value = node.as<long long>();
    if (value <= 0) {
        throw KeyError{"must be a positive integer", key};
    }
    return static_cast<std::size_t>(value);
}

void apply_output(const YAML::Node& node, output::OutputConfig& out) {
    if (node.IsNull()) {
        return;
    }
    if (!node.IsMap()) {
        throw KeyError{"must be a mapping", "output"};
    }
    check_keys(node, {"quiet", "verbose", "log_path"}, "output");

    if (node["quiet"]) {
        out.quiet = node["quiet"].as<bool>();
    }
    if (node["verbose"]) {
        out.verbose = node["verbose"].as<int>();
    }
    if (node["log_path"]) {
        out.log_path = platform::path_from_utf8(node["log_path"].as<std::string>());
    }
}

ReaderConfig parse_root(const YAML::Node& root) {
    ReaderConfig config;

    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw KeyError{"configuration must be a mapping", ""};
    }

    check_keys(root,
               {"validate_checksums", "record_recovery", "message_separator", "message_limit",
                "max_diagnostics", "output"},
               "");

    if (root["validate_checksums"]) {
        config.validate_checksums = root["validate_checksums"].as<bool>();
    }
    if (root["record_recovery"]) {
        std::string name = root["record_recovery"].as<std::string>();
        auto policy = recovery_policy_from_string(name);
        if (!policy) {
            throw KeyError{"expected 'stop' or 'scan', got '" + name + "'", "record_recovery"};
        }
        config.record_recovery = *policy;
    }
    if (root["message_separator"]) {
        config.message_separator = root["message_separator"].as<std::string>();
    }
    if (root["message_limit"]) {
        config.message_limit = positive_size(root["message_limit"], "message_limit");
    }
    if (root["max_diagnostics"]) {
        config.max_diagnostics = positive_size(root["max_diagnostics"], "max_diagnostics");
    }
    if (root["output"]) {
        apply_output(root["output"], config.output);
    }

    return config;
}

}  // namespace

ExtractorOptions ReaderConfig::extractor_options() const {
    ExtractorOptions options;
    options.separator = message_separator;
    options.message_limit = message_limit;
    return options;
}

std::string ConfigError::format() const {
    if (context.empty()) {
        return message;
    }
    return context + ": " + message;
}

ConfigResult parse_config(const std::string& yaml_text) {
    ConfigResult result;
    try {
        result.config = parse_root(YAML::Load(yaml_text));
        result.ok = true;
    } catch (const KeyError& e) {
        result.error = ConfigError{e.message, e.key};
    } catch (const YAML::Exception& e) {
        result.error = ConfigError{e.what(), ""};
    }
    return result;
}

ConfigResult load_config(const std::filesystem::path& path) {
    ConfigResult result;
    std::string path_str = platform::path_to_utf8(path);
    try {
        result.config = parse_root(YAML::LoadFile(path_str));
        result.ok = true;
    } catch (const KeyError& e) {
        result.error = ConfigError{e.message, path_str + ": " + e.key};
    } catch (const YAML::Exception& e) {
        result.error = ConfigError{e.what(), path_str};
    }
    return result;
}

}  // namespace artifacts
