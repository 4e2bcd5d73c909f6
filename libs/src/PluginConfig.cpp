#include "avrdeck/common/PluginConfig.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace avrdeck::common {

namespace {

using json = nlohmann::json;

}  // namespace

StatusScope parseStatusScope(std::string_view text) {
    if (text == "bound") {
        return StatusScope::BoundControls;
    }
    if (text == "inspector") {
        return StatusScope::FocusedInspector;
    }
    throw std::runtime_error("Unknown status_scope '" + std::string(text) +
                             "' (expected \"bound\" or \"inspector\")");
}

const std::vector<std::string>& logLevelNames() {
    static const std::vector<std::string> names{"trace", "debug", "info", "warn", "error", "critical", "off"};
    return names;
}

spdlog::level::level_enum parseLogLevel(const std::string& text) {
    const auto& names = logLevelNames();
    if (std::find(names.begin(), names.end(), text) == names.end()) {
        throw std::runtime_error("Unknown log_level '" + text + "'");
    }
    return spdlog::level::from_str(text);
}

std::string_view toString(StatusScope scope) {
    switch (scope) {
    case StatusScope::BoundControls:
        return "bound";
    case StatusScope::FocusedInspector:
        return "inspector";
    }
    return "bound";
}

PluginConfig pluginConfigFromJson(const json& root) {
    if (!root.is_object()) {
        throw std::runtime_error("Plugin config must contain an object at the root");
    }

    PluginConfig config;

    if (auto it = root.find("status_scope"); it != root.end()) {
        if (!it->is_string()) {
            throw std::runtime_error("status_scope must be a string");
        }
        config.statusScope = parseStatusScope(it->get<std::string>());
    }

    if (auto it = root.find("idle_connection_timeout_ms"); it != root.end() && !it->is_null()) {
        if (!it->is_number_integer() || it->get<long long>() < 0) {
            throw std::runtime_error("idle_connection_timeout_ms must be a non-negative integer or null");
        }
        config.idleConnectionTimeout = std::chrono::milliseconds(it->get<long long>());
    }

    if (auto it = root.find("log_level"); it != root.end()) {
        if (!it->is_string()) {
            throw std::runtime_error("log_level must be a string");
        }
        config.logLevel = it->get<std::string>();
        parseLogLevel(config.logLevel);
    }

    if (auto it = root.find("placeholder_label"); it != root.end()) {
        if (!it->is_string()) {
            throw std::runtime_error("placeholder_label must be a string");
        }
        config.placeholderLabel = it->get<std::string>();
    }

    return config;
}

PluginConfig loadPluginConfig(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open plugin config: " + path.string());
    }

    json root;
    try {
        input >> root;
    } catch (const json::parse_error& ex) {
        throw std::runtime_error("Failed to parse plugin config " + path.string() + ": " + ex.what());
    }
    return pluginConfigFromJson(root);
}

}  // namespace avrdeck::common
