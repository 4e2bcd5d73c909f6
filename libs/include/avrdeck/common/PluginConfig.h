#pragma once

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace avrdeck::common {

/// Which controls receive a receiver's status text when it changes.
enum class StatusScope {
    BoundControls,
    FocusedInspector,
};

struct PluginConfig {
    StatusScope statusScope{StatusScope::BoundControls};
    // Unset keeps receivers connected for the lifetime of the process.
    std::optional<std::chrono::milliseconds> idleConnectionTimeout;
    std::string logLevel{"info"};
    std::string placeholderLabel{"Select a receiver"};
};

StatusScope parseStatusScope(std::string_view text);

/// spdlog level names accepted by log_level and --log-level.
const std::vector<std::string>& logLevelNames();
/// @throws std::runtime_error for names spdlog does not know.
spdlog::level::level_enum parseLogLevel(const std::string& text);
std::string_view toString(StatusScope scope);

PluginConfig pluginConfigFromJson(const nlohmann::json& root);
PluginConfig loadPluginConfig(const std::filesystem::path& path);

}  // namespace avrdeck::common
