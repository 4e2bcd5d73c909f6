#include "avrdeck/surface/ControlSurface.h"

#include <stdexcept>

namespace avrdeck::surface {

namespace {

using json = nlohmann::json;

constexpr const char* kHostKey = "host";
constexpr const char* kNameKey = "name";
constexpr const char* kStatusKey = "statusMsg";

std::string stringField(const json& value, const char* key) {
    auto it = value.find(key);
    if (it == value.end() || it->is_null()) {
        return {};
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    // Hosts occasionally arrive as numbers from hand-edited profiles.
    if (it->is_number()) {
        return it->dump();
    }
    throw std::runtime_error(std::string("Control setting '") + key + "' must be a string");
}

}  // namespace

ControlSettings ControlSettings::fromJson(const json& value) {
    ControlSettings settings;
    if (value.is_null()) {
        return settings;
    }
    if (!value.is_object()) {
        throw std::runtime_error("Control settings must be a JSON object");
    }

    settings.host = stringField(value, kHostKey);
    settings.name = stringField(value, kNameKey);
    settings.statusMessage = stringField(value, kStatusKey);

    for (const auto& [key, item] : value.items()) {
        if (key == kHostKey || key == kNameKey || key == kStatusKey) {
            continue;
        }
        settings.extra[key] = item;
    }
    return settings;
}

json ControlSettings::toJson() const {
    json root = extra.is_object() ? extra : json::object();
    if (!host.empty()) {
        root[kHostKey] = host;
    }
    if (!name.empty()) {
        root[kNameKey] = name;
    }
    root[kStatusKey] = statusMessage;
    return root;
}

}  // namespace avrdeck::surface
