/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/CollisionConfig.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <cmath>
#include <limits>
#include <string>

namespace CosmicEngine {

namespace {
// Reads a finite number above (or, with allowZero, at) zero. Anything else
// is reported and leaves 'out' alone.
bool readNonNegative(const std::string& key, const JsonValue& value, bool allowZero, double& out) {
    const auto number = value.tryAsNumber();
    if (!number.has_value() || !std::isfinite(*number)) {
        CONFIG_WARN("Ignoring '" + key + "': expected a number");
        return false;
    }
    if (*number < 0.0 || (!allowZero && *number == 0.0)) {
        CONFIG_WARN("Ignoring '" + key + "': out of range (" + std::to_string(*number) + ")");
        return false;
    }
    out = *number;
    return true;
}

// Same, but the value must also fit in a float
bool readFloat(const std::string& key, const JsonValue& value, bool allowZero, float& out) {
    double number = 0.0;
    if (!readNonNegative(key, value, allowZero, number)) {
        return false;
    }
    if (number > static_cast<double>(std::numeric_limits<float>::max())) {
        CONFIG_WARN("Ignoring '" + key + "': too large (" + std::to_string(number) + ")");
        return false;
    }
    out = static_cast<float>(number);
    return true;
}

// A whole number in [1, SIZE_MAX)
bool readCount(const std::string& key, const JsonValue& value, size_t& out) {
    double number = 0.0;
    if (!readNonNegative(key, value, false, number)) {
        return false;
    }
    if (number < 1.0 || std::floor(number) != number) {
        CONFIG_WARN("Ignoring '" + key + "': expected a whole number of at least 1");
        return false;
    }
    // size_t max rounds up to 2^64 as a double, which no longer converts
    if (!(number < static_cast<double>(std::numeric_limits<size_t>::max()))) {
        CONFIG_WARN("Ignoring '" + key + "': too large (" + std::to_string(number) + ")");
        return false;
    }
    out = static_cast<size_t>(number);
    return true;
}
} // namespace

bool CollisionConfig::loadFromFile(const std::string& path) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        CONFIG_ERROR("Failed to load collision config from " + path + ": " + reader.getLastError());
        return false;
    }
    if (!apply(reader.getRoot())) {
        CONFIG_ERROR("No usable \"collision\" section in " + path);
        return false;
    }
    CONFIG_INFO("Loaded collision config from " + path);
    return true;
}

bool CollisionConfig::loadFromString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        CONFIG_ERROR("Failed to parse collision config: " + reader.getLastError());
        return false;
    }
    return apply(reader.getRoot());
}

bool CollisionConfig::apply(const JsonValue& root) {
    const JsonObject* section = root["collision"].tryAsObject();
    if (section == nullptr) {
        CONFIG_WARN("Missing \"collision\" object");
        return false;
    }

    for (const auto& [key, value] : *section) {
        if (key == "cellSize") {
            readFloat(key, value, false, cellSize);
        } else if (key == "maxChecksPerFrame") {
            readCount(key, value, maxChecksPerFrame);
        } else if (key == "queryPadding") {
            readFloat(key, value, true, queryPadding);
        } else if (key == "separationBuffer") {
            readFloat(key, value, true, separationBuffer);
        } else {
            CONFIG_WARN("Unknown collision config key '" + key + "'");
        }
    }

    CONFIG_DEBUG("cellSize=" + std::to_string(cellSize) +
                 " maxChecksPerFrame=" + std::to_string(maxChecksPerFrame) +
                 " queryPadding=" + std::to_string(queryPadding) +
                 " separationBuffer=" + std::to_string(separationBuffer));
    return true;
}

} // namespace CosmicEngine
