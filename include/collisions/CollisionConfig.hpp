/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_CONFIG_HPP
#define COLLISION_CONFIG_HPP

#include <cstddef>
#include <string>

namespace CosmicEngine {

class JsonValue;

/**
 * @brief Tunables shared by the spatial index, pipeline and resolver
 *
 * Loadable from a JSON document holding a "collision" object:
 * @code
 * { "collision": { "cellSize": 64, "maxChecksPerFrame": 5000,
 *                  "queryPadding": 100, "separationBuffer": 0.1 } }
 * @endcode
 * Unknown keys and out-of-range values are logged and skipped; every field
 * that is not overridden keeps its current value.
 */
struct CollisionConfig {
    static constexpr float DEFAULT_CELL_SIZE = 64.0f;
    static constexpr size_t DEFAULT_MAX_CHECKS_PER_FRAME = 5000;
    static constexpr float DEFAULT_QUERY_PADDING = 100.0f;
    static constexpr float DEFAULT_SEPARATION_BUFFER = 0.1f;

    float cellSize{DEFAULT_CELL_SIZE};
    size_t maxChecksPerFrame{DEFAULT_MAX_CHECKS_PER_FRAME};
    float queryPadding{DEFAULT_QUERY_PADDING};
    float separationBuffer{DEFAULT_SEPARATION_BUFFER};

    // Returns false (config unchanged) if the file cannot be read or parsed,
    // or has no "collision" object
    bool loadFromFile(const std::string& path);
    bool loadFromString(const std::string& json);

    // Applies the "collision" object of an already parsed document
    bool apply(const JsonValue& root);

    bool operator==(const CollisionConfig& other) const = default;
};

} // namespace CosmicEngine

#endif // COLLISION_CONFIG_HPP
