/* Copyright (c) 2025 Tether Contributors
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef IDENTITY_CONFIG_HPP
#define IDENTITY_CONFIG_HPP

#include "scene/EntityHandle.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace Tether {

class JsonValue;

/**
 * @brief Visiting order of the load-time duplicate sweep. The first entity
 * visited keeps a contested id.
 */
enum class SweepOrder : uint8_t {
    ScanOrder = 0,      // pool enumeration order, same rule as runtime repair
    NameDescending = 1  // by display name, descending
};

const char* sweepOrderToString(SweepOrder order);
std::optional<SweepOrder> sweepOrderFromString(const std::string& text);

/**
 * @brief Tunables for the identity core
 *
 * Usage:
 *   IdentityConfig config;
 *   config.loadFromFile("res/tether.json"); // keeps defaults on failure
 *   IdentityService service(pool, config);
 *
 * File shape:
 *   {
 *     "identity": {
 *       "counter_start": 1,
 *       "library_id_space": 10000000,
 *       "sweep_on_load": true,
 *       "sweep_order": "scan_order"
 *     }
 *   }
 */
struct IdentityConfig {
    static constexpr StableId DEFAULT_LIBRARY_ID_SPACE = 10000000;

    StableId counterStart{1};
    StableId libraryIdSpace{DEFAULT_LIBRARY_ID_SPACE};
    bool sweepOnLoad{true};
    SweepOrder sweepOrder{SweepOrder::ScanOrder};

    /**
     * @brief Loads the "identity" category from a JSON file
     * @return false if the file is missing, malformed, or has no "identity"
     *         object; the config is left untouched in that case
     *
     * Individual keys with the wrong type or range are skipped with a
     * warning and keep their current value.
     */
    bool loadFromFile(const std::string& filepath);

    /// Same as loadFromFile() for an in-memory document
    bool loadFromString(const std::string& json);

    bool saveToFile(const std::string& filepath) const;

private:
    bool apply(const JsonValue& root, const std::string& source);
};

} // namespace Tether

#endif // IDENTITY_CONFIG_HPP
