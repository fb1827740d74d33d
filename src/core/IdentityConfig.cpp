/* Copyright (c) 2025 Tether Contributors
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/IdentityConfig.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <format>
#include <fstream>

namespace Tether {

namespace {
constexpr const char* CATEGORY = "identity";
} // anonymous namespace

const char* sweepOrderToString(SweepOrder order) {
    switch (order) {
        case SweepOrder::ScanOrder:      return "scan_order";
        case SweepOrder::NameDescending: return "name_descending";
        default:                         return "unknown";
    }
}

std::optional<SweepOrder> sweepOrderFromString(const std::string& text) {
    if (text == "scan_order") {
        return SweepOrder::ScanOrder;
    }
    if (text == "name_descending") {
        return SweepOrder::NameDescending;
    }
    return std::nullopt;
}

bool IdentityConfig::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        CONFIG_ERROR("Failed to load identity config from file: " + filepath +
                     " - " + reader.getLastError());
        return false;
    }
    return apply(reader.getRoot(), filepath);
}

bool IdentityConfig::loadFromString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        CONFIG_ERROR("Failed to parse identity config: " + reader.getLastError());
        return false;
    }
    return apply(reader.getRoot(), "<string>");
}

bool IdentityConfig::apply(const JsonValue& root, const std::string& source) {
    const JsonObject* category = root[CATEGORY].tryAsObject();
    if (category == nullptr) {
        CONFIG_ERROR(std::format("No '{}' object in {}", CATEGORY, source));
        return false;
    }

    for (const auto& [key, value] : *category) {
        if (key == "counter_start") {
            auto start = value.tryAsUnsigned();
            if (start && *start > 0) {
                counterStart = *start;
            } else {
                CONFIG_WARN("counter_start must be a positive integer, keeping " +
                            std::to_string(counterStart));
            }
        } else if (key == "library_id_space") {
            auto space = value.tryAsUnsigned();
            if (space && *space > 0) {
                libraryIdSpace = *space;
            } else {
                CONFIG_WARN("library_id_space must be a positive integer, keeping " +
                            std::to_string(libraryIdSpace));
            }
        } else if (key == "sweep_on_load") {
            if (auto flag = value.tryAsBool()) {
                sweepOnLoad = *flag;
            } else {
                CONFIG_WARN("sweep_on_load must be a boolean, skipping");
            }
        } else if (key == "sweep_order") {
            std::optional<SweepOrder> order;
            if (auto text = value.tryAsString()) {
                order = sweepOrderFromString(*text);
            }
            if (order) {
                sweepOrder = *order;
            } else {
                CONFIG_WARN(std::string("sweep_order must be \"scan_order\" or "
                                        "\"name_descending\", keeping ") +
                            sweepOrderToString(sweepOrder));
            }
        } else {
            CONFIG_WARN(std::format("Unknown identity setting '{}', skipping", key));
        }
    }

    CONFIG_INFO(std::format("Loaded identity config from {}: counter_start={} "
                            "library_id_space={} sweep_on_load={} sweep_order={}",
                            source, counterStart, libraryIdSpace, sweepOnLoad,
                            sweepOrderToString(sweepOrder)));
    return true;
}

bool IdentityConfig::saveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        CONFIG_ERROR("Failed to open identity config for writing: " + filepath);
        return false;
    }

    file << "{\n"
         << "  \"" << CATEGORY << "\": {\n"
         << "    \"counter_start\": " << counterStart << ",\n"
         << "    \"library_id_space\": " << libraryIdSpace << ",\n"
         << "    \"sweep_on_load\": " << (sweepOnLoad ? "true" : "false") << ",\n"
         << "    \"sweep_order\": \"" << sweepOrderToString(sweepOrder) << "\"\n"
         << "  }\n"
         << "}\n";

    if (!file.good()) {
        CONFIG_ERROR("Failed to write identity config: " + filepath);
        return false;
    }

    CONFIG_INFO("Saved identity config to file: " + filepath);
    return true;
}

} // namespace Tether
