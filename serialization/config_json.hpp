#ifndef WIDEPATH_SERIALIZATION_CONFIG_JSON_HPP
#define WIDEPATH_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <common/errors.hpp>
#include <pipeline/pipeline.hpp>
#include <synth/attribute_synthesizer.hpp>
#include <synth/width_model.hpp>
#include <timegrid/time_grid.hpp>
#include <cstdint>
#include <limits>
#include <string>

// from_json overloads keep the current field value as the default, so a
// partial document can be layered over an existing configuration by calling
// from_json(j, config) directly.

namespace widepath {

// RushWindow serialization
inline void to_json(nlohmann::json& j, const RushWindow& window) {
    j = {
        {"start_minute", window.start_minute},
        {"end_minute", window.end_minute}
    };
}

inline void from_json(const nlohmann::json& j, RushWindow& window) {
    window.start_minute = j.value("start_minute", window.start_minute);
    window.end_minute = j.value("end_minute", window.end_minute);
}

// WidthPolicy serialization
inline void to_json(nlohmann::json& j, const WidthPolicy& widths) {
    j = {
        {"base_width", widths.base_width},
        {"rush_width", widths.rush_width},
        {"clearway_width", widths.clearway_width},
        {"clearway_percentage", widths.clearway_percentage}
    };
}

inline void from_json(const nlohmann::json& j, WidthPolicy& widths) {
    widths.base_width = j.value("base_width", widths.base_width);
    widths.rush_width = j.value("rush_width", widths.rush_width);
    widths.clearway_width = j.value("clearway_width", widths.clearway_width);
    widths.clearway_percentage = j.value("clearway_percentage", widths.clearway_percentage);
}

// SynthesisSeeds serialization
inline void to_json(nlohmann::json& j, const SynthesisSeeds& seeds) {
    j = {
        {"score", seeds.score},
        {"clearway", seeds.clearway},
        {"cost", seeds.cost},
        {"seeded_costs", seeds.seeded_costs}
    };
}

// Seeds must be non-negative integers that fit 32 bits
inline uint32_t seed_value(const nlohmann::json& j, const char* key, uint32_t current) {
    if (!j.contains(key)) {
        return current;
    }
    const nlohmann::json& value = j.at(key);
    if (!value.is_number_unsigned() ||
        value.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
        throw ConfigError(std::string("Seed '") + key + "' must be an integer in [0, " +
                          std::to_string(std::numeric_limits<uint32_t>::max()) + "], got " +
                          value.dump());
    }
    return static_cast<uint32_t>(value.get<uint64_t>());
}

inline void from_json(const nlohmann::json& j, SynthesisSeeds& seeds) {
    seeds.score = seed_value(j, "score", seeds.score);
    seeds.clearway = seed_value(j, "clearway", seeds.clearway);
    seeds.cost = seed_value(j, "cost", seeds.cost);
    seeds.seeded_costs = j.value("seeded_costs", seeds.seeded_costs);
}

// PipelineConfig serialization
inline void to_json(nlohmann::json& j, const PipelineConfig& config) {
    j = {
        {"input", config.input_dir},
        {"output", config.output_dir},
        {"dataset", to_string(config.dataset)},
        {"projection", to_string(config.projection)},
        {"widths", config.widths},
        {"density_percentage", config.density_percentage},
        {"seeds", config.seeds},
        {"rush_windows", config.rush_windows},
        {"remove_legacy_files", config.remove_legacy_files}
    };
    if (config.base_speed) {
        j["base_speed"] = *config.base_speed;
    }
}

inline void from_json(const nlohmann::json& j, PipelineConfig& config) {
    try {
        config.input_dir = j.value("input", config.input_dir);
        config.output_dir = j.value("output", config.output_dir);
        if (j.contains("dataset")) {
            config.dataset = dataset_kind_from_string(j["dataset"].get<std::string>());
        }
        if (j.contains("projection")) {
            config.projection = projection_mode_from_string(j["projection"].get<std::string>());
        }
        if (j.contains("widths")) {
            from_json(j["widths"], config.widths);
        }
        config.density_percentage = j.value("density_percentage", config.density_percentage);
        if (j.contains("base_speed")) {
            config.base_speed = j["base_speed"].get<double>();
        }
        if (j.contains("seeds")) {
            from_json(j["seeds"], config.seeds);
        }
        if (j.contains("rush_windows")) {
            config.rush_windows = j["rush_windows"].get<std::vector<RushWindow>>();
        }
        config.remove_legacy_files = j.value("remove_legacy_files", config.remove_legacy_files);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }
}

}  // namespace widepath

#endif // WIDEPATH_SERIALIZATION_CONFIG_JSON_HPP
