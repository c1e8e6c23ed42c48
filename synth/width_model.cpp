#include "width_model.hpp"
#include <common/errors.hpp>
#include <algorithm>
#include <random>
#include <string>

namespace widepath {

void WidthPolicy::validate() const {
    if (base_width <= 0.0 || rush_width <= 0.0 || clearway_width <= 0.0) {
        throw ConfigError("Road widths must be positive");
    }
    if (clearway_width < base_width) {
        throw ConfigError("Clearway width (" + std::to_string(clearway_width) +
                          ") must not be narrower than the base width (" +
                          std::to_string(base_width) + ")");
    }
    if (clearway_percentage < 0 || clearway_percentage > 100) {
        throw ConfigError("Clearway percentage must be within [0, 100], got " +
                          std::to_string(clearway_percentage));
    }
}

EdgeWidths widths_for(bool clearway, const WidthPolicy& policy) {
    if (clearway) {
        return EdgeWidths{.base_width = policy.base_width, .rush_width = policy.clearway_width};
    }
    return EdgeWidths{.base_width = policy.base_width, .rush_width = policy.base_width};
}

std::vector<uint8_t> assign_shuffled_flags(size_t count, int percentage, uint32_t seed) {
    if (percentage < 0 || percentage > 100) {
        throw ConfigError("Percentage must be within [0, 100], got " + std::to_string(percentage));
    }
    size_t ones = count * static_cast<size_t>(percentage) / 100;
    std::vector<uint8_t> flags(count, 0);
    std::fill(flags.begin(), flags.begin() + static_cast<std::ptrdiff_t>(ones), 1);

    std::mt19937 rng(seed);
    std::shuffle(flags.begin(), flags.end(), rng);
    return flags;
}

}  // namespace widepath
