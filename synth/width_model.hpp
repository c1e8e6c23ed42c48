#ifndef WIDEPATH_SYNTH_WIDTH_MODEL_HPP
#define WIDEPATH_SYNTH_WIDTH_MODEL_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace widepath {

// Road widths in meters. Clearway roads lose their parking during rush hours
// and widen to clearway_width; every other road keeps base_width all day.
struct WidthPolicy {
    double base_width = 3.5;
    double rush_width = 2.5;      // Congested width of regular roads; not written to edge lines
    double clearway_width = 4.5;
    int clearway_percentage = 5;

    void validate() const;
};

struct EdgeWidths {
    double base_width = 0.0;
    double rush_width = 0.0;
};

EdgeWidths widths_for(bool clearway, const WidthPolicy& policy);

// count * percentage / 100 (truncated) ones, the rest zeros, shuffled with a
// generator seeded by `seed`. Position i belongs to canonical edge i.
std::vector<uint8_t> assign_shuffled_flags(size_t count, int percentage, uint32_t seed);

}  // namespace widepath

#endif // WIDEPATH_SYNTH_WIDTH_MODEL_HPP
