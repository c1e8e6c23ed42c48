#ifndef WIDEPATH_FORMAT_WIDE_PATH_CHECKER_HPP
#define WIDEPATH_FORMAT_WIDE_PATH_CHECKER_HPP

#include "wide_path_reader.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace widepath {

struct CheckReport {
    size_t node_count = 0;
    size_t edge_count = 0;
    size_t time_points = 0;
    size_t widened_edges = 0;        // rush width above base width
    std::vector<std::string> problems;

    bool ok() const { return problems.empty(); }
};

// Verify the contract the solver relies on: contiguous ascending node ids,
// a strictly increasing arrival grid starting at 0, unique edges sorted by
// (src, dst) with valid endpoints, one cost per arrival point never below the
// free-flow (first) cost, and rush width never below base width.
// Reports at most `max_problems` problems.
CheckReport check_wide_path(const std::vector<NodeLine>& nodes,
                            const EdgeFile& edges,
                            size_t max_problems = 50);

}  // namespace widepath

#endif // WIDEPATH_FORMAT_WIDE_PATH_CHECKER_HPP
