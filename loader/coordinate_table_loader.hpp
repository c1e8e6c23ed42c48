#ifndef WIDEPATH_LOADER_COORDINATE_TABLE_LOADER_HPP
#define WIDEPATH_LOADER_COORDINATE_TABLE_LOADER_HPP

#include "raw_loader.hpp"
#include <istream>

namespace widepath {

// Whitespace-delimited tables, as shipped with the California road network:
//   node coordinates.txt   id longitude latitude
//   edge distance.txt      edge_id src dst distance
class CoordinateTableLoader : public RawLoader {
public:
    static constexpr const char* NODE_FILE = "node coordinates.txt";
    static constexpr const char* EDGE_FILE = "edge distance.txt";

    RawGraph load(const std::filesystem::path& input_dir) const override;
    const char* name() const override { return "coordinate-table"; }
    std::vector<std::string> required_files() const override { return {NODE_FILE, EDGE_FILE}; }

    static std::vector<NodeRecord> read_nodes(std::istream& input, const std::string& source);
    static std::vector<EdgeRecord> read_edges(std::istream& input, const std::string& source);
};

}  // namespace widepath

#endif // WIDEPATH_LOADER_COORDINATE_TABLE_LOADER_HPP
