#ifndef WIDEPATH_LOADER_EDGE_LIST_CSV_LOADER_HPP
#define WIDEPATH_LOADER_EDGE_LIST_CSV_LOADER_HPP

#include "raw_loader.hpp"
#include <projection/projection.hpp>
#include <istream>
#include <memory>

namespace widepath {

// CSV edge list with named columns, as shipped with the London road network:
//   XCoord,YCoord,START_NODE,END_NODE,EDGE,LENGTH
// Coordinates are British National Grid meters of the row's start node and are
// projected to WGS84. A node takes its coordinates from the last row where it
// is START_NODE; a node that is only ever an END_NODE takes those of the first
// row that mentions it.
class EdgeListCsvLoader : public RawLoader {
public:
    static constexpr const char* EDGE_FILE = "London_Edgelist.csv";

    explicit EdgeListCsvLoader(std::shared_ptr<const Projector> projector);

    RawGraph load(const std::filesystem::path& input_dir) const override;
    const char* name() const override { return "edge-list-csv"; }
    std::vector<std::string> required_files() const override { return {EDGE_FILE}; }

    RawGraph read(std::istream& input, const std::string& source) const;

private:
    std::shared_ptr<const Projector> projector_;
};

}  // namespace widepath

#endif // WIDEPATH_LOADER_EDGE_LIST_CSV_LOADER_HPP
