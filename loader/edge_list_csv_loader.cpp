#include "edge_list_csv_loader.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <parser/line_scanner.hpp>
#include <fstream>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace widepath {

namespace {

struct ColumnIndex {
    size_t x = 0;
    size_t y = 0;
    size_t start_node = 0;
    size_t end_node = 0;
    size_t length = 0;
    size_t width = 0;  // Number of columns a data row must have
};

ColumnIndex find_columns(const parser::LineScanner& scanner) {
    auto header = scanner.split(',');

    auto column = [&](std::string_view name) {
        for (size_t i = 0; i < header.size(); ++i) {
            if (header[i] == name) return i;
        }
        scanner.fail("missing column '" + std::string(name) + "' in header");
    };

    ColumnIndex index;
    index.x = column("XCoord");
    index.y = column("YCoord");
    index.start_node = column("START_NODE");
    index.end_node = column("END_NODE");
    index.length = column("LENGTH");
    index.width = std::max({index.x, index.y, index.start_node, index.end_node, index.length}) + 1;
    return index;
}

}  // namespace

EdgeListCsvLoader::EdgeListCsvLoader(std::shared_ptr<const Projector> projector)
    : projector_(std::move(projector)) {
    if (!projector_) {
        throw std::invalid_argument("EdgeListCsvLoader: projector is required");
    }
}

RawGraph EdgeListCsvLoader::read(std::istream& input, const std::string& source) const {
    parser::LineScanner scanner(input, source);
    if (!scanner.next()) {
        throw ParseError(source, 0, "", "empty file, expected a header row");
    }
    ColumnIndex columns = find_columns(scanner);

    RawGraph raw;
    std::unordered_map<NodeId, size_t> node_slot;

    auto place = [&](NodeId id, LatLon position, bool overwrite) {
        auto [it, inserted] = node_slot.emplace(id, raw.nodes.size());
        if (inserted) {
            raw.nodes.push_back(NodeRecord{.id = id, .lat = position.lat, .lon = position.lon});
        } else if (overwrite) {
            raw.nodes[it->second].lat = position.lat;
            raw.nodes[it->second].lon = position.lon;
        }
    };

    while (scanner.next()) {
        auto fields = scanner.split(',');
        scanner.require_fields(fields, columns.width);

        double easting = scanner.parse_double(fields[columns.x], "XCoord");
        double northing = scanner.parse_double(fields[columns.y], "YCoord");
        NodeId src = scanner.parse_int(fields[columns.start_node], "START_NODE");
        NodeId dst = scanner.parse_int(fields[columns.end_node], "END_NODE");
        double length = scanner.parse_double(fields[columns.length], "LENGTH");
        if (src < 0 || dst < 0) {
            scanner.fail("negative node id");
        }
        if (length < 0.0) {
            scanner.fail("negative LENGTH");
        }

        LatLon position;
        try {
            position = projector_->project(easting, northing);
        } catch (const ProjectionError& e) {
            scanner.fail(e.what());
        }
        place(src, position, true);
        place(dst, position, false);

        raw.edges.push_back(EdgeRecord{.src = src, .dst = dst, .distance = length});
    }

    return raw;
}

RawGraph EdgeListCsvLoader::load(const std::filesystem::path& input_dir) const {
    auto log = logging::get_logger();
    require_files(input_dir);

    std::filesystem::path edge_path = input_dir / EDGE_FILE;
    std::ifstream edge_file(edge_path);
    if (!edge_file) {
        throw std::runtime_error("Cannot open file: " + edge_path.string());
    }

    log->debug("Projecting coordinates with the {} projector", projector_->name());
    RawGraph raw = read(edge_file, edge_path.string());
    log->debug("Read {} nodes, {} edges from {}", raw.nodes.size(), raw.edges.size(),
               edge_path.string());
    return raw;
}

}  // namespace widepath
