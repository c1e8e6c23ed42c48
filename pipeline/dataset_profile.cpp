#include "dataset_profile.hpp"
#include <common/errors.hpp>
#include <loader/coordinate_table_loader.hpp>
#include <loader/edge_list_csv_loader.hpp>
#include <string>

namespace widepath {

DatasetKind dataset_kind_from_string(std::string_view name) {
    if (name == "california") return DatasetKind::California;
    if (name == "london") return DatasetKind::London;
    throw ConfigError("Unknown dataset: " + std::string(name) +
                      " (expected 'california' or 'london')");
}

const char* to_string(DatasetKind kind) {
    switch (kind) {
        case DatasetKind::California: return "california";
        case DatasetKind::London: return "london";
    }
    return "unknown";
}

DatasetProfile DatasetProfile::for_kind(DatasetKind kind) {
    switch (kind) {
        case DatasetKind::California: return california();
        case DatasetKind::London: return london();
    }
    throw ConfigError("Unsupported dataset");
}

std::unique_ptr<RawLoader> make_loader(DatasetKind kind, ProjectionMode projection) {
    switch (kind) {
        case DatasetKind::California:
            return std::make_unique<CoordinateTableLoader>();
        case DatasetKind::London:
            return std::make_unique<EdgeListCsvLoader>(make_projector(projection));
    }
    throw ConfigError("Unsupported dataset");
}

}  // namespace widepath
