#ifndef WIDEPATH_PIPELINE_DATASET_PROFILE_HPP
#define WIDEPATH_PIPELINE_DATASET_PROFILE_HPP

#include <graph/canonical_graph.hpp>
#include <loader/raw_loader.hpp>
#include <projection/projection.hpp>
#include <synth/cost_model.hpp>
#include <memory>
#include <string_view>

namespace widepath {

enum class DatasetKind {
    California,  // Whitespace tables, ids already 0..N-1, distances in km
    London       // BNG CSV edge list, sparse ids, distances in m
};

DatasetKind dataset_kind_from_string(std::string_view name);
const char* to_string(DatasetKind kind);

// Everything that differs between source datasets
struct DatasetProfile {
    DatasetKind kind = DatasetKind::California;
    IdPolicy id_policy = IdPolicy::ValidateOnly;
    SpeedModel speed;
    const char* distance_unit = "km";

    static DatasetProfile california() {
        return DatasetProfile{
            .kind = DatasetKind::California,
            .id_policy = IdPolicy::ValidateOnly,
            .speed = SpeedModel::mph_range_km_per_min(20.0, 25.0),
            .distance_unit = "km"
        };
    }

    static DatasetProfile london() {
        return DatasetProfile{
            .kind = DatasetKind::London,
            .id_policy = IdPolicy::Renumber,
            .speed = SpeedModel::around(100.0),  // meters per minute
            .distance_unit = "m"
        };
    }

    static DatasetProfile for_kind(DatasetKind kind);
};

std::unique_ptr<RawLoader> make_loader(DatasetKind kind, ProjectionMode projection);

}  // namespace widepath

#endif // WIDEPATH_PIPELINE_DATASET_PROFILE_HPP
