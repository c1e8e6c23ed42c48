#include "projection.hpp"
#include <common/errors.hpp>
#include <proj.h>
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <string>

namespace widepath {

namespace {

// EPSG:27700 area of use, in grid meters
constexpr double GRID_MIN_EASTING = 0.0;
constexpr double GRID_MAX_EASTING = 700000.0;
constexpr double GRID_MIN_NORTHING = 0.0;
constexpr double GRID_MAX_NORTHING = 1300000.0;

// False origin of the National Grid, used by the linear approximation
constexpr double E0 = 400000.0;
constexpr double N0 = -100000.0;

struct ContextDeleter {
    void operator()(PJ_CONTEXT* ctx) const { proj_context_destroy(ctx); }
};

struct PjDeleter {
    void operator()(PJ* pj) const { proj_destroy(pj); }
};

std::string context_error(PJ_CONTEXT* ctx) {
    const char* message = proj_context_errno_string(ctx, proj_context_errno(ctx));
    return message ? message : "unknown PROJ error";
}

}  // namespace

struct NationalGridProjector::Transform {
    std::unique_ptr<PJ_CONTEXT, ContextDeleter> ctx;
    std::unique_ptr<PJ, PjDeleter> pj;
};

NationalGridProjector::NationalGridProjector()
    : transform_(std::make_unique<Transform>()) {
    transform_->ctx.reset(proj_context_create());
    if (!transform_->ctx) {
        throw ProjectionError("Cannot create PROJ context");
    }
    PJ_CONTEXT* ctx = transform_->ctx.get();

    std::unique_ptr<PJ, PjDeleter> raw(
        proj_create_crs_to_crs(ctx, "EPSG:27700", "EPSG:4326", nullptr));
    if (!raw) {
        throw ProjectionError("Cannot create EPSG:27700 -> EPSG:4326 transformation: " +
                              context_error(ctx));
    }

    // Easting/northing in, longitude/latitude out, whatever the CRS axis order
    transform_->pj.reset(proj_normalize_for_visualization(ctx, raw.get()));
    if (!transform_->pj) {
        throw ProjectionError("Cannot normalize EPSG:27700 -> EPSG:4326 transformation: " +
                              context_error(ctx));
    }
}

NationalGridProjector::~NationalGridProjector() = default;

LatLon NationalGridProjector::project(double easting, double northing) const {
    if (!(easting >= GRID_MIN_EASTING && easting <= GRID_MAX_EASTING &&
          northing >= GRID_MIN_NORTHING && northing <= GRID_MAX_NORTHING)) {
        throw ProjectionError(fmt::format(
            "Grid reference E {} N {} is outside the National Grid", easting, northing));
    }

    PJ* pj = transform_->pj.get();
    proj_errno_reset(pj);
    PJ_COORD out = proj_trans(pj, PJ_FWD, proj_coord(easting, northing, 0.0, 0.0));

    int err = proj_errno(pj);
    if (err != 0 || !std::isfinite(out.xy.x) || !std::isfinite(out.xy.y)) {
        const char* message = err != 0 ? proj_context_errno_string(transform_->ctx.get(), err) : nullptr;
        throw ProjectionError(fmt::format("Cannot project E {} N {}: {}", easting, northing,
                                          message ? message : "no result"));
    }
    return LatLon{.lat = out.xy.y, .lon = out.xy.x};
}

LatLon LinearGridProjector::project(double easting, double northing) const {
    constexpr double METERS_PER_DEGREE = 111320.0;
    constexpr double UK_LON_SCALE = 0.68;
    return LatLon{
        .lat = 49.0 + (northing - N0) / METERS_PER_DEGREE,
        .lon = -2.0 + (easting - E0) / (METERS_PER_DEGREE * UK_LON_SCALE)
    };
}

ProjectionMode projection_mode_from_string(std::string_view name) {
    if (name == "precise") return ProjectionMode::Precise;
    if (name == "approximate") return ProjectionMode::Approximate;
    throw ConfigError("Unknown projection mode: " + std::string(name) +
                      " (expected 'precise' or 'approximate')");
}

const char* to_string(ProjectionMode mode) {
    switch (mode) {
        case ProjectionMode::Precise: return "precise";
        case ProjectionMode::Approximate: return "approximate";
    }
    return "unknown";
}

std::unique_ptr<Projector> make_projector(ProjectionMode mode) {
    switch (mode) {
        case ProjectionMode::Precise:
            return std::make_unique<NationalGridProjector>();
        case ProjectionMode::Approximate:
            return std::make_unique<LinearGridProjector>();
    }
    throw ConfigError("Unsupported projection mode");
}

}  // namespace widepath
