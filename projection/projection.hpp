#ifndef WIDEPATH_PROJECTION_PROJECTION_HPP
#define WIDEPATH_PROJECTION_PROJECTION_HPP

#include <memory>
#include <string_view>

namespace widepath {

struct LatLon {
    double lat = 0.0;
    double lon = 0.0;
};

// Maps British National Grid (EPSG:27700) easting/northing in meters to
// WGS84 latitude/longitude in degrees.
class Projector {
public:
    virtual ~Projector() = default;
    virtual LatLon project(double easting, double northing) const = 0;
    virtual const char* name() const = 0;
};

// EPSG:27700 -> EPSG:4326 through PROJ, which picks the most accurate
// transformation it has (OSTN15 when the grid file is installed, otherwise the
// published Helmert parameters). Throws ProjectionError for coordinates outside
// the National Grid or when PROJ cannot transform them.
// A PROJ object is not thread-safe; use one projector per thread.
class NationalGridProjector : public Projector {
public:
    NationalGridProjector();
    ~NationalGridProjector() override;

    NationalGridProjector(const NationalGridProjector&) = delete;
    NationalGridProjector& operator=(const NationalGridProjector&) = delete;

    LatLon project(double easting, double northing) const override;
    const char* name() const override { return "precise"; }

private:
    struct Transform;
    std::unique_ptr<Transform> transform_;
};

// Flat-earth approximation anchored at the grid's false origin:
//   lat = 49 + (N + 100000) / 111320
//   lon = -2 + (E - 400000) / (111320 * 0.68)
class LinearGridProjector : public Projector {
public:
    LatLon project(double easting, double northing) const override;
    const char* name() const override { return "approximate"; }
};

enum class ProjectionMode {
    Precise,
    Approximate
};

ProjectionMode projection_mode_from_string(std::string_view name);
const char* to_string(ProjectionMode mode);

std::unique_ptr<Projector> make_projector(ProjectionMode mode);

}  // namespace widepath

#endif // WIDEPATH_PROJECTION_PROJECTION_HPP
