#pragma once

#include "earthzones/types.hpp"

namespace earthzones {

/**
 * Floor modulo: result in [0, modulus) for any finite x.
 * Unlike std::fmod the sign of the result never follows x.
 */
double floor_mod(double x, double modulus) noexcept;

/**
 * Normalize a longitude for use as an interval boundary.
 * @param lon Any finite longitude in degrees
 * @return Value in [-180, 180]; +180 (and 180 + 360k for k >= 0) stays +180
 * @throws InvalidNumericInputError for NaN or infinite input
 */
double normalize_edge(double lon);

/**
 * Normalize a longitude for use as a single coordinate.
 * @param lon Any finite longitude in degrees
 * @return Value in [-180, 180); +180 folds onto -180
 * @throws InvalidNumericInputError for NaN or infinite input
 */
double normalize_point(double lon);

/**
 * Map a longitude to [0, 360).
 * @throws InvalidNumericInputError for NaN or infinite input
 */
double lon_to_360(double lon);

/**
 * Convert a [0, 360] longitude back to edge form. 180 is kept as +180.
 */
double lon360_to_edge(double lon360) noexcept;

/**
 * Longitude on the circle, stored in one of the two canonical forms.
 * Construct through point() or edge(); the raw constructor is private so
 * every instance has been through normalization.
 */
class Longitude {
public:
    static Longitude point(double lon) { return Longitude(normalize_point(lon)); }
    static Longitude edge(double lon) { return Longitude(normalize_edge(lon)); }

    double degrees() const noexcept { return value_; }

    // Eastward distance from this longitude to other, in [0, 360)
    double eastward_to(const Longitude& other) const noexcept {
        return floor_mod(other.value_ - value_, FULL_CIRCLE_DEG);
    }

    // Same point on the circle (+180 and -180 coincide)
    bool same_point(const Longitude& other) const noexcept {
        return eastward_to(other) == 0.0;
    }

private:
    explicit Longitude(double value) noexcept : value_(value) {}

    double value_;
};

} // namespace earthzones
