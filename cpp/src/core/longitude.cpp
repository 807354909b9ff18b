#include "earthzones/longitude.hpp"
#include "earthzones/error.hpp"

#include <cmath>

namespace earthzones {

double floor_mod(double x, double modulus) noexcept
{
    double r = std::fmod(x, modulus);
    if (r < 0.0)
        r += modulus;
    // -1e-20 + 360 rounds to 360
    if (r >= modulus)
        r = 0.0;
    return r;
}

double normalize_edge(double lon)
{
    EARTHZONES_CHECK_FINITE(lon);

    const double x = floor_mod(lon + MAX_LONGITUDE, FULL_CIRCLE_DEG) - MAX_LONGITUDE;
    // -180 here stands for both seam sides; a positive input meant +180
    if (x == MIN_LONGITUDE && lon > 0.0)
        return MAX_LONGITUDE;
    return x;
}

double normalize_point(double lon)
{
    const double x = normalize_edge(lon);
    if (x == MAX_LONGITUDE)
        return MIN_LONGITUDE;
    return x;
}

double lon_to_360(double lon)
{
    EARTHZONES_CHECK_FINITE(lon);
    return floor_mod(lon, FULL_CIRCLE_DEG);
}

double lon360_to_edge(double lon360) noexcept
{
    if (lon360 > MAX_LONGITUDE)
        return lon360 - FULL_CIRCLE_DEG;
    return lon360;
}

} // namespace earthzones
