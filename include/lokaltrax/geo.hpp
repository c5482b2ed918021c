#pragma once

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>

#include <datapod/datapod.hpp>

#include "lokaltrax/error.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace lokaltrax {

    /// Mean Earth radius used by every distance and step computation
    inline constexpr double kEarthRadiusKm = 6371.0;
    inline constexpr double kEarthRadiusM = 6371000.0;

    inline double deg_to_rad(double deg) { return deg * M_PI / 180.0; }
    inline double rad_to_deg(double rad) { return rad * 180.0 / M_PI; }

    /**
     * @brief Check that a coordinate is finite and inside the WGS84 ranges
     *
     * @param p Point to check (altitude is ignored)
     * @return true if latitude is in [-90, 90] and longitude in [-180, 180]
     */
    inline bool is_valid_coordinate(const datapod::Geo &p) {
        if (!std::isfinite(p.latitude) || !std::isfinite(p.longitude))
            return false;
        return p.latitude >= -90.0 && p.latitude <= 90.0 && p.longitude >= -180.0 && p.longitude <= 180.0;
    }

    inline std::string describe(const datapod::Geo &p) {
        std::ostringstream ss;
        ss << "(" << p.latitude << ", " << p.longitude << ")";
        return ss.str();
    }

    /**
     * @brief Throw InvalidCoordinate unless the point passes is_valid_coordinate()
     */
    inline void validate_coordinate(const datapod::Geo &p) {
        if (!is_valid_coordinate(p)) {
            throw InvalidCoordinate("invalid coordinate " + describe(p));
        }
    }

    /**
     * @brief Great-circle distance between two points using the Haversine formula
     *
     * @param a First point
     * @param b Second point
     * @return Distance in kilometers
     */
    inline double distance_km(const datapod::Geo &a, const datapod::Geo &b) {
        validate_coordinate(a);
        validate_coordinate(b);

        double phi1 = deg_to_rad(a.latitude);
        double phi2 = deg_to_rad(b.latitude);
        double d_phi = deg_to_rad(b.latitude - a.latitude);
        double d_lambda = deg_to_rad(b.longitude - a.longitude);

        double s_phi = std::sin(d_phi / 2.0);
        double s_lambda = std::sin(d_lambda / 2.0);
        double h = s_phi * s_phi + std::cos(phi1) * std::cos(phi2) * s_lambda * s_lambda;
        // Rounding can push h just past 1 for antipodal points
        h = std::clamp(h, 0.0, 1.0);
        double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));

        return kEarthRadiusKm * c;
    }

    /**
     * @brief Haversine distance in meters
     */
    inline double distance_m(const datapod::Geo &a, const datapod::Geo &b) { return distance_km(a, b) * 1000.0; }

    /**
     * @brief Convert a north-south length to degrees of latitude
     */
    inline double meters_to_lat_degrees(double meters) { return rad_to_deg(meters / kEarthRadiusM); }

    /**
     * @brief Convert an east-west length to degrees of longitude at a given latitude
     *
     * Meridians converge toward the poles, so the same length spans more degrees
     * at higher latitudes. Passing the more poleward latitude of an area yields the
     * smaller, conservative step for the whole area.
     *
     * @param meters Length in meters
     * @param reference_latitude Latitude in degrees at which the length is measured
     * @return Degrees of longitude (grows without bound toward the poles)
     */
    inline double meters_to_lon_degrees(double meters, double reference_latitude) {
        return rad_to_deg(meters / (kEarthRadiusM * std::cos(deg_to_rad(reference_latitude))));
    }

} // namespace lokaltrax
