#include "doctest/doctest.h"
#include "lokaltrax/geo.hpp"

#include <cmath>
#include <limits>

TEST_CASE("Haversine Distance") {
    datapod::Geo origin{0.0, 0.0, 0.0};

    SUBCASE("Zero distance to itself") { CHECK(lokaltrax::distance_km(origin, origin) == 0.0); }

    SUBCASE("Small longitude offsets on the equator") {
        CHECK(lokaltrax::distance_km(origin, datapod::Geo{0.0, 0.01, 0.0}) == doctest::Approx(1.11195).epsilon(1e-4));
        CHECK(lokaltrax::distance_km(origin, datapod::Geo{0.0, 0.02, 0.0}) == doctest::Approx(2.22390).epsilon(1e-4));
    }

    SUBCASE("One degree of latitude") {
        CHECK(lokaltrax::distance_km(origin, datapod::Geo{1.0, 0.0, 0.0}) == doctest::Approx(111.195).epsilon(1e-4));
    }

    SUBCASE("Symmetric") {
        datapod::Geo rome{41.9028, 12.4964, 0.0};
        datapod::Geo milan{45.4642, 9.1900, 0.0};
        double ab = lokaltrax::distance_km(rome, milan);
        double ba = lokaltrax::distance_km(milan, rome);
        CHECK(ab == doctest::Approx(ba));
        CHECK(ab == doctest::Approx(477.0).epsilon(0.01));
    }

    SUBCASE("Meters agree with kilometers") {
        datapod::Geo p{0.0, 0.01, 0.0};
        CHECK(lokaltrax::distance_m(origin, p) == doctest::Approx(lokaltrax::distance_km(origin, p) * 1000.0));
    }
}

TEST_CASE("Haversine at Antipodal Points") {
    double half_circumference = M_PI * lokaltrax::kEarthRadiusKm;

    CHECK(lokaltrax::distance_km(datapod::Geo{-88.2, -180.0, 0.0}, datapod::Geo{88.2, 0.0, 0.0}) ==
          doctest::Approx(half_circumference));
    CHECK(lokaltrax::distance_km(datapod::Geo{0.0, 0.0, 0.0}, datapod::Geo{0.0, 180.0, 0.0}) ==
          doctest::Approx(half_circumference));

    // Every exact antipodal pair on a coarse grid stays finite
    for (int lat = -90; lat <= 90; lat += 3) {
        for (int lon = -180; lon <= 0; lon += 5) {
            datapod::Geo a{lat + 0.1, static_cast<double>(lon), 0.0};
            if (a.latitude > 90.0)
                continue;
            datapod::Geo b{-a.latitude, a.longitude + 180.0, 0.0};
            double d = lokaltrax::distance_km(a, b);
            CHECK(std::isfinite(d));
            CHECK(d <= half_circumference + 1e-6);
        }
    }
}

TEST_CASE("Haversine Rejects Invalid Coordinates") {
    datapod::Geo origin{0.0, 0.0, 0.0};
    double nan = std::numeric_limits<double>::quiet_NaN();
    double inf = std::numeric_limits<double>::infinity();

    CHECK_THROWS_AS(lokaltrax::distance_km(origin, datapod::Geo{nan, 0.0, 0.0}), lokaltrax::InvalidCoordinate);
    CHECK_THROWS_AS(lokaltrax::distance_km(datapod::Geo{0.0, inf, 0.0}, origin), lokaltrax::InvalidCoordinate);
    CHECK_THROWS_AS(lokaltrax::distance_km(origin, datapod::Geo{90.5, 0.0, 0.0}), lokaltrax::InvalidCoordinate);
    CHECK_THROWS_AS(lokaltrax::distance_km(origin, datapod::Geo{0.0, -180.1, 0.0}), lokaltrax::InvalidCoordinate);

    // Range limits themselves are valid
    CHECK_NOTHROW(lokaltrax::distance_km(datapod::Geo{90.0, 180.0, 0.0}, datapod::Geo{-90.0, -180.0, 0.0}));
}

TEST_CASE("Meter to Degree Conversion") {
    SUBCASE("Latitude step") {
        CHECK(lokaltrax::meters_to_lat_degrees(500.0) == doctest::Approx(0.0044966).epsilon(1e-4));
        CHECK(lokaltrax::meters_to_lat_degrees(0.0) == 0.0);
    }

    SUBCASE("Longitude step equals latitude step on the equator") {
        CHECK(lokaltrax::meters_to_lon_degrees(500.0, 0.0) == doctest::Approx(lokaltrax::meters_to_lat_degrees(500.0)));
    }

    SUBCASE("Longitude step doubles at 60 degrees") {
        double lat_step = lokaltrax::meters_to_lat_degrees(500.0);
        CHECK(lokaltrax::meters_to_lon_degrees(500.0, 60.0) == doctest::Approx(2.0 * lat_step));
        CHECK(lokaltrax::meters_to_lon_degrees(500.0, -60.0) == doctest::Approx(2.0 * lat_step));
    }

    SUBCASE("Poleward latitude gives the larger step in degrees") {
        CHECK(lokaltrax::meters_to_lon_degrees(500.0, 50.0) > lokaltrax::meters_to_lon_degrees(500.0, 40.0));
    }
}
