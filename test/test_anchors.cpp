#include "doctest/doctest.h"
#include "lokaltrax/anchors.hpp"

#include <optional>

TEST_CASE("Anchor Table Lookup") {
    auto anchors = lokaltrax::default_anchors();

    CHECK(anchors.size() == 5);
    CHECK(anchors.contains("istanbul"));
    CHECK(anchors.contains("Istanbul"));
    CHECK(anchors.contains("MILAN"));
    CHECK_FALSE(anchors.contains("paris"));

    auto florence = anchors.find("Florence");
    REQUIRE(florence.has_value());
    CHECK(florence->latitude == doctest::Approx(43.7694297));
    CHECK(florence->longitude == doctest::Approx(11.2551939));

    CHECK_FALSE(anchors.find("atlantis").has_value());
}

TEST_CASE("Anchor Table Validation") {
    lokaltrax::AnchorTable anchors;
    CHECK(anchors.empty());

    CHECK_THROWS_AS(anchors.add("", datapod::Geo{1.0, 1.0, 0.0}), lokaltrax::InvalidParameter);
    CHECK_THROWS_AS(anchors.add("nowhere", datapod::Geo{100.0, 1.0, 0.0}), lokaltrax::InvalidCoordinate);

    anchors.add("Paris", datapod::Geo{48.8566, 2.3522, 0.0});
    anchors.add("paris", datapod::Geo{48.8600, 2.3500, 0.0});
    CHECK(anchors.size() == 1);
    CHECK(anchors.find("PARIS")->latitude == doctest::Approx(48.86));
}

TEST_CASE("Start Point Resolution") {
    auto anchors = lokaltrax::default_anchors();

    SUBCASE("User location wins") {
        datapod::Geo user{41.05, 29.01, 0.0};
        auto start = lokaltrax::resolve_start(user, "istanbul", anchors);
        CHECK(start.latitude == doctest::Approx(41.05));
        CHECK(start.longitude == doctest::Approx(29.01));
    }

    SUBCASE("Missing location falls back to the city") {
        auto start = lokaltrax::resolve_start(std::nullopt, "Izmir", anchors);
        CHECK(start.latitude == doctest::Approx(38.4184575));
    }

    SUBCASE("Origin is treated as unset") {
        auto start = lokaltrax::resolve_start(datapod::Geo{0.0, 0.0, 0.0}, "milan", anchors);
        CHECK(start.latitude == doctest::Approx(45.4641652));
    }

    SUBCASE("Unknown city without a location") {
        CHECK_THROWS_AS(lokaltrax::resolve_start(std::nullopt, "atlantis", anchors), lokaltrax::InvalidParameter);
        CHECK_THROWS_AS(lokaltrax::resolve_start(std::nullopt, "", anchors), lokaltrax::InvalidParameter);
    }

    SUBCASE("Invalid user location") {
        CHECK_THROWS_AS(lokaltrax::resolve_start(datapod::Geo{0.0, 181.0, 0.0}, "milan", anchors),
                        lokaltrax::InvalidCoordinate);
    }
}
