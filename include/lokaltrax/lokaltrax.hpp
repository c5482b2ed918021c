#pragma once

/**
 * @file lokaltrax.hpp
 * @brief Umbrella header
 *
 * Includes:
 * - geo.hpp: Haversine distance and meter/degree conversion
 * - area.hpp: search polygons and boundary-inclusive containment
 * - coverage.hpp: circle grid covering a set of areas
 * - route.hpp: greedy itinerary builder
 * - anchors.hpp: named fallback start points
 * - utils/export.hpp: CSV output
 */

#include "lokaltrax/anchors.hpp"
#include "lokaltrax/area.hpp"
#include "lokaltrax/coverage.hpp"
#include "lokaltrax/error.hpp"
#include "lokaltrax/geo.hpp"
#include "lokaltrax/route.hpp"
#include "lokaltrax/utils/export.hpp"
