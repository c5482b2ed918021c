#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <datapod/datapod.hpp>

#include "lokaltrax/geo.hpp"

namespace lokaltrax {

    /**
     * @brief Candidate destination produced by the upstream scoring pipeline
     */
    struct RoutePoint {
        std::uint64_t id = 0;
        std::string name;
        datapod::Geo location;
        double indicator = 1.0; ///< Desirability weight, higher is more attractive
    };

    /**
     * @brief One visited destination of an itinerary
     */
    struct Stop {
        RoutePoint point;
        std::size_t visit_order = 0; ///< 1-based
        double leg_km = 0.0;         ///< Distance from the previous reference point
        double adjusted_distance = 0.0;
    };

    enum class RouteStatus {
        Ok,
        EmptyCandidatePool, ///< No candidates were supplied
    };

    struct Itinerary {
        std::vector<Stop> stops;
        RouteStatus status = RouteStatus::Ok;
        double total_distance_km = 0.0;

        std::size_t size() const { return stops.size(); }
        bool empty() const { return stops.empty(); }
    };

    /**
     * @brief Greedy itinerary builder
     *
     * Starting at a reference point, repeatedly picks the remaining candidate with
     * the smallest distance / indicator, then moves the reference to it. Exact ties
     * go to the smaller id. No backtracking: the result is locally greedy, not an
     * optimal tour.
     */
    class RouteSequencer {
        std::vector<RoutePoint> candidates_;
        datapod::Geo start_;
        std::size_t n_points_;

      public:
        /**
         * @brief Validate and copy the candidate pool
         *
         * @param candidates Destinations to choose from
         * @param start Initial reference point
         * @param n_points Maximum number of stops
         * @throws InvalidIndicator if an indicator is not positive and finite
         * @throws InvalidCoordinate if the start or a candidate location is invalid
         * @throws InvalidParameter if two candidates share an id
         */
        RouteSequencer(std::vector<RoutePoint> candidates, const datapod::Geo &start, std::size_t n_points);

        /**
         * @brief Build the itinerary
         *
         * @return Up to n_points stops in visiting order
         */
        Itinerary run() const;

        const std::vector<RoutePoint> &candidates() const { return candidates_; }
        const datapod::Geo &start() const { return start_; }
        std::size_t n_points() const { return n_points_; }
    };

} // namespace lokaltrax
