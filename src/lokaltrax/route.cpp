#include "lokaltrax/route.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <limits>
#include <string>
#include <unordered_set>
#include <utility>

#include "lokaltrax/error.hpp"

namespace lokaltrax {

    RouteSequencer::RouteSequencer(std::vector<RoutePoint> candidates, const datapod::Geo &start,
                                   std::size_t n_points)
        : candidates_(std::move(candidates)), start_(start), n_points_(n_points) {
        validate_coordinate(start_);

        std::unordered_set<std::uint64_t> seen;
        for (const auto &c : candidates_) {
            if (!std::isfinite(c.indicator) || c.indicator <= 0.0) {
                throw InvalidIndicator("candidate " + std::to_string(c.id) + " has non-positive indicator " +
                                       std::to_string(c.indicator));
            }
            if (!is_valid_coordinate(c.location)) {
                throw InvalidCoordinate("candidate " + std::to_string(c.id) + " has invalid location " +
                                        describe(c.location));
            }
            if (!seen.insert(c.id).second) {
                throw InvalidParameter("duplicate candidate id " + std::to_string(c.id));
            }
        }
    }

    Itinerary RouteSequencer::run() const {
        Itinerary itinerary;

        if (candidates_.empty()) {
            std::cerr << "Warning: empty candidate pool, itinerary is empty" << std::endl;
            itinerary.status = RouteStatus::EmptyCandidatePool;
            return itinerary;
        }

        std::vector<RoutePoint> pool = candidates_;
        datapod::Geo reference = start_;
        itinerary.stops.reserve(std::min(n_points_, pool.size()));

        while (itinerary.stops.size() < n_points_ && !pool.empty()) {
            double best_adjusted = std::numeric_limits<double>::infinity();
            double best_leg = 0.0;
            std::size_t best = pool.size();

            for (std::size_t i = 0; i < pool.size(); ++i) {
                double leg = distance_km(reference, pool[i].location);
                double adjusted = leg / pool[i].indicator;

                bool better = best == pool.size() || adjusted < best_adjusted ||
                              (adjusted == best_adjusted && pool[i].id < pool[best].id);
                if (better) {
                    best_adjusted = adjusted;
                    best_leg = leg;
                    best = i;
                }
            }

            Stop stop;
            stop.point = pool[best];
            stop.visit_order = itinerary.stops.size() + 1;
            stop.leg_km = best_leg;
            stop.adjusted_distance = best_adjusted;

            reference = stop.point.location;
            itinerary.total_distance_km += best_leg;
            itinerary.stops.push_back(std::move(stop));
            pool.erase(pool.begin() + static_cast<std::ptrdiff_t>(best));
        }

        return itinerary;
    }

} // namespace lokaltrax
