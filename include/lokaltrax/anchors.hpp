#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include <datapod/datapod.hpp>

#include "lokaltrax/error.hpp"
#include "lokaltrax/geo.hpp"

namespace lokaltrax {

    /**
     * @brief Named fallback start points, looked up case-insensitively
     *
     * Used when a route request carries a city but no user location.
     */
    class AnchorTable {
        std::map<std::string, datapod::Geo> anchors_;

        static std::string normalize(std::string name) {
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return name;
        }

      public:
        /**
         * @brief Add or replace an anchor
         *
         * @throws InvalidParameter for an empty name
         * @throws InvalidCoordinate for an invalid point
         */
        void add(const std::string &name, const datapod::Geo &point) {
            if (name.empty())
                throw InvalidParameter("anchor name must not be empty");
            validate_coordinate(point);
            anchors_[normalize(name)] = point;
        }

        std::optional<datapod::Geo> find(const std::string &name) const {
            auto it = anchors_.find(normalize(name));
            if (it == anchors_.end())
                return std::nullopt;
            return it->second;
        }

        bool contains(const std::string &name) const { return anchors_.count(normalize(name)) > 0; }
        std::size_t size() const { return anchors_.size(); }
        bool empty() const { return anchors_.empty(); }
    };

    /**
     * @brief Anchor table with the city centers the service launched with
     */
    inline AnchorTable default_anchors() {
        AnchorTable table;
        table.add("istanbul", datapod::Geo{41.0260660, 28.9739962, 0.0});
        table.add("mugla", datapod::Geo{37.0343836, 27.4305260, 0.0});
        table.add("izmir", datapod::Geo{38.4184575, 27.1292222, 0.0});
        table.add("florence", datapod::Geo{43.7694297, 11.2551939, 0.0});
        table.add("milan", datapod::Geo{45.4641652, 9.1918621, 0.0});
        return table;
    }

    /**
     * @brief Pick the start point of a route
     *
     * A user location wins unless it is missing or the (0, 0) "unset" sentinel,
     * in which case the city's anchor is used.
     *
     * @param user_location Location reported by the user, if any
     * @param city City name to fall back to
     * @param anchors Table of known cities
     * @return Start point for the route sequencer
     * @throws InvalidParameter if the fallback is needed and the city is unknown
     * @throws InvalidCoordinate if the user location is invalid
     */
    inline datapod::Geo resolve_start(const std::optional<datapod::Geo> &user_location, const std::string &city,
                                      const AnchorTable &anchors) {
        if (user_location && !(user_location->latitude == 0.0 && user_location->longitude == 0.0)) {
            validate_coordinate(*user_location);
            return *user_location;
        }

        auto anchor = anchors.find(city);
        if (!anchor) {
            throw InvalidParameter("city '" + city + "' is not supported and no user location was given");
        }
        return *anchor;
    }

} // namespace lokaltrax
