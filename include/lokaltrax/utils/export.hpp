#pragma once

#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "lokaltrax/coverage.hpp"
#include "lokaltrax/route.hpp"

namespace lokaltrax {

    namespace utils {

        /**
         * @brief Write circle centers as CSV for the nearby-search driver
         *
         * Columns: lat,lon,radius,area_id. Rows are formatted on a local stream so
         * the caller's stream state is left untouched.
         */
        inline void write_circles_csv(std::ostream &os, const std::vector<CircleCenter> &centers) {
            os << "lat,lon,radius,area_id\n";
            for (const auto &c : centers) {
                std::ostringstream row;
                row << std::fixed << std::setprecision(8) << c.location.latitude << "," << c.location.longitude << ",";
                row << std::defaultfloat << std::setprecision(15) << c.radius_meters << "," << c.area_id << "\n";
                os << row.str();
            }
        }

        /**
         * @brief Write an itinerary as CSV
         *
         * Columns: visit_order,id,name,lat,long,indicator,leg_km
         * Names containing commas or quotes are quoted.
         */
        inline void write_itinerary_csv(std::ostream &os, const Itinerary &itinerary) {
            os << "visit_order,id,name,lat,long,indicator,leg_km\n";
            for (const auto &stop : itinerary.stops) {
                std::string name = stop.point.name;
                if (name.find_first_of(",\"\n") != std::string::npos) {
                    std::string quoted = "\"";
                    for (char ch : name) {
                        if (ch == '"')
                            quoted += '"';
                        quoted += ch;
                    }
                    quoted += '"';
                    name = quoted;
                }
                std::ostringstream row;
                row << stop.visit_order << "," << stop.point.id << "," << name << "," << std::fixed
                    << std::setprecision(8) << stop.point.location.latitude << "," << stop.point.location.longitude
                    << "," << std::setprecision(4) << stop.point.indicator << "," << std::setprecision(3)
                    << stop.leg_km << "\n";
                os << row.str();
            }
        }

        inline void save_circles_csv(const std::string &path, const std::vector<CircleCenter> &centers) {
            std::ofstream out(path);
            if (!out)
                throw std::runtime_error("Cannot open file: " + path);
            write_circles_csv(out, centers);
        }

        inline void save_itinerary_csv(const std::string &path, const Itinerary &itinerary) {
            std::ofstream out(path);
            if (!out)
                throw std::runtime_error("Cannot open file: " + path);
            write_itinerary_csv(out, itinerary);
        }

    } // namespace utils

} // namespace lokaltrax
