#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

#include <datapod/datapod.hpp>

namespace lokaltrax {

    namespace utils {

        /**
         * @brief Map a geographic coordinate into planar lon/lat degree space
         *
         * @param geo Geographic point
         * @return Point with x = longitude, y = latitude, z = 0
         */
        inline datapod::Point to_planar(const datapod::Geo &geo) {
            return datapod::Point{geo.longitude, geo.latitude, 0.0};
        }

        /**
         * @brief Check if two points are approximately equal in the plane
         *
         * @param p1 First point
         * @param p2 Second point
         * @param epsilon Tolerance
         * @return true if points are approximately equal
         */
        inline bool points_equal(const datapod::Point &p1, const datapod::Point &p2, double epsilon = 1e-12) {
            double dx = p1.x - p2.x;
            double dy = p1.y - p2.y;
            return (dx * dx + dy * dy) < epsilon * epsilon;
        }

        /**
         * @brief Drop the closing vertex of a ring if it repeats the first one
         *
         * Rings are kept implicitly closed: the edge from the last vertex back to
         * the first is implied.
         *
         * @param polygon The polygon to open
         * @return Polygon without a duplicated closing vertex
         */
        inline datapod::Polygon open_ring(const datapod::Polygon &polygon) {
            datapod::Polygon result = polygon;
            while (result.vertices.size() > 1 && points_equal(result.vertices.front(), result.vertices.back())) {
                result.vertices.pop_back();
            }
            return result;
        }

        /**
         * @brief Calculate distance from a point to a line segment
         *
         * @param point The point
         * @param line_start Start of the line segment
         * @param line_end End of the line segment
         * @return Distance from point to line segment
         */
        inline double point_to_line_distance(const datapod::Point &point, const datapod::Point &line_start,
                                             const datapod::Point &line_end) {
            datapod::Segment seg{line_start, line_end};
            return seg.distance_to(point);
        }

        /**
         * @brief Smallest box enclosing every box in the list
         *
         * @param boxes Non-empty list of boxes
         * @return Union bounding box
         */
        inline datapod::AABB merge_boxes(const std::vector<datapod::AABB> &boxes) {
            datapod::AABB out = boxes.front();
            for (std::size_t i = 1; i < boxes.size(); ++i) {
                const auto &b = boxes[i];
                out.min_point.x = std::min(out.min_point.x, b.min_point.x);
                out.min_point.y = std::min(out.min_point.y, b.min_point.y);
                out.max_point.x = std::max(out.max_point.x, b.max_point.x);
                out.max_point.y = std::max(out.max_point.y, b.max_point.y);
            }
            return out;
        }

    } // namespace utils

} // namespace lokaltrax
