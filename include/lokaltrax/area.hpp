#pragma once

#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

#include <datapod/datapod.hpp>

#include "lokaltrax/error.hpp"
#include "lokaltrax/geo.hpp"
#include "lokaltrax/utils/utils.hpp"

namespace lokaltrax {

    /// Distance in degrees within which a point counts as lying on a polygon edge
    inline constexpr double kBoundaryTolerance = 1e-12;

    /**
     * @brief Area represents one search polygon of a coverage request
     *
     * The polygon lives in planar lon/lat degree space (x = longitude, y = latitude)
     * and is implicitly closed.
     */
    struct Area {
        datapod::Polygon polygon;
        std::size_t id = 0; ///< 1-based position in the request
        datapod::AABB bounding_box;
    };

    /**
     * @brief Create an Area from its corner coordinates
     *
     * A trailing vertex equal to the first one is dropped.
     *
     * @param corners Vertices in order, as (latitude, longitude)
     * @param id 1-based identifier of the area within its request
     * @return Validated Area with computed bounding box
     * @throws InvalidGeometry if fewer than 3 vertices remain or a coordinate is not finite
     * @throws InvalidCoordinate if a vertex lies outside the latitude/longitude ranges
     */
    inline Area create_area(const std::vector<datapod::Geo> &corners, std::size_t id) {
        datapod::Polygon poly;
        poly.vertices.reserve(corners.size());
        for (const auto &c : corners) {
            if (!std::isfinite(c.latitude) || !std::isfinite(c.longitude)) {
                throw InvalidGeometry("area " + std::to_string(id) + " has a non-finite vertex");
            }
            if (!is_valid_coordinate(c)) {
                throw InvalidCoordinate("area " + std::to_string(id) + " has vertex out of range " + describe(c));
            }
            poly.vertices.push_back(utils::to_planar(c));
        }

        Area area;
        area.polygon = utils::open_ring(poly);
        area.id = id;

        if (area.polygon.vertices.size() < 3) {
            throw InvalidGeometry("area " + std::to_string(id) + " needs at least 3 vertices, got " +
                                  std::to_string(area.polygon.vertices.size()));
        }

        area.bounding_box = area.polygon.get_aabb();
        return area;
    }

    /**
     * @brief Boundary-inclusive point-in-polygon test
     *
     * Points on an edge or a vertex (within kBoundaryTolerance) are inside. All
     * other points are classified by an even-odd ray cast toward +x (east).
     *
     * @param area The area to test against
     * @param point The query point
     * @return true if the point is inside or on the boundary
     */
    inline bool contains(const Area &area, const datapod::Geo &point) {
        const datapod::Point p = utils::to_planar(point);
        const auto &box = area.bounding_box;
        if (p.x < box.min_point.x - kBoundaryTolerance || p.x > box.max_point.x + kBoundaryTolerance ||
            p.y < box.min_point.y - kBoundaryTolerance || p.y > box.max_point.y + kBoundaryTolerance) {
            return false;
        }

        const auto &verts = area.polygon.vertices;
        std::size_t n = verts.size();

        for (std::size_t i = 0; i < n; ++i) {
            if (utils::point_to_line_distance(p, verts[i], verts[(i + 1) % n]) <= kBoundaryTolerance) {
                return true;
            }
        }

        bool inside = false;
        for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
            const auto &a = verts[i];
            const auto &b = verts[j];
            if ((a.y > p.y) != (b.y > p.y)) {
                double x_cross = a.x + (p.y - a.y) * (b.x - a.x) / (b.y - a.y);
                if (p.x < x_cross) {
                    inside = !inside;
                }
            }
        }
        return inside;
    }

} // namespace lokaltrax
