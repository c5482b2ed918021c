#pragma once

#include <cstddef>
#include <vector>

#include <datapod/datapod.hpp>

#include "lokaltrax/area.hpp"
#include "lokaltrax/geo.hpp"

namespace lokaltrax {

    /**
     * @brief Everything needed for one coverage computation
     */
    struct CoverageRequest {
        std::vector<std::vector<datapod::Geo>> areas; ///< Corner sets, one per polygon
        double radius_meters = 500.0;
        double spacing_factor = 0.5; ///< 0 = centers one radius apart, 1 = circles tangent
    };

    /**
     * @brief Center of one sampling circle
     */
    struct CircleCenter {
        datapod::Geo location;
        double radius_meters = 0.0;
        std::size_t area_id = 0; ///< 1-based index of the first area containing the center
    };

    enum class CoverageStatus {
        Ok,
        NoAreasProvided, ///< Request had no areas, centers is empty
    };

    struct CoverageResult {
        std::vector<CircleCenter> centers;
        CoverageStatus status = CoverageStatus::Ok;
    };

    /**
     * @brief Grid parameters derived from the request
     */
    struct GridSteps {
        double lat_step = 0.0;           ///< Degrees between rows
        double lon_step = 0.0;           ///< Degrees between columns
        double reference_latitude = 0.0; ///< Latitude used for the longitude step
        std::size_t rows = 0;            ///< Last row index, rows + 1 rows are swept
        std::size_t cols = 0;            ///< Last column index, cols + 1 columns are swept
    };

    /**
     * @brief Coverage tiles a set of areas with a grid of sampling circles
     *
     * A lat/lon grid is swept over the union bounding box of all areas, south to
     * north then west to east, and every grid point that falls inside an area
     * becomes a circle center. The result drives one nearby-search request per
     * circle. This is a heuristic sweep, not a minimum circle cover.
     */
    class Coverage {
        std::vector<Area> areas_;
        double radius_;
        double spacing_factor_;
        datapod::AABB bbox_{};
        GridSteps steps_{};

      public:
        /**
         * @brief Validate a request and precompute the grid
         *
         * @throws InvalidParameter if radius is not positive or spacing factor is outside [0, 1],
         *         or if the radius is so small that the grid step underflows or the sweep is unbounded
         * @throws InvalidGeometry / InvalidCoordinate for malformed areas
         */
        explicit Coverage(const CoverageRequest &request);

        /**
         * @brief Sweep the grid and collect circle centers
         *
         * @return Centers in sweep order; status NoAreasProvided if there was nothing to cover
         */
        CoverageResult generate() const;

        const std::vector<Area> &areas() const { return areas_; }
        const datapod::AABB &bounding_box() const { return bbox_; }
        const GridSteps &grid_steps() const { return steps_; }
        double radius() const { return radius_; }
        double spacing_factor() const { return spacing_factor_; }

      private:
        GridSteps compute_steps() const;
        std::size_t owning_area(const datapod::Geo &point) const;
    };

} // namespace lokaltrax
