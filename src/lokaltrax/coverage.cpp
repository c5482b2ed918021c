#include "lokaltrax/coverage.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>

#include "lokaltrax/error.hpp"
#include "lokaltrax/utils/utils.hpp"

namespace lokaltrax {

    namespace {

        // Upper bound on rows or columns of a single sweep
        constexpr double kMaxStepsPerAxis = 1e6;

        std::size_t step_count(double span, double step, const char *axis) {
            if (!(step > 0.0))
                throw InvalidParameter(std::string(axis) + " step underflows to zero, radius is too small");
            if (!std::isfinite(step) || span <= 0.0)
                return 0;
            double count = std::ceil(span / step);
            if (!std::isfinite(count) || count > kMaxStepsPerAxis)
                throw InvalidParameter(std::string(axis) + " grid would need " + std::to_string(count) +
                                       " steps, radius is too small for the area");
            return static_cast<std::size_t>(count);
        }

        // Index-driven so rows and columns never drift
        double grid_value(double min, double step, std::size_t i) {
            return min + static_cast<double>(i) * step;
        }

    } // namespace

    Coverage::Coverage(const CoverageRequest &request)
        : radius_(request.radius_meters), spacing_factor_(request.spacing_factor) {
        if (!std::isfinite(radius_) || radius_ <= 0.0)
            throw InvalidParameter("radius must be positive, got " + std::to_string(radius_));
        if (!std::isfinite(spacing_factor_) || spacing_factor_ < 0.0 || spacing_factor_ > 1.0)
            throw InvalidParameter("spacing factor must be in [0, 1], got " + std::to_string(spacing_factor_));

        areas_.reserve(request.areas.size());
        for (std::size_t i = 0; i < request.areas.size(); ++i) {
            areas_.push_back(create_area(request.areas[i], i + 1));
        }

        if (areas_.empty())
            return;

        std::vector<datapod::AABB> boxes;
        boxes.reserve(areas_.size());
        for (const auto &area : areas_) {
            boxes.push_back(area.bounding_box);
        }
        bbox_ = utils::merge_boxes(boxes);
        steps_ = compute_steps();
    }

    GridSteps Coverage::compute_steps() const {
        GridSteps s;
        double min_lat = bbox_.min_point.y;
        double max_lat = bbox_.max_point.y;
        double min_lon = bbox_.min_point.x;
        double max_lon = bbox_.max_point.x;

        s.reference_latitude = std::abs(min_lat) > std::abs(max_lat) ? min_lat : max_lat;

        double scale = 1.0 + spacing_factor_;
        s.lat_step = meters_to_lat_degrees(radius_) * scale;
        s.lon_step = meters_to_lon_degrees(radius_, s.reference_latitude) * scale;

        s.rows = step_count(max_lat - min_lat, s.lat_step, "latitude");
        s.cols = step_count(max_lon - min_lon, s.lon_step, "longitude");
        return s;
    }

    std::size_t Coverage::owning_area(const datapod::Geo &point) const {
        for (const auto &area : areas_) {
            if (contains(area, point))
                return area.id;
        }
        return 0;
    }

    CoverageResult Coverage::generate() const {
        CoverageResult result;

        if (areas_.empty()) {
            std::cerr << "Warning: no areas provided, nothing to cover" << std::endl;
            result.status = CoverageStatus::NoAreasProvided;
            return result;
        }

        double min_lat = bbox_.min_point.y;
        double min_lon = bbox_.min_point.x;

        for (std::size_t i = 0; i <= steps_.rows; ++i) {
            double lat = grid_value(min_lat, steps_.lat_step, i);
            for (std::size_t j = 0; j <= steps_.cols; ++j) {
                double lon = grid_value(min_lon, steps_.lon_step, j);
                datapod::Geo point{lat, lon, 0.0};
                std::size_t id = owning_area(point);
                if (id == 0)
                    continue;

                result.centers.push_back(CircleCenter{point, radius_, id});
            }
        }

        return result;
    }

} // namespace lokaltrax
