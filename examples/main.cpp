#include <iomanip>
#include <iostream>
#include <optional>
#include <vector>

#include <datapod/datapod.hpp>

#include "lokaltrax/lokaltrax.hpp"

int main() {
    // Three search areas: central Rome, central Milan and a corner of Paris
    lokaltrax::CoverageRequest request;
    request.areas.push_back({datapod::Geo{41.90665632093537, 12.444106035745042, 0.0},
                             datapod::Geo{41.920986165507635, 12.485878723385273, 0.0},
                             datapod::Geo{41.88566966505911, 12.507843030961459, 0.0},
                             datapod::Geo{41.87445022399441, 12.479931279143306, 0.0}});
    request.areas.push_back({datapod::Geo{45.451999, 9.177265, 0.0}, datapod::Geo{45.470536, 9.190695, 0.0},
                             datapod::Geo{45.460010, 9.215280, 0.0}, datapod::Geo{45.441473, 9.201849, 0.0}});
    request.areas.push_back({datapod::Geo{48.8500, 2.2900, 0.0}, datapod::Geo{48.8600, 2.3000, 0.0},
                             datapod::Geo{48.8550, 2.3100, 0.0}, datapod::Geo{48.8450, 2.3050, 0.0}});
    request.radius_meters = 500.0;
    request.spacing_factor = 0.5;

    try {
        lokaltrax::Coverage coverage(request);
        const auto &steps = coverage.grid_steps();
        std::cout << "Grid: " << steps.rows + 1 << " rows x " << steps.cols + 1 << " cols, step " << std::fixed
                  << std::setprecision(6) << steps.lat_step << " x " << steps.lon_step << " deg\n";

        auto result = coverage.generate();
        std::cout << "Generated " << result.centers.size() << " circle centers.\n";

        std::vector<std::size_t> per_area(coverage.areas().size() + 1, 0);
        for (const auto &c : result.centers) {
            per_area[c.area_id]++;
        }
        for (std::size_t i = 1; i < per_area.size(); ++i) {
            std::cout << "  Area " << i << ": " << per_area[i] << " circles\n";
        }

        lokaltrax::utils::save_circles_csv("all_circle_centers_data.csv", result.centers);
        std::cout << "Circle centers saved to 'all_circle_centers_data.csv'.\n";

        // Scored destinations in Milan, as they would come out of the ranking stage
        std::vector<lokaltrax::RoutePoint> candidates{
            {1, "Duomo di Milano", datapod::Geo{45.4642, 9.1916, 0.0}, 4.8},
            {2, "Galleria Vittorio Emanuele II", datapod::Geo{45.4659, 9.1900, 0.0}, 4.1},
            {3, "Castello Sforzesco", datapod::Geo{45.4705, 9.1793, 0.0}, 3.9},
            {4, "Navigli", datapod::Geo{45.4520, 9.1750, 0.0}, 2.7},
            {5, "Pinacoteca di Brera", datapod::Geo{45.4719, 9.1880, 0.0}, 3.5},
            {6, "Santa Maria delle Grazie", datapod::Geo{45.4659, 9.1710, 0.0}, 4.5},
        };

        auto anchors = lokaltrax::default_anchors();
        datapod::Geo start = lokaltrax::resolve_start(std::nullopt, "milan", anchors);

        lokaltrax::RouteSequencer sequencer(candidates, start, 4);
        auto itinerary = sequencer.run();

        std::cout << "\nItinerary from " << lokaltrax::describe(start) << ":\n";
        for (const auto &stop : itinerary.stops) {
            std::cout << "  " << stop.visit_order << ". " << stop.point.name << " (" << std::setprecision(2)
                      << stop.leg_km << " km)\n";
        }
        std::cout << "Total: " << itinerary.total_distance_km << " km\n";
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
