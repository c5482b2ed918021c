#pragma once

#include <stdexcept>
#include <string>

namespace lokaltrax {

    /**
     * @brief Polygon with fewer than 3 vertices or a non-finite coordinate
     */
    class InvalidGeometry : public std::invalid_argument {
      public:
        using std::invalid_argument::invalid_argument;
    };

    /**
     * @brief Request parameter outside its valid range (radius, spacing factor, ids, city)
     */
    class InvalidParameter : public std::invalid_argument {
      public:
        using std::invalid_argument::invalid_argument;
    };

    /**
     * @brief Latitude/longitude that is non-finite or out of range
     */
    class InvalidCoordinate : public std::invalid_argument {
      public:
        using std::invalid_argument::invalid_argument;
    };

    /**
     * @brief Candidate desirability indicator that is not a positive finite number
     */
    class InvalidIndicator : public std::invalid_argument {
      public:
        using std::invalid_argument::invalid_argument;
    };

} // namespace lokaltrax
