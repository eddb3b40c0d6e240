#ifndef flood_roc_Score_hpp
#define flood_roc_Score_hpp

#include <cmath>
#include <limits>

namespace flood_roc {

// sentinel used by the samplers for no-data and out of bounds locations
inline double missing_score() {
    return std::numeric_limits<double>::quiet_NaN();
}

inline bool is_missing(double score) {
    return std::isnan(score) || std::isinf(score);
}

} /* namespace flood_roc */

#endif /* flood_roc_Score_hpp */
