#include "stand_alloc/shadow.hpp"
#include "stand_alloc/error.hpp"
#include <string>

namespace stand_alloc {

ShadowInterval compute_shadow_interval(Time arrival, Time departure,
                                       const TimeWindowDefinition& window) {
    ShadowInterval shadow;
    shadow.start = resolve_anchor(arrival, departure, window.start_anchor)
                   + window.start_offset_minutes;
    shadow.end = resolve_anchor(arrival, departure, window.end_anchor)
                 + window.end_offset_minutes;

    // 異なるアンカー間の反転はターンの長さ次第なのでここで検出する
    if (shadow.start > shadow.end) {
        throw ConfigurationError(
            "time window " + window.to_string() + " resolves to [" +
            std::to_string(shadow.start) + ", " + std::to_string(shadow.end) +
            ") for occupancy [" + std::to_string(arrival) + ", " +
            std::to_string(departure) + ")");
    }
    return shadow;
}

} // namespace stand_alloc
