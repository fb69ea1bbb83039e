/**
 * @file shadow.hpp
 * @brief シャドウ区間の計算（隣接衝突判定用の導出時間窓）
 */
#ifndef STAND_ALLOC_SHADOW_HPP
#define STAND_ALLOC_SHADOW_HPP

#include "stand_alloc/domain.hpp"

namespace stand_alloc {

/**
 * @brief 導出されたシャドウ区間 [start, end)
 */
struct ShadowInterval {
    Time start = 0;
    Time end = 0;

    Time size() const { return end - start; }

    bool operator==(const ShadowInterval& other) const {
        return start == other.start && end == other.end;
    }
};

/**
 * @brief アンカーに対応する時刻を返す
 */
inline Time resolve_anchor(Time arrival, Time departure, TimeAnchor anchor) {
    return anchor == TimeAnchor::Arrival ? arrival : departure;
}

/**
 * @brief ターンの占有と時間窓定義からシャドウ区間を計算
 *
 * 純粋関数。同じ入力には常に同じ結果を返す。
 * start == end（長さ0）は許容する。
 *
 * @param arrival 到着時刻
 * @param departure 出発時刻
 * @param window 時間窓定義
 * @return シャドウ区間
 * @throws ConfigurationError start > end となる場合
 */
ShadowInterval compute_shadow_interval(Time arrival, Time departure,
                                       const TimeWindowDefinition& window);

/**
 * @brief Turn 版のオーバーロード
 */
inline ShadowInterval compute_shadow_interval(const Turn& turn,
                                              const TimeWindowDefinition& window) {
    return compute_shadow_interval(turn.arrival_time, turn.departure_time, window);
}

} // namespace stand_alloc

#endif // STAND_ALLOC_SHADOW_HPP
