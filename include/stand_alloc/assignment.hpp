/**
 * @file assignment.hpp
 * @brief 割当候補（presence 変数 + オプショナル占有区間）の構築
 */
#ifndef STAND_ALLOC_ASSIGNMENT_HPP
#define STAND_ALLOC_ASSIGNMENT_HPP

#include "stand_alloc/domain.hpp"
#include "stand_alloc/backend.hpp"
#include <vector>
#include <cstddef>

namespace stand_alloc {

/**
 * @brief 実行可能な (turn, stand) ペア1つ分の割当候補
 *
 * occupancy は presence が true のときだけ意味を持つ。
 */
struct AssignmentCandidate {
    size_t turn = 0;          ///< Problem::turns 内のインデックス
    size_t stand = 0;         ///< Problem::stands 内のインデックス
    BoolVar presence;
    IntervalVar occupancy;    ///< [arrival, departure)
};

/**
 * @brief 割当変数ビルダーの結果
 *
 * 候補を所有し、制約組み立て用にスタンド別・ターン別の索引を持つ。
 * 両アセンブラはこのオブジェクトを参照するだけで変更しない。
 */
class AssignmentVariables {
public:
    AssignmentVariables(size_t num_turns, size_t num_stands);

    /**
     * @brief 候補を登録し、索引を更新
     */
    void add(const AssignmentCandidate& candidate);

    const std::vector<AssignmentCandidate>& candidates() const { return candidates_; }

    size_t num_turns() const { return presence_by_turn_.size(); }
    size_t num_stands() const { return intervals_by_stand_.size(); }

    /**
     * @brief スタンドの占有区間（no-overlap 用）
     */
    const std::vector<IntervalVar>& intervals_for_stand(size_t stand) const;

    /**
     * @brief ターンの presence 変数（exactly-one 用）
     */
    const std::vector<BoolVar>& presence_for_turn(size_t turn) const;

    /**
     * @brief (turn, stand) の候補を検索
     * @return 候補がなければ nullptr
     */
    const AssignmentCandidate* find(size_t turn, size_t stand) const;

    /**
     * @brief 候補を1つも持たないターン（構造的に配置不能）
     */
    std::vector<size_t> unplaceable_turns() const;

private:
    std::vector<AssignmentCandidate> candidates_;
    std::vector<std::vector<IntervalVar>> intervals_by_stand_;
    std::vector<std::vector<BoolVar>> presence_by_turn_;
    // (turn * num_stands + stand) -> candidates_ 内インデックス + 1（0 は候補なし）
    std::vector<size_t> lookup_;
};

/**
 * @brief 実行可能な全ペアについて presence 変数と占有区間を作成
 *
 * 実行可能性が false のペアには何も作らない（唯一の枝刈り手段）。
 * 変数名は presence が "<turn>_on_<stand>"、区間が "stand_<stand>_for_<turn>"。
 *
 * @throws ConfigurationError 行列の次元がターン数 × スタンド数と一致しない場合
 */
AssignmentVariables build_assignment_variables(SolverBackend& backend,
                                               const std::vector<Turn>& turns,
                                               const std::vector<Stand>& stands,
                                               const FeasibilityMatrix& feasibility);

} // namespace stand_alloc

#endif // STAND_ALLOC_ASSIGNMENT_HPP
