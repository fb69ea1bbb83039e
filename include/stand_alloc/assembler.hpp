/**
 * @file assembler.hpp
 * @brief 制約アセンブラ（コア制約と隣接制約）
 */
#ifndef STAND_ALLOC_ASSEMBLER_HPP
#define STAND_ALLOC_ASSEMBLER_HPP

#include "stand_alloc/domain.hpp"
#include "stand_alloc/backend.hpp"
#include "stand_alloc/assignment.hpp"
#include <vector>
#include <cstddef>

namespace stand_alloc {

/**
 * @brief コア制約を登録
 *
 * - 各ターン: presence 変数のちょうど1つが true
 *   （候補のないターンも空の exactly-one として登録し、充足不能にする）
 * - 各スタンド: 存在する占有区間が重ならない（半開区間）
 */
void add_core_constraints(SolverBackend& backend, const AssignmentVariables& vars);

/**
 * @brief 隣接制約の登録結果
 */
struct AdjacencyStats {
    size_t active_rules = 0;      ///< no-overlap を登録したルール数
    size_t inactive_rules = 0;    ///< 該当候補がなく何も登録しなかったルール数
    size_t shadow_intervals = 0;  ///< 作成したシャドウ区間の総数
};

/**
 * @brief 隣接ルールごとにシャドウ区間を作り、no-overlap 制約を登録
 *
 * stand_a 上の候補には time_constraint_a、stand_b 上の候補には
 * time_constraint_b からシャドウ区間を導出し、候補と同じ presence 変数で
 * 存在を決める。ルールごとに独立に処理する。
 *
 * @throws ConfigurationError 未知のスタンド、両側が同じスタンド、
 *         または反転する時間窓を持つルール
 */
AdjacencyStats add_adjacency_constraints(SolverBackend& backend,
                                         const std::vector<Turn>& turns,
                                         const std::vector<Stand>& stands,
                                         const AssignmentVariables& vars,
                                         const std::vector<AdjacencyRule>& rules);

} // namespace stand_alloc

#endif // STAND_ALLOC_ASSEMBLER_HPP
