/**
 * @file allocator.hpp
 * @brief スタンド割当の実行（検証 → 変数構築 → 制約登録 → 求解 → 結果解釈）
 */
#ifndef STAND_ALLOC_ALLOCATOR_HPP
#define STAND_ALLOC_ALLOCATOR_HPP

#include "stand_alloc/domain.hpp"
#include "stand_alloc/backend.hpp"
#include "stand_alloc/assembler.hpp"
#include <vector>
#include <optional>
#include <cstddef>

namespace stand_alloc {

/**
 * @brief 割当結果の種別
 */
enum class AllocationStatus {
    Optimal,          // 解が見つかり、最適
    Feasible,         // 解が見つかった
    Infeasible,       // ソルバーが解なしを証明
    Unknown,          // 打ち切り（解なしの証明ではない）
    NoFeasibleStand   // 実行可能なスタンドを持たないターンがある（求解前に検出）
};

const char* to_string(AllocationStatus status);

/**
 * @brief 割当結果
 */
struct AllocationResult {
    AllocationStatus status = AllocationStatus::Unknown;

    /// ターンごとの割当先スタンドのインデックス（解がなければ全て空）
    std::vector<std::optional<size_t>> stand_of_turn;

    /// 候補を持たないターンのインデックス（NoFeasibleStand の場合）
    std::vector<size_t> unplaceable_turns;

    AdjacencyStats adjacency_stats;

    bool has_solution() const {
        return status == AllocationStatus::Optimal || status == AllocationStatus::Feasible;
    }
};

/**
 * @brief スタンド割当器
 *
 * 問題インスタンスを保持し、与えられたバックエンドにモデルを組み立てて解く。
 * 状態は solve() 呼び出し内に閉じており、バックエンドは呼び出しごとに
 * 新しいものを渡すこと。
 */
class StandAllocator {
public:
    explicit StandAllocator(Problem problem);

    const Problem& problem() const { return problem_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

    /**
     * @brief 割当を求める
     *
     * 設定エラーは ConfigurationError として送出され、ソルバーは呼ばれない。
     * 解なし・打ち切りは AllocationResult::status で返す。
     *
     * @param backend 空のソルバーバックエンド
     * @throws ConfigurationError
     */
    AllocationResult solve(SolverBackend& backend) const;

private:
    Problem problem_;
    bool verbose_ = false;
};

} // namespace stand_alloc

#endif // STAND_ALLOC_ALLOCATOR_HPP
