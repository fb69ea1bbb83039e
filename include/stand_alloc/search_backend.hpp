/**
 * @file search_backend.hpp
 * @brief 組み込みソルバーアダプタ（presence 変数上のバックトラック探索）
 */
#ifndef STAND_ALLOC_SEARCH_BACKEND_HPP
#define STAND_ALLOC_SEARCH_BACKEND_HPP

#include "stand_alloc/backend.hpp"
#include <vector>
#include <string>
#include <atomic>
#include <cstdint>

namespace stand_alloc {

/**
 * @brief 登録されたオプショナル区間
 */
struct IntervalData {
    Time start = 0;
    Time size = 0;
    Time end = 0;
    BoolVar presence;
    std::string name;
};

/**
 * @brief 探索統計情報
 */
struct SearchStats {
    size_t decisions = 0;
    size_t fails = 0;
    size_t max_depth = 0;
    size_t propagations = 0;
    size_t conflict_pairs = 0;
};

/**
 * @brief SolverBackend の組み込み実装
 *
 * exactly-one と no-overlap だけを扱う専用エンジン:
 * - no-overlap は区間の重なりを事前計算し、ブール変数間の排他
 *   （一方が true なら他方は false）に変換する
 * - exactly-one は1つが true になると残りを false にし、
 *   未確定が1つだけ残れば true に確定する
 * - 探索は未確定メンバーの最も少ない exactly-one グループを選び
 *   （同数なら失敗 Activity の大きい方）、各メンバーを順に試す
 *
 * 長さ0の区間は何とも重ならない。
 * 目的関数を持たないため、解が見つかれば Optimal を返す。
 */
class SearchBackend : public SolverBackend {
public:
    SearchBackend() = default;

    // ===== SolverBackend =====

    BoolVar new_bool_var(const std::string& name) override;
    IntervalVar new_optional_interval(Time start, Time size, Time end,
                                      BoolVar presence,
                                      const std::string& name) override;
    void add_exactly_one(const std::vector<BoolVar>& vars) override;
    void add_no_overlap(const std::vector<IntervalVar>& intervals) override;
    SolveStatus solve() override;
    bool value(BoolVar var) const override;

    // ===== 設定 =====

    /**
     * @brief verbose モードを有効/無効にする（stderr に進捗を出力）
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

    /**
     * @brief 失敗回数の上限（0 = 無制限）。超えると Unknown で打ち切る
     */
    void set_fail_limit(size_t limit) { fail_limit_ = limit; }

    /**
     * @brief 探索を停止する（シグナルハンドラから呼び出し可能）
     */
    void stop() { stopped_ = true; }

    /**
     * @brief 停止フラグをリセット
     */
    void reset_stop() { stopped_ = false; }

    /**
     * @brief 停止フラグを確認
     */
    bool is_stopped() const { return stopped_; }

    // ===== 参照 =====

    const SearchStats& stats() const { return stats_; }

    size_t num_bool_vars() const { return var_names_.size(); }
    size_t num_intervals() const { return intervals_.size(); }
    size_t num_constraints() const { return groups_.size() + no_overlaps_.size(); }

    const std::string& name(BoolVar var) const;
    const IntervalData& interval(IntervalVar var) const;

private:
    enum class SearchResult { SAT, UNSAT, UNKNOWN };

    static constexpr int8_t UNASSIGNED = -1;

    // ===== 探索 =====

    /**
     * @brief 探索前の準備（排他リストの構築と初期伝播）
     * @return 矛盾が検出されたら false
     */
    bool presolve();

    /**
     * @brief no-overlap 制約から排他ペアを構築
     */
    void build_conflicts();

    SearchResult run_search(size_t depth);

    /**
     * @brief 次に分岐する exactly-one グループを選択
     * @return 全グループが充足済みなら SIZE_MAX
     */
    size_t select_group() const;

    /**
     * @brief 変数に値を割り当て、伝播キューに追加
     * @return 既に異なる値が割り当て済みなら false
     */
    bool assign(size_t var, bool val);

    /**
     * @brief グループの状態を確認し、必要なら残り1変数を true に確定
     */
    bool propagate_group(size_t group);

    /**
     * @brief 伝播キューを処理
     */
    bool process_queue();

    /**
     * @brief trail を指定サイズまで巻き戻す
     */
    void backtrack(size_t trail_size);

    /**
     * @brief 現在の割当で全制約が満たされているか検証
     */
    bool verify_solution() const;

    void check_var(BoolVar var) const;

    // ===== モデル =====
    std::vector<std::string> var_names_;
    std::vector<IntervalData> intervals_;
    std::vector<std::vector<size_t>> groups_;        // exactly-one（変数インデックス）
    std::vector<std::vector<size_t>> no_overlaps_;   // no-overlap（区間インデックス）

    // ===== 探索状態 =====
    std::vector<int8_t> values_;
    std::vector<size_t> trail_;
    std::vector<size_t> queue_;
    size_t queue_head_ = 0;
    std::vector<std::vector<size_t>> var_groups_;    // 変数 -> 所属グループ
    std::vector<std::vector<size_t>> conflicts_;     // 変数 -> 同時に true にできない変数
    std::vector<double> activity_;                   // グループごとの失敗 Activity

    // ===== 結果 =====
    std::vector<char> solution_;
    bool has_solution_ = false;

    // ===== 設定 =====
    bool verbose_ = false;
    size_t fail_limit_ = 0;
    std::atomic<bool> stopped_{false};

    SearchStats stats_;
};

} // namespace stand_alloc

#endif // STAND_ALLOC_SEARCH_BACKEND_HPP
