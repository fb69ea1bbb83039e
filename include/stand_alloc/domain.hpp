/**
 * @file domain.hpp
 * @brief スタンド割当問題のドメインモデル（スタンド、ターン、隣接ルール、実行可能性行列）
 */
#ifndef STAND_ALLOC_DOMAIN_HPP
#define STAND_ALLOC_DOMAIN_HPP

#include <vector>
#include <string>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace stand_alloc {

/**
 * @brief 共通タイムライン上の時刻（基準時刻からの分）
 */
using Time = int64_t;

/**
 * @brief 駐機スタンド
 */
struct Stand {
    std::string stand_id;
};

/**
 * @brief ターン（1機の地上滞在、到着から出発まで）
 *
 * 不変条件: arrival_time < departure_time
 */
struct Turn {
    std::string turn_id;
    int turn_seq = 0;       ///< 同一便の繰り返しターンを区別する連番
    std::string flight_id;
    Time arrival_time = 0;
    Time departure_time = 0;

    /**
     * @brief 変数名などに使う表示キー
     *
     * turn_seq が 0 なら turn_id、それ以外は "turn_id#turn_seq"。
     */
    std::string key() const;

    /**
     * @brief 占有時間の長さ
     */
    Time duration() const { return departure_time - arrival_time; }
};

/**
 * @brief シャドウ区間の端点を固定するアンカー
 */
enum class TimeAnchor {
    Arrival,
    Departure
};

const char* to_string(TimeAnchor anchor);

/**
 * @brief ターンの占有からシャドウ区間を導出する規則
 *
 * start = anchor(start_anchor) + start_offset_minutes
 * end   = anchor(end_anchor)   + end_offset_minutes
 */
struct TimeWindowDefinition {
    TimeAnchor start_anchor = TimeAnchor::Arrival;
    Time start_offset_minutes = 0;
    TimeAnchor end_anchor = TimeAnchor::Departure;
    Time end_offset_minutes = 0;

    /**
     * @brief 生の占有区間と一致する時間窓（Arrival+0 .. Departure+0）
     */
    static TimeWindowDefinition occupancy();

    /**
     * @brief "ARRIVAL+0 .. DEPARTURE-30" 形式の表記
     */
    std::string to_string() const;

    /**
     * @brief 定義時点で判定できる反転を検出
     *
     * 両端が同じアンカーで start_offset > end_offset の場合、
     * どのターンでも start > end となるため ConfigurationError を送出する。
     * アンカーが異なる場合の反転はターンごとの評価時に検出される。
     *
     * @param context エラーメッセージに含める識別子
     */
    void validate(const std::string& context) const;
};

/**
 * @brief 2スタンド間の隣接衝突ルール
 *
 * stand_a 側のシャドウと stand_b 側のシャドウが同時に存在してはならない。
 * 順序は各側にどちらの時間窓を使うかだけを決める。
 */
struct AdjacencyRule {
    std::string rule_id;
    std::string name;
    std::optional<std::string> description;
    std::string stand_a;
    std::string stand_b;
    TimeWindowDefinition time_constraint_a;
    TimeWindowDefinition time_constraint_b;
};

/**
 * @brief ターン × スタンドの実行可能性行列
 *
 * true ならそのターンをそのスタンドに置いてよい。既定は全て true。
 */
class FeasibilityMatrix {
public:
    FeasibilityMatrix() = default;

    /**
     * @brief 全て true の行列を作成
     * @param rows ターン数
     * @param cols スタンド数
     */
    FeasibilityMatrix(size_t rows, size_t cols);

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }

    /**
     * @brief (turn, stand) が許可されているか
     * @throws std::out_of_range 範囲外
     */
    bool allowed(size_t turn, size_t stand) const;

    void set(size_t turn, size_t stand, bool value);
    void allow(size_t turn, size_t stand) { set(turn, stand, true); }
    void restrict(size_t turn, size_t stand) { set(turn, stand, false); }

    /**
     * @brief ターンの許可スタンド数
     */
    size_t feasible_count(size_t turn) const;

private:
    size_t index(size_t turn, size_t stand) const;

    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<char> cells_;
};

/**
 * @brief 1回の求解に渡す問題インスタンス
 */
struct Problem {
    std::vector<Turn> turns;
    std::vector<Stand> stands;
    FeasibilityMatrix feasibility;
    std::vector<AdjacencyRule> adjacency_rules;

    /**
     * @brief スタンドIDからインデックスを検索
     * @return 見つからなければ std::nullopt
     */
    std::optional<size_t> find_stand(const std::string& stand_id) const;

    /**
     * @brief 入力の整合性を検証
     *
     * 検出する設定エラー:
     * - arrival_time >= departure_time のターン
     * - (turn_id, turn_seq) の重複、stand_id の重複
     * - 実行可能性行列の次元不一致
     * - 未知のスタンドを参照する隣接ルール、両側が同じスタンドのルール
     * - 定義時点で反転している時間窓
     *
     * @throws ConfigurationError
     */
    void validate() const;
};

/**
 * @brief ターン列を検証（Problem::validate から呼ばれる）
 * @throws ConfigurationError
 */
void validate_turns(const std::vector<Turn>& turns);

/**
 * @brief スタンド列を検証（Problem::validate から呼ばれる）
 * @throws ConfigurationError
 */
void validate_stands(const std::vector<Stand>& stands);

/**
 * @brief 行列の次元がターン数 × スタンド数と一致するか検証
 * @throws ConfigurationError
 */
void validate_feasibility(const FeasibilityMatrix& feasibility,
                          size_t num_turns, size_t num_stands);

/**
 * @brief 隣接ルールを検証
 *
 * 両側のスタンドが stands に存在し、互いに異なること。
 * 両側の時間窓に TimeWindowDefinition::validate() を適用する。
 *
 * @throws ConfigurationError
 */
void validate_adjacency_rule(const AdjacencyRule& rule,
                             const std::vector<Stand>& stands);

} // namespace stand_alloc

#endif // STAND_ALLOC_DOMAIN_HPP
