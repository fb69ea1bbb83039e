/**
 * @file backend.hpp
 * @brief ソルバーアダプタの抽象インターフェース
 *
 * コアが必要とする最小限の機能だけを定義する:
 * - ブール決定変数の宣言
 * - ブール変数で存在が決まるオプショナル区間の宣言
 * - exactly-one 制約
 * - no-overlap 制約
 * - 同期的な求解と結果の取得
 */
#ifndef STAND_ALLOC_BACKEND_HPP
#define STAND_ALLOC_BACKEND_HPP

#include "stand_alloc/domain.hpp"
#include <vector>
#include <string>
#include <cstddef>

namespace stand_alloc {

/**
 * @brief ブール決定変数のハンドル（バックエンド内インデックス）
 */
struct BoolVar {
    size_t id = 0;

    bool operator==(const BoolVar& other) const { return id == other.id; }
    bool operator!=(const BoolVar& other) const { return id != other.id; }
};

/**
 * @brief オプショナル区間のハンドル（バックエンド内インデックス）
 */
struct IntervalVar {
    size_t id = 0;

    bool operator==(const IntervalVar& other) const { return id == other.id; }
    bool operator!=(const IntervalVar& other) const { return id != other.id; }
};

/**
 * @brief 求解結果
 */
enum class SolveStatus {
    Optimal,     // 解が見つかり、最適であることが示された
    Feasible,    // 解が見つかった
    Infeasible,  // 解が存在しないことが示された
    Unknown      // 打ち切り（タイムアウトなど）
};

const char* to_string(SolveStatus status);

/**
 * @brief 解が得られた結果か
 */
inline bool has_solution(SolveStatus status) {
    return status == SolveStatus::Optimal || status == SolveStatus::Feasible;
}

/**
 * @brief ソルバーアダプタ
 *
 * コアはこのインターフェースだけに依存し、ソルバー固有の設定には触れない。
 */
class SolverBackend {
public:
    virtual ~SolverBackend() = default;

    /**
     * @brief ブール決定変数を作成
     * @param name 変数名（診断用）
     */
    virtual BoolVar new_bool_var(const std::string& name) = 0;

    /**
     * @brief presence が true のときだけ存在する区間を作成
     * @param start 開始時刻
     * @param size 長さ（end - start）
     * @param end 終了時刻
     * @param presence 存在を決めるブール変数
     * @param name 区間名（診断用）
     * @throws ConfigurationError size < 0、start + size != end、
     *         または presence がこのバックエンドの変数でない場合
     */
    virtual IntervalVar new_optional_interval(Time start, Time size, Time end,
                                              BoolVar presence,
                                              const std::string& name) = 0;

    /**
     * @brief ちょうど1つが true
     *
     * 空のリストは充足不能な制約として登録される。
     */
    virtual void add_exactly_one(const std::vector<BoolVar>& vars) = 0;

    /**
     * @brief 存在する区間同士が重ならない
     */
    virtual void add_no_overlap(const std::vector<IntervalVar>& intervals) = 0;

    /**
     * @brief 求解（同期）
     */
    virtual SolveStatus solve() = 0;

    /**
     * @brief ブール変数の値を取得
     * @pre 直前の solve() が Optimal または Feasible を返していること
     * @throws std::logic_error 解がない場合
     */
    virtual bool value(BoolVar var) const = 0;
};

} // namespace stand_alloc

#endif // STAND_ALLOC_BACKEND_HPP
