/**
 * @file search_backend.cpp
 * @brief 組み込みソルバーアダプタの実装
 *
 * 探索は presence 変数だけを対象とする。区間の位置は固定なので、
 * no-overlap は事前計算した排他ペアへの単位伝播に帰着する。
 */
#include "stand_alloc/search_backend.hpp"
#include "stand_alloc/error.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <cstdint>

namespace stand_alloc {

// ============================================================================
// モデル構築
// ============================================================================

BoolVar SearchBackend::new_bool_var(const std::string& name) {
    has_solution_ = false;
    var_names_.push_back(name);
    return BoolVar{var_names_.size() - 1};
}

IntervalVar SearchBackend::new_optional_interval(Time start, Time size, Time end,
                                                 BoolVar presence,
                                                 const std::string& name) {
    if (size < 0 || start + size != end) {
        throw ConfigurationError(
            "interval " + name + ": start " + std::to_string(start) + " + size " +
            std::to_string(size) + " does not match end " + std::to_string(end));
    }
    if (presence.id >= var_names_.size()) {
        throw ConfigurationError("interval " + name + ": unknown presence variable");
    }

    has_solution_ = false;
    intervals_.push_back(IntervalData{start, size, end, presence, name});
    return IntervalVar{intervals_.size() - 1};
}

void SearchBackend::add_exactly_one(const std::vector<BoolVar>& vars) {
    has_solution_ = false;
    std::vector<size_t> group;
    group.reserve(vars.size());
    for (const auto& var : vars) {
        check_var(var);
        group.push_back(var.id);
    }
    groups_.push_back(std::move(group));
}

void SearchBackend::add_no_overlap(const std::vector<IntervalVar>& intervals) {
    has_solution_ = false;
    std::vector<size_t> members;
    members.reserve(intervals.size());
    for (const auto& iv : intervals) {
        if (iv.id >= intervals_.size()) {
            throw std::out_of_range("unknown interval variable");
        }
        members.push_back(iv.id);
    }
    no_overlaps_.push_back(std::move(members));
}

const std::string& SearchBackend::name(BoolVar var) const {
    check_var(var);
    return var_names_[var.id];
}

const IntervalData& SearchBackend::interval(IntervalVar var) const {
    if (var.id >= intervals_.size()) {
        throw std::out_of_range("unknown interval variable");
    }
    return intervals_[var.id];
}

void SearchBackend::check_var(BoolVar var) const {
    if (var.id >= var_names_.size()) {
        throw std::out_of_range("unknown boolean variable " + std::to_string(var.id));
    }
}

bool SearchBackend::value(BoolVar var) const {
    if (!has_solution_) {
        throw std::logic_error("no solution available");
    }
    check_var(var);
    return solution_[var.id] != 0;
}

// ============================================================================
// 求解
// ============================================================================

SolveStatus SearchBackend::solve() {
    has_solution_ = false;
    solution_.clear();
    stats_ = SearchStats{};

    if (verbose_) {
        std::cerr << "% [verbose] search start: " << var_names_.size() << " variables, "
                  << intervals_.size() << " intervals, " << groups_.size()
                  << " exactly-one, " << no_overlaps_.size() << " no-overlap\n";
    }

    if (!presolve()) {
        if (verbose_) std::cerr << "% [verbose] presolve failed\n";
        return SolveStatus::Infeasible;
    }
    if (verbose_) {
        std::cerr << "% [verbose] presolve done: " << stats_.conflict_pairs
                  << " conflict pairs, " << trail_.size() << " fixed\n";
    }

    auto res = run_search(0);

    if (verbose_) {
        std::cerr << "% [verbose] search done: decisions=" << stats_.decisions
                  << " fails=" << stats_.fails
                  << " max_depth=" << stats_.max_depth << "\n";
    }

    switch (res) {
        case SearchResult::SAT:
            return SolveStatus::Optimal;
        case SearchResult::UNSAT:
            return SolveStatus::Infeasible;
        case SearchResult::UNKNOWN:
            if (verbose_) std::cerr << "% [verbose] search stopped\n";
            return SolveStatus::Unknown;
    }
    return SolveStatus::Unknown;
}

bool SearchBackend::presolve() {
    const size_t n = var_names_.size();
    values_.assign(n, UNASSIGNED);
    trail_.clear();
    queue_.clear();
    queue_head_ = 0;
    activity_.assign(groups_.size(), 0.0);

    var_groups_.assign(n, {});
    for (size_t g = 0; g < groups_.size(); ++g) {
        for (auto v : groups_[g]) {
            var_groups_[v].push_back(g);
        }
    }

    build_conflicts();

    // 自分自身と重なる変数（同じ presence の区間同士が重なる）は false に固定
    for (size_t v = 0; v < n; ++v) {
        if (std::find(conflicts_[v].begin(), conflicts_[v].end(), v) != conflicts_[v].end()) {
            if (!assign(v, false)) return false;
        }
    }

    for (size_t g = 0; g < groups_.size(); ++g) {
        if (!propagate_group(g)) return false;
    }
    return process_queue();
}

void SearchBackend::build_conflicts() {
    conflicts_.assign(var_names_.size(), {});
    stats_.conflict_pairs = 0;

    std::vector<size_t> order;
    for (const auto& members : no_overlaps_) {
        // 長さ0の区間は除外し、開始時刻順にスイープ
        order.clear();
        for (auto iv : members) {
            if (intervals_[iv].size > 0) {
                order.push_back(iv);
            }
        }
        std::sort(order.begin(), order.end(), [this](size_t a, size_t b) {
            return intervals_[a].start < intervals_[b].start;
        });

        for (size_t i = 0; i < order.size(); ++i) {
            const auto& a = intervals_[order[i]];
            for (size_t j = i + 1; j < order.size(); ++j) {
                const auto& b = intervals_[order[j]];
                if (b.start >= a.end) break;  // [a.start, a.end) と [b.start, b.end) は半開
                size_t va = a.presence.id;
                size_t vb = b.presence.id;
                conflicts_[va].push_back(vb);
                if (va != vb) {
                    conflicts_[vb].push_back(va);
                }
                stats_.conflict_pairs++;
            }
        }
    }
}

SearchBackend::SearchResult SearchBackend::run_search(size_t depth) {
    if (stopped_) {
        return SearchResult::UNKNOWN;
    }
    if (fail_limit_ > 0 && stats_.fails >= fail_limit_) {
        return SearchResult::UNKNOWN;
    }

    if (depth > stats_.max_depth) {
        stats_.max_depth = depth;
    }

    size_t group = select_group();
    if (group == SIZE_MAX) {
        if (!verify_solution()) {
            return SearchResult::UNSAT;
        }
        // どのグループにも属さない未確定変数は false（no-overlap は true だけを禁止する）
        solution_.assign(values_.size(), 0);
        for (size_t v = 0; v < values_.size(); ++v) {
            solution_[v] = (values_[v] == 1) ? 1 : 0;
        }
        has_solution_ = true;
        return SearchResult::SAT;
    }

    // 分岐中に trail が伸びるのでメンバーを先に取り出す
    std::vector<size_t> open;
    for (auto v : groups_[group]) {
        if (values_[v] == UNASSIGNED) open.push_back(v);
    }

    size_t save_point = trail_.size();
    for (auto v : open) {
        stats_.decisions++;

        if (assign(v, true) && process_queue()) {
            auto res = run_search(depth + 1);
            if (res != SearchResult::UNSAT) {
                return res;
            }
        }
        backtrack(save_point);
    }

    // 失敗: Activity 更新
    activity_[group] += 1.0;
    stats_.fails++;
    return SearchResult::UNSAT;
}

size_t SearchBackend::select_group() const {
    size_t best = SIZE_MAX;
    size_t best_open = SIZE_MAX;

    for (size_t g = 0; g < groups_.size(); ++g) {
        size_t open = 0;
        bool satisfied = false;
        for (auto v : groups_[g]) {
            if (values_[v] == 1) {
                satisfied = true;
                break;
            }
            if (values_[v] == UNASSIGNED) open++;
        }
        if (satisfied) continue;

        // ドメインサイズ → Activity
        if (open < best_open ||
            (open == best_open && activity_[g] > activity_[best])) {
            best = g;
            best_open = open;
        }
    }
    return best;
}

bool SearchBackend::assign(size_t var, bool val) {
    int8_t v = val ? 1 : 0;
    if (values_[var] != UNASSIGNED) {
        return values_[var] == v;
    }
    values_[var] = v;
    trail_.push_back(var);
    queue_.push_back(var);
    return true;
}

bool SearchBackend::propagate_group(size_t group) {
    size_t open_count = 0;
    size_t last_open = SIZE_MAX;
    size_t true_count = 0;
    for (auto v : groups_[group]) {
        if (values_[v] == 1) {
            true_count++;
        } else if (values_[v] == UNASSIGNED) {
            open_count++;
            last_open = v;
        }
    }

    if (true_count > 1) return false;
    if (true_count == 1) return true;
    if (open_count == 0) return false;
    if (open_count == 1) return assign(last_open, true);
    return true;
}

bool SearchBackend::process_queue() {
    while (queue_head_ < queue_.size()) {
        size_t var = queue_[queue_head_++];
        stats_.propagations++;

        if (values_[var] == 1) {
            for (auto other : conflicts_[var]) {
                if (!assign(other, false)) return false;
            }
            for (auto g : var_groups_[var]) {
                for (auto other : groups_[g]) {
                    if (other != var && !assign(other, false)) return false;
                }
            }
        } else {
            for (auto g : var_groups_[var]) {
                if (!propagate_group(g)) return false;
            }
        }
    }
    queue_.clear();
    queue_head_ = 0;
    return true;
}

void SearchBackend::backtrack(size_t trail_size) {
    while (trail_.size() > trail_size) {
        values_[trail_.back()] = UNASSIGNED;
        trail_.pop_back();
    }
    // 伝播失敗時はキューに残りがある可能性があるのでクリア
    queue_.clear();
    queue_head_ = 0;
}

bool SearchBackend::verify_solution() const {
    for (const auto& group : groups_) {
        size_t count = 0;
        for (auto v : group) {
            if (values_[v] == 1) count++;
        }
        if (count != 1) return false;
    }

    for (const auto& members : no_overlaps_) {
        for (size_t i = 0; i < members.size(); ++i) {
            const auto& a = intervals_[members[i]];
            if (a.size == 0 || values_[a.presence.id] != 1) continue;
            for (size_t j = i + 1; j < members.size(); ++j) {
                const auto& b = intervals_[members[j]];
                if (b.size == 0 || values_[b.presence.id] != 1) continue;
                if (!(a.end <= b.start || b.end <= a.start)) return false;
            }
        }
    }
    return true;
}

} // namespace stand_alloc
