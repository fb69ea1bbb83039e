/**
 * @file assembler.cpp
 * @brief コア制約・隣接制約の組み立て
 */
#include "stand_alloc/assembler.hpp"
#include "stand_alloc/shadow.hpp"
#include <string>

namespace stand_alloc {

void add_core_constraints(SolverBackend& backend, const AssignmentVariables& vars) {
    for (size_t t = 0; t < vars.num_turns(); ++t) {
        backend.add_exactly_one(vars.presence_for_turn(t));
    }

    for (size_t s = 0; s < vars.num_stands(); ++s) {
        const auto& intervals = vars.intervals_for_stand(s);
        if (!intervals.empty()) {
            backend.add_no_overlap(intervals);
        }
    }
}

namespace {

struct PendingShadow {
    const AssignmentCandidate* candidate;
    ShadowInterval interval;
};

}  // namespace

AdjacencyStats add_adjacency_constraints(SolverBackend& backend,
                                         const std::vector<Turn>& turns,
                                         const std::vector<Stand>& stands,
                                         const AssignmentVariables& vars,
                                         const std::vector<AdjacencyRule>& rules) {
    for (const auto& rule : rules) {
        validate_adjacency_rule(rule, stands);
    }

    // Phase 1: 全ルールのシャドウ区間を計算（設定エラーはここで送出され、
    // バックエンドには何も登録されない）
    std::vector<std::vector<PendingShadow>> pending(rules.size());
    for (size_t r = 0; r < rules.size(); ++r) {
        const auto& rule = rules[r];
        for (const auto& candidate : vars.candidates()) {
            const auto& stand_id = stands[candidate.stand].stand_id;
            const TimeWindowDefinition* window = nullptr;
            if (stand_id == rule.stand_a) {
                window = &rule.time_constraint_a;
            } else if (stand_id == rule.stand_b) {
                window = &rule.time_constraint_b;
            } else {
                continue;
            }
            pending[r].push_back({&candidate,
                                  compute_shadow_interval(turns[candidate.turn], *window)});
        }
    }

    // Phase 2: ルールごとに no-overlap を登録
    AdjacencyStats stats;
    for (size_t r = 0; r < rules.size(); ++r) {
        if (pending[r].empty()) {
            stats.inactive_rules++;
            continue;
        }

        std::vector<IntervalVar> shadows;
        shadows.reserve(pending[r].size());
        for (const auto& p : pending[r]) {
            const auto& shadow = p.interval;
            shadows.push_back(backend.new_optional_interval(
                shadow.start, shadow.size(), shadow.end, p.candidate->presence,
                "Shadow_" + rules[r].name + "_" + turns[p.candidate->turn].key() + "_" +
                stands[p.candidate->stand].stand_id));
        }
        stats.shadow_intervals += shadows.size();
        stats.active_rules++;
        backend.add_no_overlap(shadows);
    }

    return stats;
}

} // namespace stand_alloc
