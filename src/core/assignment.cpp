/**
 * @file assignment.cpp
 * @brief 割当変数ビルダーの実装
 */
#include "stand_alloc/assignment.hpp"
#include <stdexcept>
#include <string>

namespace stand_alloc {

AssignmentVariables::AssignmentVariables(size_t num_turns, size_t num_stands)
    : intervals_by_stand_(num_stands)
    , presence_by_turn_(num_turns)
    , lookup_(num_turns * num_stands, 0) {}

void AssignmentVariables::add(const AssignmentCandidate& candidate) {
    if (candidate.turn >= num_turns() || candidate.stand >= num_stands()) {
        throw std::out_of_range("assignment candidate outside turn/stand range");
    }
    size_t slot = candidate.turn * num_stands() + candidate.stand;
    if (lookup_[slot] != 0) {
        throw std::logic_error("duplicate assignment candidate");
    }

    candidates_.push_back(candidate);
    lookup_[slot] = candidates_.size();
    intervals_by_stand_[candidate.stand].push_back(candidate.occupancy);
    presence_by_turn_[candidate.turn].push_back(candidate.presence);
}

const std::vector<IntervalVar>& AssignmentVariables::intervals_for_stand(size_t stand) const {
    return intervals_by_stand_.at(stand);
}

const std::vector<BoolVar>& AssignmentVariables::presence_for_turn(size_t turn) const {
    return presence_by_turn_.at(turn);
}

const AssignmentCandidate* AssignmentVariables::find(size_t turn, size_t stand) const {
    if (turn >= num_turns() || stand >= num_stands()) {
        return nullptr;
    }
    size_t idx = lookup_[turn * num_stands() + stand];
    return idx == 0 ? nullptr : &candidates_[idx - 1];
}

std::vector<size_t> AssignmentVariables::unplaceable_turns() const {
    std::vector<size_t> result;
    for (size_t t = 0; t < presence_by_turn_.size(); ++t) {
        if (presence_by_turn_[t].empty()) {
            result.push_back(t);
        }
    }
    return result;
}

AssignmentVariables build_assignment_variables(SolverBackend& backend,
                                               const std::vector<Turn>& turns,
                                               const std::vector<Stand>& stands,
                                               const FeasibilityMatrix& feasibility) {
    validate_feasibility(feasibility, turns.size(), stands.size());

    AssignmentVariables vars(turns.size(), stands.size());
    for (size_t t = 0; t < turns.size(); ++t) {
        const auto& turn = turns[t];
        for (size_t s = 0; s < stands.size(); ++s) {
            if (!feasibility.allowed(t, s)) {
                continue;
            }
            const auto& stand = stands[s];

            AssignmentCandidate candidate;
            candidate.turn = t;
            candidate.stand = s;
            candidate.presence = backend.new_bool_var(turn.key() + "_on_" + stand.stand_id);
            candidate.occupancy = backend.new_optional_interval(
                turn.arrival_time, turn.duration(), turn.departure_time,
                candidate.presence,
                "stand_" + stand.stand_id + "_for_" + turn.key());
            vars.add(candidate);
        }
    }
    return vars;
}

} // namespace stand_alloc
