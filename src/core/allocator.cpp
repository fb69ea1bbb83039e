#include "stand_alloc/allocator.hpp"
#include "stand_alloc/assignment.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace stand_alloc {

const char* to_string(AllocationStatus status) {
    switch (status) {
        case AllocationStatus::Optimal:         return "OPTIMAL";
        case AllocationStatus::Feasible:        return "FEASIBLE";
        case AllocationStatus::Infeasible:      return "INFEASIBLE";
        case AllocationStatus::Unknown:         return "UNKNOWN";
        case AllocationStatus::NoFeasibleStand: return "NO_FEASIBLE_STAND";
    }
    return "UNKNOWN";
}

namespace {
AllocationStatus from_solve_status(SolveStatus status) {
    switch (status) {
        case SolveStatus::Optimal:    return AllocationStatus::Optimal;
        case SolveStatus::Feasible:   return AllocationStatus::Feasible;
        case SolveStatus::Infeasible: return AllocationStatus::Infeasible;
        case SolveStatus::Unknown:    return AllocationStatus::Unknown;
    }
    return AllocationStatus::Unknown;
}
}  // namespace

StandAllocator::StandAllocator(Problem problem)
    : problem_(std::move(problem)) {}

AllocationResult StandAllocator::solve(SolverBackend& backend) const {
    problem_.validate();

    AllocationResult result;
    result.stand_of_turn.assign(problem_.turns.size(), std::nullopt);

    auto vars = build_assignment_variables(backend, problem_.turns, problem_.stands,
                                           problem_.feasibility);
    if (verbose_) {
        std::cerr << "% [verbose] " << vars.candidates().size() << " candidates for "
                  << problem_.turns.size() << " turns on " << problem_.stands.size()
                  << " stands\n";
    }

    result.unplaceable_turns = vars.unplaceable_turns();
    if (!result.unplaceable_turns.empty()) {
        if (verbose_) {
            for (auto t : result.unplaceable_turns) {
                std::cerr << "% [verbose] turn " << problem_.turns[t].key()
                          << " has no feasible stand\n";
            }
        }
        result.status = AllocationStatus::NoFeasibleStand;
        return result;
    }

    add_core_constraints(backend, vars);
    result.adjacency_stats = add_adjacency_constraints(
        backend, problem_.turns, problem_.stands, vars, problem_.adjacency_rules);
    if (verbose_) {
        std::cerr << "% [verbose] adjacency: " << result.adjacency_stats.active_rules
                  << " active rules, " << result.adjacency_stats.inactive_rules
                  << " inactive, " << result.adjacency_stats.shadow_intervals
                  << " shadow intervals\n";
    }

    auto status = backend.solve();
    result.status = from_solve_status(status);
    if (verbose_) {
        std::cerr << "% [verbose] solver status: " << to_string(status) << "\n";
    }
    if (!has_solution(status)) {
        return result;
    }

    for (const auto& candidate : vars.candidates()) {
        if (!backend.value(candidate.presence)) {
            continue;
        }
        if (result.stand_of_turn[candidate.turn]) {
            throw std::logic_error("solver selected two stands for turn " +
                                   problem_.turns[candidate.turn].key());
        }
        result.stand_of_turn[candidate.turn] = candidate.stand;
    }
    for (size_t t = 0; t < result.stand_of_turn.size(); ++t) {
        if (!result.stand_of_turn[t]) {
            throw std::logic_error("solver left turn " + problem_.turns[t].key() +
                                   " unassigned");
        }
    }
    return result;
}

} // namespace stand_alloc
