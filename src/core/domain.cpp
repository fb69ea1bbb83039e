/**
 * @file domain.cpp
 * @brief ドメインモデルの検証処理
 */
#include "stand_alloc/domain.hpp"
#include "stand_alloc/error.hpp"
#include <set>
#include <utility>
#include <stdexcept>

namespace stand_alloc {

std::string Turn::key() const {
    if (turn_seq == 0) {
        return turn_id;
    }
    return turn_id + "#" + std::to_string(turn_seq);
}

const char* to_string(TimeAnchor anchor) {
    switch (anchor) {
        case TimeAnchor::Arrival:   return "ARRIVAL";
        case TimeAnchor::Departure: return "DEPARTURE";
    }
    return "?";
}

// ============================================================================
// TimeWindowDefinition
// ============================================================================

TimeWindowDefinition TimeWindowDefinition::occupancy() {
    return TimeWindowDefinition{TimeAnchor::Arrival, 0, TimeAnchor::Departure, 0};
}

namespace {
std::string format_endpoint(TimeAnchor anchor, Time offset) {
    std::string text = to_string(anchor);
    if (offset >= 0) text += "+";
    return text + std::to_string(offset);
}
}  // namespace

std::string TimeWindowDefinition::to_string() const {
    return format_endpoint(start_anchor, start_offset_minutes) + " .. " +
           format_endpoint(end_anchor, end_offset_minutes);
}

void TimeWindowDefinition::validate(const std::string& context) const {
    if (start_anchor == end_anchor && start_offset_minutes > end_offset_minutes) {
        throw ConfigurationError(
            context + ": time window " + to_string() + " always ends before it starts");
    }
}

// ============================================================================
// FeasibilityMatrix
// ============================================================================

FeasibilityMatrix::FeasibilityMatrix(size_t rows, size_t cols)
    : rows_(rows)
    , cols_(cols)
    , cells_(rows * cols, 1) {}

size_t FeasibilityMatrix::index(size_t turn, size_t stand) const {
    if (turn >= rows_ || stand >= cols_) {
        throw std::out_of_range(
            "feasibility index (" + std::to_string(turn) + ", " + std::to_string(stand) +
            ") outside " + std::to_string(rows_) + "x" + std::to_string(cols_));
    }
    return turn * cols_ + stand;
}

bool FeasibilityMatrix::allowed(size_t turn, size_t stand) const {
    return cells_[index(turn, stand)] != 0;
}

void FeasibilityMatrix::set(size_t turn, size_t stand, bool value) {
    cells_[index(turn, stand)] = value ? 1 : 0;
}

size_t FeasibilityMatrix::feasible_count(size_t turn) const {
    size_t count = 0;
    for (size_t s = 0; s < cols_; ++s) {
        if (allowed(turn, s)) count++;
    }
    return count;
}

// ============================================================================
// 検証
// ============================================================================

void validate_turns(const std::vector<Turn>& turns) {
    std::set<std::pair<std::string, int>> seen;
    for (const auto& turn : turns) {
        if (turn.arrival_time >= turn.departure_time) {
            throw ConfigurationError(
                "turn " + turn.key() + ": arrival " + std::to_string(turn.arrival_time) +
                " is not before departure " + std::to_string(turn.departure_time));
        }
        if (!seen.insert({turn.turn_id, turn.turn_seq}).second) {
            throw ConfigurationError("duplicate turn: " + turn.key());
        }
    }
}

void validate_stands(const std::vector<Stand>& stands) {
    std::set<std::string> seen;
    for (const auto& stand : stands) {
        if (!seen.insert(stand.stand_id).second) {
            throw ConfigurationError("duplicate stand: " + stand.stand_id);
        }
    }
}

void validate_feasibility(const FeasibilityMatrix& feasibility,
                          size_t num_turns, size_t num_stands) {
    if (feasibility.rows() != num_turns || feasibility.cols() != num_stands) {
        throw ConfigurationError(
            "feasibility matrix is " + std::to_string(feasibility.rows()) + "x" +
            std::to_string(feasibility.cols()) + ", expected " +
            std::to_string(num_turns) + "x" + std::to_string(num_stands));
    }
}

void validate_adjacency_rule(const AdjacencyRule& rule,
                             const std::vector<Stand>& stands) {
    auto known = [&stands](const std::string& id) {
        for (const auto& stand : stands) {
            if (stand.stand_id == id) return true;
        }
        return false;
    };

    const std::string context = "adjacency rule " + rule.rule_id + " (" + rule.name + ")";
    if (!known(rule.stand_a)) {
        throw ConfigurationError(context + ": unknown stand " + rule.stand_a);
    }
    if (!known(rule.stand_b)) {
        throw ConfigurationError(context + ": unknown stand " + rule.stand_b);
    }
    if (rule.stand_a == rule.stand_b) {
        throw ConfigurationError(context + ": both sides reference stand " + rule.stand_a);
    }
    rule.time_constraint_a.validate(context + " side a");
    rule.time_constraint_b.validate(context + " side b");
}

// ============================================================================
// Problem
// ============================================================================

std::optional<size_t> Problem::find_stand(const std::string& stand_id) const {
    for (size_t i = 0; i < stands.size(); ++i) {
        if (stands[i].stand_id == stand_id) {
            return i;
        }
    }
    return std::nullopt;
}

void Problem::validate() const {
    validate_turns(turns);
    validate_stands(stands);
    validate_feasibility(feasibility, turns.size(), stands.size());
    for (const auto& rule : adjacency_rules) {
        validate_adjacency_rule(rule, stands);
    }
}

} // namespace stand_alloc
