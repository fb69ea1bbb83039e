#ifndef STAND_ALLOC_TESTS_RECORDING_BACKEND_HPP
#define STAND_ALLOC_TESTS_RECORDING_BACKEND_HPP

#include "stand_alloc/backend.hpp"
#include <vector>
#include <string>
#include <stdexcept>

// Test double that records every model-building call without solving.
// solve() returns a scripted status and value() reads scripted values.
class RecordingBackend : public stand_alloc::SolverBackend {
public:
    struct Interval {
        stand_alloc::Time start;
        stand_alloc::Time size;
        stand_alloc::Time end;
        stand_alloc::BoolVar presence;
        std::string name;
    };

    stand_alloc::BoolVar new_bool_var(const std::string& name) override {
        bool_names.push_back(name);
        return stand_alloc::BoolVar{bool_names.size() - 1};
    }

    stand_alloc::IntervalVar new_optional_interval(stand_alloc::Time start,
                                                   stand_alloc::Time size,
                                                   stand_alloc::Time end,
                                                   stand_alloc::BoolVar presence,
                                                   const std::string& name) override {
        intervals.push_back(Interval{start, size, end, presence, name});
        return stand_alloc::IntervalVar{intervals.size() - 1};
    }

    void add_exactly_one(const std::vector<stand_alloc::BoolVar>& vars) override {
        exactly_ones.push_back(vars);
    }

    void add_no_overlap(const std::vector<stand_alloc::IntervalVar>& ivs) override {
        no_overlaps.push_back(ivs);
    }

    stand_alloc::SolveStatus solve() override {
        solve_calls++;
        return scripted_status;
    }

    bool value(stand_alloc::BoolVar var) const override {
        if (!stand_alloc::has_solution(scripted_status)) {
            throw std::logic_error("no solution available");
        }
        return var.id < scripted_values.size() && scripted_values[var.id];
    }

    const Interval& interval_named(const std::string& name) const {
        for (const auto& iv : intervals) {
            if (iv.name == name) return iv;
        }
        throw std::out_of_range("no interval named " + name);
    }

    bool has_interval(const std::string& name) const {
        for (const auto& iv : intervals) {
            if (iv.name == name) return true;
        }
        return false;
    }

    std::vector<std::string> bool_names;
    std::vector<Interval> intervals;
    std::vector<std::vector<stand_alloc::BoolVar>> exactly_ones;
    std::vector<std::vector<stand_alloc::IntervalVar>> no_overlaps;
    int solve_calls = 0;

    stand_alloc::SolveStatus scripted_status = stand_alloc::SolveStatus::Infeasible;
    std::vector<bool> scripted_values;
};

#endif // STAND_ALLOC_TESTS_RECORDING_BACKEND_HPP
