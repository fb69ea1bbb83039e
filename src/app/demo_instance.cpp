#include "demo_instance.hpp"

namespace stand_alloc {
namespace demo {

namespace {
AdjacencyRule occupancy_rule(const std::string& id, const std::string& a, const std::string& b) {
    AdjacencyRule rule;
    rule.rule_id = id;
    rule.name = a + "_" + b + "_adjacency";
    rule.stand_a = a;
    rule.stand_b = b;
    rule.time_constraint_a = TimeWindowDefinition::occupancy();
    rule.time_constraint_b = TimeWindowDefinition::occupancy();
    return rule;
}
}  // namespace

Problem make_demo_problem() {
    Problem problem;
    problem.turns = {
        {"1", 0, "FR13", 20, 55},
        {"2", 0, "FR42", 10, 35},
        {"3", 0, "FR66", 35, 60},
        {"4", 0, "FR99", 25, 50},
    };
    problem.stands = {{"1L"}, {"1C"}, {"2L"}, {"2C"}, {"2R"}};

    // 静的ルールから事前計算された制限
    problem.feasibility = FeasibilityMatrix(problem.turns.size(), problem.stands.size());
    problem.feasibility.restrict(0, 0);
    problem.feasibility.restrict(1, 0);
    problem.feasibility.restrict(3, 0);
    problem.feasibility.restrict(3, 2);
    problem.feasibility.restrict(3, 4);

    problem.adjacency_rules = {
        occupancy_rule("1", "1L", "1C"),
        occupancy_rule("2", "2L", "2C"),
    };
    return problem;
}

} // namespace demo
} // namespace stand_alloc
