#include <catch2/catch.hpp>
#include "stand_alloc/search_backend.hpp"
#include "stand_alloc/error.hpp"
#include <stdexcept>
#include <vector>
#include <string>

using namespace stand_alloc;

// Helper: one bool + one interval gated by it
static IntervalVar task(SearchBackend& b, const std::string& name,
                        Time start, Time end, BoolVar* presence_out = nullptr) {
    auto p = b.new_bool_var(name);
    if (presence_out) *presence_out = p;
    return b.new_optional_interval(start, end - start, end, p, "iv_" + name);
}

// ============================================================================
// Model building
// ============================================================================

TEST_CASE("SearchBackend model building", "[search_backend]") {
    SearchBackend b;
    auto x = b.new_bool_var("x");
    auto y = b.new_bool_var("y");
    auto iv = b.new_optional_interval(10, 5, 15, x, "iv");
    b.add_exactly_one({x, y});
    b.add_no_overlap({iv});

    REQUIRE(b.num_bool_vars() == 2);
    REQUIRE(b.num_intervals() == 1);
    REQUIRE(b.num_constraints() == 2);
    REQUIRE(b.name(y) == "y");
    REQUIRE(b.interval(iv).start == 10);
    REQUIRE(b.interval(iv).end == 15);
    REQUIRE(b.interval(iv).presence == x);
}

TEST_CASE("SearchBackend rejects malformed intervals", "[search_backend]") {
    SearchBackend b;
    auto x = b.new_bool_var("x");

    SECTION("negative size") {
        REQUIRE_THROWS_AS(b.new_optional_interval(10, -5, 5, x, "iv"), ConfigurationError);
    }

    SECTION("end does not match start + size") {
        REQUIRE_THROWS_AS(b.new_optional_interval(10, 5, 16, x, "iv"), ConfigurationError);
    }

    SECTION("unknown presence variable") {
        REQUIRE_THROWS_AS(b.new_optional_interval(10, 5, 15, BoolVar{7}, "iv"),
                          ConfigurationError);
    }

    SECTION("unknown variable in exactly-one") {
        REQUIRE_THROWS_AS(b.add_exactly_one({x, BoolVar{3}}), std::out_of_range);
    }

    SECTION("unknown interval in no-overlap") {
        REQUIRE_THROWS_AS(b.add_no_overlap({IntervalVar{0}}), std::out_of_range);
    }
}

TEST_CASE("SearchBackend value before solve", "[search_backend]") {
    SearchBackend b;
    auto x = b.new_bool_var("x");
    REQUIRE_THROWS_AS(b.value(x), std::logic_error);
}

// ============================================================================
// Exactly-one
// ============================================================================

TEST_CASE("SearchBackend exactly-one", "[search_backend][exactly_one]") {
    SECTION("single member is forced true") {
        SearchBackend b;
        auto x = b.new_bool_var("x");
        b.add_exactly_one({x});
        REQUIRE(b.solve() == SolveStatus::Optimal);
        REQUIRE(b.value(x));
    }

    SECTION("exactly one member is selected") {
        SearchBackend b;
        std::vector<BoolVar> xs;
        for (int i = 0; i < 5; ++i) xs.push_back(b.new_bool_var("x" + std::to_string(i)));
        b.add_exactly_one(xs);
        REQUIRE(b.solve() == SolveStatus::Optimal);
        int count = 0;
        for (auto x : xs) count += b.value(x) ? 1 : 0;
        REQUIRE(count == 1);
    }

    SECTION("empty group is infeasible") {
        SearchBackend b;
        b.new_bool_var("x");
        b.add_exactly_one({});
        REQUIRE(b.solve() == SolveStatus::Infeasible);
        REQUIRE_THROWS_AS(b.value(BoolVar{0}), std::logic_error);
    }

    SECTION("variables outside any group default to false") {
        SearchBackend b;
        auto x = b.new_bool_var("x");
        auto loose = b.new_bool_var("loose");
        b.add_exactly_one({x});
        REQUIRE(b.solve() == SolveStatus::Optimal);
        REQUIRE_FALSE(b.value(loose));
    }
}

// ============================================================================
// No-overlap
// ============================================================================

TEST_CASE("SearchBackend no-overlap", "[search_backend][no_overlap]") {
    SECTION("overlapping present intervals are rejected") {
        SearchBackend b;
        BoolVar p1, p2;
        auto a = task(b, "a", 0, 10, &p1);
        auto c = task(b, "c", 5, 15, &p2);
        b.add_exactly_one({p1});
        b.add_exactly_one({p2});
        b.add_no_overlap({a, c});
        REQUIRE(b.solve() == SolveStatus::Infeasible);
    }

    SECTION("back-to-back intervals do not conflict") {
        SearchBackend b;
        BoolVar p1, p2;
        auto a = task(b, "a", 0, 10, &p1);
        auto c = task(b, "c", 10, 20, &p2);
        b.add_exactly_one({p1});
        b.add_exactly_one({p2});
        b.add_no_overlap({a, c});
        REQUIRE(b.solve() == SolveStatus::Optimal);
        REQUIRE(b.value(p1));
        REQUIRE(b.value(p2));
    }

    SECTION("absent intervals do not conflict") {
        SearchBackend b;
        BoolVar p1, p2;
        auto a = task(b, "a", 0, 10, &p1);
        auto c = task(b, "c", 5, 15, &p2);
        auto other = b.new_bool_var("other");
        b.add_exactly_one({p1});
        b.add_exactly_one({p2, other});
        b.add_no_overlap({a, c});
        REQUIRE(b.solve() == SolveStatus::Optimal);
        REQUIRE(b.value(p1));
        REQUIRE_FALSE(b.value(p2));
        REQUIRE(b.value(other));
    }

    SECTION("zero-length intervals never conflict") {
        SearchBackend b;
        BoolVar p1, p2;
        auto a = task(b, "a", 0, 10, &p1);
        auto c = task(b, "c", 5, 5, &p2);
        b.add_exactly_one({p1});
        b.add_exactly_one({p2});
        b.add_no_overlap({a, c});
        REQUIRE(b.solve() == SolveStatus::Optimal);
    }

    SECTION("two overlapping intervals gated by the same variable") {
        SearchBackend b;
        auto p = b.new_bool_var("p");
        auto q = b.new_bool_var("q");
        auto a = b.new_optional_interval(0, 10, 10, p, "a");
        auto c = b.new_optional_interval(5, 10, 15, p, "c");
        b.add_exactly_one({p, q});
        b.add_no_overlap({a, c});
        REQUIRE(b.solve() == SolveStatus::Optimal);
        REQUIRE_FALSE(b.value(p));
        REQUIRE(b.value(q));
    }

    SECTION("negative timeline") {
        SearchBackend b;
        BoolVar p1, p2;
        auto a = task(b, "a", -30, -10, &p1);
        auto c = task(b, "c", -20, 0, &p2);
        b.add_exactly_one({p1});
        b.add_exactly_one({p2});
        b.add_no_overlap({a, c});
        REQUIRE(b.solve() == SolveStatus::Infeasible);
    }
}

// ============================================================================
// Search
// ============================================================================

// n turns all overlapping [0, 10), m stands, every pair feasible
static std::vector<std::vector<BoolVar>> pigeonhole(SearchBackend& b, int n, int m) {
    std::vector<std::vector<BoolVar>> x(n);
    std::vector<std::vector<IntervalVar>> per_stand(m);
    for (int t = 0; t < n; ++t) {
        for (int s = 0; s < m; ++s) {
            BoolVar p;
            per_stand[s].push_back(task(b, std::to_string(t) + "_on_" + std::to_string(s),
                                        0, 10, &p));
            x[t].push_back(p);
        }
        b.add_exactly_one(x[t]);
    }
    for (int s = 0; s < m; ++s) {
        b.add_no_overlap(per_stand[s]);
    }
    return x;
}

TEST_CASE("SearchBackend pigeonhole", "[search_backend][solver]") {
    SECTION("n turns fit on n stands") {
        SearchBackend b;
        auto x = pigeonhole(b, 4, 4);
        REQUIRE(b.solve() == SolveStatus::Optimal);
        std::vector<int> used(4, 0);
        for (int t = 0; t < 4; ++t) {
            int count = 0;
            for (int s = 0; s < 4; ++s) {
                if (b.value(x[t][s])) {
                    count++;
                    used[s]++;
                }
            }
            REQUIRE(count == 1);
        }
        for (int s = 0; s < 4; ++s) {
            REQUIRE(used[s] == 1);
        }
    }

    SECTION("n + 1 turns do not fit on n stands") {
        SearchBackend b;
        pigeonhole(b, 4, 3);
        REQUIRE(b.solve() == SolveStatus::Infeasible);
        REQUIRE(b.stats().fails > 0);
    }
}

TEST_CASE("SearchBackend stops with unknown", "[search_backend][solver]") {
    SECTION("fail limit") {
        SearchBackend b;
        pigeonhole(b, 4, 3);
        b.set_fail_limit(1);
        REQUIRE(b.solve() == SolveStatus::Unknown);
        REQUIRE_THROWS_AS(b.value(BoolVar{0}), std::logic_error);
    }

    SECTION("stop flag") {
        SearchBackend b;
        pigeonhole(b, 3, 3);
        b.stop();
        REQUIRE(b.is_stopped());
        REQUIRE(b.solve() == SolveStatus::Unknown);

        b.reset_stop();
        REQUIRE(b.solve() == SolveStatus::Optimal);
    }
}

TEST_CASE("SearchBackend solve is repeatable", "[search_backend][solver]") {
    SearchBackend b;
    auto x = pigeonhole(b, 3, 3);
    REQUIRE(b.solve() == SolveStatus::Optimal);
    std::vector<bool> first;
    for (const auto& row : x) for (auto v : row) first.push_back(b.value(v));

    REQUIRE(b.solve() == SolveStatus::Optimal);
    std::vector<bool> second;
    for (const auto& row : x) for (auto v : row) second.push_back(b.value(v));
    REQUIRE(first == second);
}

TEST_CASE("SearchBackend status names", "[search_backend]") {
    REQUIRE(std::string(to_string(SolveStatus::Optimal)) == "OPTIMAL");
    REQUIRE(std::string(to_string(SolveStatus::Feasible)) == "FEASIBLE");
    REQUIRE(std::string(to_string(SolveStatus::Infeasible)) == "INFEASIBLE");
    REQUIRE(std::string(to_string(SolveStatus::Unknown)) == "UNKNOWN");
    REQUIRE(has_solution(SolveStatus::Feasible));
    REQUIRE_FALSE(has_solution(SolveStatus::Unknown));
}
