#include "stand_alloc/allocator.hpp"
#include "stand_alloc/search_backend.hpp"
#include "demo_instance.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>
#include <atomic>
#include <unistd.h>

std::atomic<bool> g_timeout_flag{false};
stand_alloc::SearchBackend* g_current_backend = nullptr;

void timeout_handler(int) {
    g_timeout_flag = true;
    if (g_current_backend) {
        g_current_backend->stop();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-s] [-v] [-t SEC] [-f LIMIT]\n";
    std::cerr << "  -s        Print search statistics to stderr\n";
    std::cerr << "  -v        Verbose mode (print model building and search progress)\n";
    std::cerr << "  -t SEC    Timeout in seconds\n";
    std::cerr << "  -f LIMIT  Stop the search after LIMIT failures\n";
}

bool g_print_stats = false;
bool g_verbose = false;

void print_stats(const stand_alloc::SearchBackend& backend) {
    if (!g_print_stats) return;
    const auto& s = backend.stats();
    std::cerr << "% Stats: decisions=" << s.decisions
              << " fails=" << s.fails
              << " max_depth=" << s.max_depth
              << " propagations=" << s.propagations
              << " conflict_pairs=" << s.conflict_pairs
              << "\n";
}

void print_result(const stand_alloc::AllocationResult& result,
                  const stand_alloc::Problem& problem) {
    using stand_alloc::AllocationStatus;

    if (result.has_solution()) {
        std::cout << "Solution Found!\n";
        for (size_t t = 0; t < problem.turns.size(); ++t) {
            const auto& turn = problem.turns[t];
            const auto& stand = problem.stands[*result.stand_of_turn[t]];
            std::cout << "  Turn " << turn.key() << " (Flight " << turn.flight_id
                      << ") assigned to -> Stand " << stand.stand_id << "\n";
        }
    } else if (result.status == AllocationStatus::Infeasible) {
        std::cout << "No solution found. The model is infeasible.\n";
    } else if (result.status == AllocationStatus::NoFeasibleStand) {
        std::cout << "No solution found. Turns without a feasible stand:";
        for (auto t : result.unplaceable_turns) {
            std::cout << " " << problem.turns[t].key();
        }
        std::cout << "\n";
    } else {
        std::cout << "Solver status: " << stand_alloc::to_string(result.status) << "\n";
    }
}

int main(int argc, char* argv[]) {
    int timeout_sec = 0;
    long fail_limit = 0;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            g_verbose = true;
        } else if (std::strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            timeout_sec = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "-f") == 0 && i + 1 < argc) {
            fail_limit = std::atol(argv[++i]);
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (timeout_sec < 0 || fail_limit < 0) {
        print_usage(argv[0]);
        return 1;
    }

    // Setup timeout
    if (timeout_sec > 0) {
        std::signal(SIGALRM, timeout_handler);
        alarm(timeout_sec);
    }

    try {
        stand_alloc::StandAllocator allocator(stand_alloc::demo::make_demo_problem());
        allocator.set_verbose(g_verbose);

        stand_alloc::SearchBackend backend;
        backend.set_verbose(g_verbose);
        backend.set_fail_limit(static_cast<size_t>(fail_limit));
        g_current_backend = &backend;

        auto result = allocator.solve(backend);
        g_current_backend = nullptr;

        print_stats(backend);
        print_result(result, allocator.problem());
    } catch (const std::exception& e) {
        g_current_backend = nullptr;
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
