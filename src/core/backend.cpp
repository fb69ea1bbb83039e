#include "stand_alloc/backend.hpp"

namespace stand_alloc {

const char* to_string(SolveStatus status) {
    switch (status) {
        case SolveStatus::Optimal:    return "OPTIMAL";
        case SolveStatus::Feasible:   return "FEASIBLE";
        case SolveStatus::Infeasible: return "INFEASIBLE";
        case SolveStatus::Unknown:    return "UNKNOWN";
    }
    return "UNKNOWN";
}

} // namespace stand_alloc
