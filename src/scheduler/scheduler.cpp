#include "scheduler.hpp"

std::string to_string(SchedulerState state) {
    switch (state) {
        case SchedulerState::Pending:   return "pending";
        case SchedulerState::Running:   return "running";
        case SchedulerState::Succeeded: return "succeeded";
        case SchedulerState::Failed:    return "failed";
    }
    return "pending";
}
