#include "run_state.hpp"

#include "log.hpp"

std::string_view to_string(RunStatus status) {
    switch (status) {
        case RunStatus::Uploaded: return "uploaded";
        case RunStatus::Processing: return "processing";
        case RunStatus::Done: return "done";
        case RunStatus::Failed: return "failed";
    }
    return "unknown";
}

std::optional<RunStatus> parse_run_status(std::string_view s) {
    if (s == "uploaded") return RunStatus::Uploaded;
    if (s == "processing") return RunStatus::Processing;
    if (s == "done") return RunStatus::Done;
    if (s == "failed") return RunStatus::Failed;
    return std::nullopt;
}

bool RunState::begin() {
    return transition(RunStatus::Uploaded, RunStatus::Processing);
}

bool RunState::complete() {
    return transition(RunStatus::Processing, RunStatus::Done);
}

bool RunState::fail() {
    return transition(RunStatus::Processing, RunStatus::Failed);
}

bool RunState::transition(RunStatus from, RunStatus to) {
    if (status_ != from) {
        logging::error("run", "cannot move to {}, state is {}", to_string(to), to_string(status_));
        return false;
    }
    status_ = to;
    return true;
}
