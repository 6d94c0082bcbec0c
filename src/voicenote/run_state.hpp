#pragma once

#include <optional>
#include <string_view>

enum class RunStatus { Uploaded, Processing, Done, Failed };

std::string_view to_string(RunStatus status);
std::optional<RunStatus> parse_run_status(std::string_view s);

// Status of one processing run. Only the transitions
//   Uploaded -> Processing -> Done | Failed
// are accepted; anything else is refused and leaves the state unchanged.
class RunState {
public:
    RunState() = default;
    explicit RunState(RunStatus initial) : status_(initial) {}

    bool begin();
    bool complete();
    bool fail();

    RunStatus status() const { return status_; }
    bool is_terminal() const {
        return status_ == RunStatus::Done || status_ == RunStatus::Failed;
    }

private:
    bool transition(RunStatus from, RunStatus to);

    RunStatus status_ = RunStatus::Uploaded;
};
