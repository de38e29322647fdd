#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace link_scope {

struct CommandResult {
    bool started = false; // false if the process could not be spawned
    bool timed_out = false;
    int exit_code = -1; // -1 when the child did not exit normally
    std::string output; // captured stdout
    bool ok() const { return started && !timed_out && exit_code == 0; }
};

// Runs an external program without a shell. Implementations must be safe to
// call from several threads at once.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual CommandResult run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) const = 0;
};

// fork/execvp based runner; stderr goes to /dev/null, stdout is captured
// (capped at 1 MiB). A child still running at the deadline is killed.
class ProcessRunner : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) const override;
};

}
