#ifndef COMMAND_RUNNER_H
#define COMMAND_RUNNER_H

#include <chrono>
#include <string>
#include <vector>

struct CommandResult {
    int exit_status = 0;
    std::string out;
    std::string err;
    bool timed_out = false;

    bool ok() const { return exit_status == 0 && !timed_out; }

    // stderr if the command produced any, else stdout
    std::string diagnostic() const;
};

// Joins an argument vector for log lines. Never executed.
std::string describeCommand(const std::vector<std::string>& argv);

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // argv[0] is the program, looked up on PATH if it has no slash.
    virtual CommandResult run(const std::vector<std::string>& argv) = 0;
};

class SubprocessRunner : public CommandRunner {
public:
    explicit SubprocessRunner(std::chrono::milliseconds timeout);

    CommandResult run(const std::vector<std::string>& argv) override;

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
};

#endif // COMMAND_RUNNER_H
