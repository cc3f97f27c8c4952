/**
 * Subprocess.hpp - Spawn child processes and capture their output
 *
 * Children are started with fork/execvp (no shell), stdout and stderr are
 * captured through pipes and capped at a fixed size.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace lh {

// 1 MiB cap per captured stream
constexpr size_t MAX_CAPTURE_BYTES = 1024 * 1024;

struct ProcessResult {
    bool started = false;        // false if the child could not be spawned or was cut off
    int exit_code = -1;          // -1 when the child did not exit normally
    std::string stdout_text;
    std::string stderr_text;
    std::string error;           // set when started == false

    bool exitedWith(int code) const { return started && exit_code == code; }
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Runs argv[0] with the given arguments, writes `input` to its stdin.
    virtual ProcessResult run(const std::vector<std::string>& argv,
                              const std::string& input = "",
                              size_t max_output = MAX_CAPTURE_BYTES) = 0;
};

class SubprocessRunner : public CommandRunner {
public:
    ProcessResult run(const std::vector<std::string>& argv,
                      const std::string& input = "",
                      size_t max_output = MAX_CAPTURE_BYTES) override;
};

// Human-readable argv for logs: [a, b, c]
std::string formatArgv(const std::vector<std::string>& argv);

} // namespace lh
