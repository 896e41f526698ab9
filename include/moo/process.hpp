#pragma once

#include <moo/result.hpp>
#include <functional>
#include <string>
#include <vector>

namespace moo {

enum class OutputChannel { Stdout, Stderr };

// Receives child output as it arrives
using OutputSink = std::function<void(OutputChannel channel, const std::string& chunk)>;

struct ProcessResult {
    int exit_code = -1;
    bool success() const { return exit_code == 0; }
};

// Exit code reported when the program could not be started
inline constexpr int kExecFailedExitCode = 127;

// Run an external program, forwarding its output to `sink` (discarded when
// empty). Returns an error on pipe/fork failure or timeout; a program that
// runs and fails is an ok result with a non-zero exit code.
Result<ProcessResult> run_process(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  const OutputSink& sink,
                                  int timeout_seconds = 300);

} // namespace moo
