/*
 * Command runners - AI-CmdGate
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <ai-cmdgate/gate/outcome.hpp>
#include <ai-cmdgate/policy/policy.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace cmdgate {

// Runs an already sanitized command. Implementations do no validation.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual ExecutionOutcome run(const std::string& command, std::chrono::seconds timeout, ExecMode mode) = 0;
};

struct RunnerOptions {
    std::string shell = "/bin/sh";
    std::size_t max_output_bytes = 8u << 20;  // per stream; excess is read and dropped
};

// fork/exec runner. The child leads its own process group with stdin on
// /dev/null and stdout/stderr on pipes. On timeout the whole group gets
// SIGKILL; once the direct child exits any processes it left in the group
// are killed as well.
class PosixRunner : public CommandRunner {
public:
    PosixRunner() = default;
    explicit PosixRunner(RunnerOptions opts) : m_opts(std::move(opts)) {}
    ExecutionOutcome run(const std::string& command, std::chrono::seconds timeout, ExecMode mode) override;
private:
    RunnerOptions m_opts;
};

// Argument vector for ExecMode::Argv; nullopt (with `error` set) when the
// line contains operators, redirections or does not lex.
std::optional<std::vector<std::string>> split_argv(const std::string& command, std::string* error = nullptr);

} // namespace cmdgate
