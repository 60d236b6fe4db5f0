/*
 * Command gate - AI-CmdGate
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * validate -> sanitize -> run, one request at a time. The gate keeps no
 * state between calls; the runner and the audit sink are supplied by the
 * caller and the policy is passed in per request, so concurrent handle()
 * calls need no locking here.
 */
#pragma once
#include <ai-cmdgate/exec/runner.hpp>
#include <ai-cmdgate/gate/audit.hpp>
#include <ai-cmdgate/gate/outcome.hpp>
#include <ai-cmdgate/policy/policy.hpp>

namespace cmdgate {

class Gate {
public:
    explicit Gate(CommandRunner& runner, AuditSink* audit = nullptr) : m_runner(runner), m_audit(audit) {}

    // Rejected requests never reach the runner and come back without an
    // execution outcome. Nothing is retried.
    GateResult handle(const CommandRequest& request, const Policy& policy);

private:
    ExecutionOutcome execute(const std::string& command, const Policy& policy);

    CommandRunner& m_runner;
    AuditSink* m_audit;
};

} // namespace cmdgate
