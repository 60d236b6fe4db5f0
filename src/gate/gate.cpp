/*
 * Command gate implementation - AI-CmdGate
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-cmdgate/gate/gate.hpp>
#include <ai-cmdgate/gate/sanitizer.hpp>
#include <ai-cmdgate/gate/validator.hpp>
#include <exception>

namespace cmdgate {

ExecutionOutcome Gate::execute(const std::string& command, const Policy& policy) {
    try {
        return m_runner.run(command, std::chrono::seconds(policy.timeout_seconds), policy.exec_mode);
    } catch (const std::exception& ex) {
        ExecutionOutcome out;
        out.status = Failed{std::string("runner error: ") + ex.what()};
        return out;
    }
}

GateResult Gate::handle(const CommandRequest& request, const Policy& policy) {
    AuditEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.origin = request.origin;
    entry.raw_input = request.command;

    GateResult result{Rejection{RejectReason::Unparseable, ""}, std::nullopt};
    try {
        result.validation = validate(request.command, policy);
    } catch (const std::exception& ex) {
        result.validation = Rejection{RejectReason::Unparseable, std::string("internal error: ") + ex.what()};
    }

    auto acc = std::get_if<Accepted>(&result.validation);
    auto bad_policy = policy_error(policy);
    if (acc && bad_policy) {
        // Accepted text, but the limits it would run under are unusable.
        ExecutionOutcome out;
        out.status = Failed{"invalid policy: " + *bad_policy};
        result.execution = std::move(out);
    } else if (acc) {
        std::string sanitized;
        bool sanitized_ok = true;
        try {
            sanitized = sanitize(acc->command);
        } catch (const std::exception& ex) {
            sanitized_ok = false;
            ExecutionOutcome out;
            out.status = Failed{std::string("sanitizer error: ") + ex.what()};
            result.execution = std::move(out);
        }
        if (sanitized_ok && sanitized.empty()) {
            // Everything was a redirect to a protected path; there is nothing left to run.
            ExecutionOutcome out;
            out.status = Failed{"nothing left to run after sanitization"};
            result.execution = std::move(out);
        } else if (sanitized_ok) {
            entry.executed_command = sanitized;
            result.execution = execute(sanitized, policy);
        }
    }

    if (m_audit) {
        entry.validation = result.validation;
        entry.execution = result.execution;
        m_audit->record(entry);
    }
    return result;
}

} // namespace cmdgate
