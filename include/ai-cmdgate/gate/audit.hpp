/*
 * Audit trail - AI-CmdGate
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <ai-cmdgate/gate/outcome.hpp>
#include <chrono>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace cmdgate {

struct AuditEntry {
    std::chrono::system_clock::time_point timestamp;
    Origin origin = Origin::UserTyped;
    std::string raw_input;
    ValidationOutcome validation;
    std::optional<std::string> executed_command;   // sanitized form, when run
    std::optional<ExecutionOutcome> execution;
};

// Receives one entry per handled request. The gate does not persist anything itself.
class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void record(const AuditEntry& entry) = 0;
};

// One JSON object per line. Captured output is not written, only its size.
class StreamAuditSink : public AuditSink {
public:
    explicit StreamAuditSink(std::ostream& os) : m_os(os) {}
    void record(const AuditEntry& entry) override;
private:
    std::mutex m_mu;
    std::ostream& m_os;
};

std::string to_json(const AuditEntry& e);

} // namespace cmdgate
