/*
 * Gate outcome types - AI-CmdGate
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <variant>

namespace cmdgate {

enum class Origin { UserTyped, AiGenerated };

// Raw input as handed to the gate. The origin only feeds the audit trail.
struct CommandRequest {
    std::string command;
    Origin origin = Origin::UserTyped;
};

enum class RejectReason {
    Empty,
    TooLong,
    ForbiddenSubstring,
    DangerousPattern,
    CommandNotAllowlisted,
    Unparseable
};

struct Accepted {
    std::string command;   // original, untransformed input
};

struct Rejection {
    RejectReason reason;
    std::string detail;    // matched substring, pattern id or offending token
};

using ValidationOutcome = std::variant<Accepted, Rejection>;

struct Exited { int code = 0; };
struct TimedOut {};
struct Failed { std::string reason; };   // never ran (spawn/exec/internal)

using ExitStatus = std::variant<Exited, TimedOut, Failed>;

struct ExecutionOutcome {
    std::string stdout_data;
    std::string stderr_data;
    ExitStatus status = Exited{};
    std::chrono::milliseconds duration{0};
};

struct GateResult {
    ValidationOutcome validation;
    std::optional<ExecutionOutcome> execution;   // empty when rejected
};

inline bool is_accepted(const ValidationOutcome& v) { return std::holds_alternative<Accepted>(v); }
inline const Rejection* rejection(const ValidationOutcome& v) { return std::get_if<Rejection>(&v); }

const char* to_string(Origin o);
const char* to_string(RejectReason r);

// "forbidden command pattern detected: dd", "command 'nc' not in allowed list", ...
std::string describe(const Rejection& r);
// "exit 0", "timed out", "failed: <reason>"
std::string describe(const ExitStatus& s);

// Shell style status: exit code, 124 on timeout, 1 on failure.
int shell_status(const ExitStatus& s);

} // namespace cmdgate
