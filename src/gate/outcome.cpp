/*
 * Gate outcome helpers - AI-CmdGate
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-cmdgate/gate/outcome.hpp>
#include <type_traits>

namespace cmdgate {

const char* to_string(Origin o) {
    switch (o) {
        case Origin::UserTyped: return "user-typed";
        case Origin::AiGenerated: return "ai-generated";
    }
    return "user-typed";
}

const char* to_string(RejectReason r) {
    switch (r) {
        case RejectReason::Empty: return "empty";
        case RejectReason::TooLong: return "too-long";
        case RejectReason::ForbiddenSubstring: return "forbidden-substring";
        case RejectReason::DangerousPattern: return "dangerous-pattern";
        case RejectReason::CommandNotAllowlisted: return "command-not-allowlisted";
        case RejectReason::Unparseable: return "unparseable";
    }
    return "unparseable";
}

std::string describe(const Rejection& r) {
    switch (r.reason) {
        case RejectReason::Empty: return "empty command";
        case RejectReason::TooLong: return "command too long (max " + r.detail + " characters)";
        case RejectReason::ForbiddenSubstring: return "forbidden command pattern detected: " + r.detail;
        case RejectReason::DangerousPattern: return "dangerous command pattern detected: " + r.detail;
        case RejectReason::CommandNotAllowlisted: return "command '" + r.detail + "' not in allowed list";
        case RejectReason::Unparseable: return "unparseable command: " + r.detail;
    }
    return "rejected";
}

std::string describe(const ExitStatus& s) {
    return std::visit([](auto &v)->std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Exited>) return "exit " + std::to_string(v.code);
        else if constexpr (std::is_same_v<T, TimedOut>) return "timed out";
        else return "failed: " + v.reason;
    }, s);
}

int shell_status(const ExitStatus& s) {
    if (auto e = std::get_if<Exited>(&s)) return e->code;
    if (std::holds_alternative<TimedOut>(s)) return 124;
    return 1;
}

} // namespace cmdgate
