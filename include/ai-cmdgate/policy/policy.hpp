/*
 * Command policy - AI-CmdGate
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace cmdgate {

enum class ExecMode {
    Shell,   // /bin/sh -c <command>
    Argv     // lexer words passed straight to execvp, no shell
};

// A regular expression matched against the lower-cased command.
struct DangerousPattern {
    std::string id;          // stable name reported on rejection
    std::string expression;  // ECMAScript source
    std::regex re;
};

// Build a pattern; nullopt if the expression does not compile.
std::optional<DangerousPattern> make_pattern(const std::string& id, const std::string& expression);

// Immutable once built. Share it as std::shared_ptr<const Policy>.
struct Policy {
    std::set<std::string> allowed_commands;          // empty set allows nothing
    std::vector<std::string> forbidden_substrings;   // compared lower-case
    std::vector<DangerousPattern> dangerous_patterns; // checked in order
    std::size_t max_command_length = 500;
    int timeout_seconds = 30;
    ExecMode exec_mode = ExecMode::Shell;
};

// Defaults of the interactive tool: common file/inspection/devops programs
// allowed, destructive programs and power control denied.
Policy default_policy();

// Human readable dump, one setting per line (used by the `policy` builtin).
std::string describe(const Policy& p);

const char* to_string(ExecMode m);

// Why `p` cannot be enforced (non-positive limits, timeout above a day), or
// nullopt when it is usable.
std::optional<std::string> policy_error(const Policy& p);

// Holder for the current policy. Readers take a snapshot and keep using it
// for the whole request; replace() publishes a new policy in one step.
class PolicyStore {
public:
    explicit PolicyStore(Policy initial);
    std::shared_ptr<const Policy> snapshot() const;
    void replace(Policy next);
private:
    mutable std::mutex m_mu;
    std::shared_ptr<const Policy> m_current;
};

} // namespace cmdgate
