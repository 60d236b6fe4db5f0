/*
 * Command policy implementation - AI-CmdGate
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-cmdgate/policy/policy.hpp>
#include <sstream>

namespace cmdgate {

std::optional<DangerousPattern> make_pattern(const std::string& id, const std::string& expression) {
    if (id.empty() || expression.empty()) return std::nullopt;
    try {
        return DangerousPattern{id, expression, std::regex(expression, std::regex::ECMAScript)};
    } catch (const std::regex_error&) {
        return std::nullopt;
    }
}

Policy default_policy() {
    Policy p;
    p.allowed_commands = {
        "ls", "pwd", "cd", "cat", "head", "tail", "grep", "find",
        "mkdir", "rmdir", "cp", "mv", "rm", "chmod", "chown",
        "ps", "top", "df", "du", "tar", "zip", "unzip",
        "git", "docker", "kubectl", "aws", "terraform"
    };
    p.forbidden_substrings = {
        "rm -rf /", "dd", "mkfs", "fdisk", "format",
        "shutdown", "reboot", "init", "killall", "pkill"
    };
    static const std::pair<const char*, const char*> builtin_patterns[] = {
        {"rm-rf-root",      R"(rm\s+-rf\s+/)"},
        {"dd-to-device",    R"(dd\s+if=.*\s+of=/dev/)"},
        {"mkfs",            R"(mkfs\s+.*)"},
        {"fdisk",           R"(fdisk\s+.*)"},
        {"shutdown",        R"(shutdown\s+.*)"},
        {"reboot",          R"(reboot\s+.*)"},
        {"killall",         R"(killall\s+.*)"},
        {"pkill",           R"(pkill\s+.*)"},
        {"redirect-to-dev", R"(>\s*/dev/)"},
        {"append-to-dev",   R"(>>\s*/dev/)"},
        {"tee-to-dev",      R"(\|\s*tee\s+/dev/)"},
    };
    for (auto &bp : builtin_patterns) {
        // Compiled-in expressions are known good.
        p.dangerous_patterns.push_back(*make_pattern(bp.first, bp.second));
    }
    p.max_command_length = 500;
    p.timeout_seconds = 30;
    p.exec_mode = ExecMode::Shell;
    return p;
}

const char* to_string(ExecMode m) {
    switch (m) {
        case ExecMode::Shell: return "shell";
        case ExecMode::Argv: return "argv";
    }
    return "shell";
}

std::optional<std::string> policy_error(const Policy& p) {
    if (p.max_command_length == 0) return std::string("max_command_length must be positive");
    if (p.timeout_seconds <= 0) return std::string("timeout_seconds must be positive");
    if (p.timeout_seconds > 86400) return std::string("timeout_seconds must not exceed 86400");
    return std::nullopt;
}

std::string describe(const Policy& p) {
    std::ostringstream os;
    os << "allowed_commands:";
    for (auto &c : p.allowed_commands) os << ' ' << c;
    os << "\nforbidden_substrings:";
    for (auto &f : p.forbidden_substrings) os << " \"" << f << '"';
    os << "\ndangerous_patterns:\n";
    for (auto &d : p.dangerous_patterns) os << "  " << d.id << " = " << d.expression << '\n';
    os << "max_command_length: " << p.max_command_length << '\n';
    os << "timeout_seconds: " << p.timeout_seconds << '\n';
    os << "exec_mode: " << to_string(p.exec_mode) << '\n';
    return os.str();
}

PolicyStore::PolicyStore(Policy initial)
    : m_current(std::make_shared<const Policy>(std::move(initial))) {}

std::shared_ptr<const Policy> PolicyStore::snapshot() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_current;
}

void PolicyStore::replace(Policy next) {
    auto fresh = std::make_shared<const Policy>(std::move(next));
    std::lock_guard<std::mutex> lk(m_mu);
    m_current = std::move(fresh);
}

} // namespace cmdgate
