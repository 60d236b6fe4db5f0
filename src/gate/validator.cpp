/*
 * Command validator implementation - AI-CmdGate
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-cmdgate/gate/validator.hpp>
#include <ai-cmdgate/lex/lexer.hpp>
#include <algorithm>
#include <cctype>

namespace cmdgate {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

static bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isspace(c); });
}

// Nested substitutions deeper than this are refused outright.
static constexpr int kMaxSubstitutionDepth = 8;

static bool collect_words(const std::string& command, std::vector<std::string>& words, int depth) {
    if (depth > kMaxSubstitutionDepth) return false;
    auto ts = Lexer(command).run();
    if (find_invalid(ts)) return false;
    bool expect_cmd = true, want_target = false;
    for (auto &t : ts) {
        if (t.kind == TokenKind::Eof) break;
        for (auto &body : t.substitutions)
            if (!collect_words(body, words, depth + 1)) return false;
        if (want_target) {
            want_target = false;
            if (t.kind == TokenKind::Word) continue;
        }
        switch (t.kind) {
            case TokenKind::Word:
                if (expect_cmd) { words.push_back(t.lexeme); expect_cmd = false; }
                break;
            case TokenKind::Redirect:
                want_target = true;
                break;
            case TokenKind::RedirDup:
                break;
            case TokenKind::RightParen:
                expect_cmd = false;
                break;
            default:
                // An operator where a program name belongs; report the operator itself.
                if (expect_cmd && t.kind != TokenKind::LeftParen && t.kind != TokenKind::Newline)
                    words.push_back(t.lexeme);
                expect_cmd = starts_command(t.kind);
        }
    }
    return true;
}

std::vector<std::string> command_words(const std::string& command, bool* unparseable) {
    std::vector<std::string> words;
    bool ok = collect_words(command, words, 0);
    if (unparseable) *unparseable = !ok;
    if (!ok) words.clear();
    return words;
}

ValidationOutcome validate(const std::string& command, const Policy& policy) {
    if (command.empty() || is_blank(command))
        return Rejection{RejectReason::Empty, ""};

    if (command.size() > policy.max_command_length)
        return Rejection{RejectReason::TooLong, std::to_string(policy.max_command_length)};

    const std::string lowered = to_lower(command);
    for (auto &f : policy.forbidden_substrings) {
        if (f.empty()) continue;
        if (lowered.find(to_lower(f)) != std::string::npos)
            return Rejection{RejectReason::ForbiddenSubstring, f};
    }

    for (auto &p : policy.dangerous_patterns) {
        try {
            if (std::regex_search(lowered, p.re))
                return Rejection{RejectReason::DangerousPattern, p.id};
        } catch (const std::regex_error&) {
            // The engine gave up (complexity/stack); treat as a hit.
            return Rejection{RejectReason::DangerousPattern, p.id};
        }
    }

    bool unparseable = false;
    auto words = command_words(command, &unparseable);
    if (unparseable) return Rejection{RejectReason::Unparseable, "unbalanced quotes or substitution"};
    if (words.empty()) return Rejection{RejectReason::Unparseable, "no program name"};
    for (auto &w : words) {
        if (policy.allowed_commands.count(w) == 0)
            return Rejection{RejectReason::CommandNotAllowlisted, w};
    }
    return Accepted{command};
}

} // namespace cmdgate
