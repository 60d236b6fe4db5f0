/*
 * Command sanitizer implementation - AI-CmdGate
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-cmdgate/gate/sanitizer.hpp>
#include <ai-cmdgate/lex/lexer.hpp>
#include <cctype>
#include <utility>
#include <vector>

namespace cmdgate {

static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }

// Lexically resolve "." and ".." and repeated slashes of an absolute path.
static std::string normalize(const std::string& path) {
    std::vector<std::string> parts;
    size_t i = 0;
    while (i < path.size()) {
        size_t j = path.find('/', i);
        if (j == std::string::npos) j = path.size();
        std::string part = path.substr(i, j-i);
        if (part == "..") { if (!parts.empty()) parts.pop_back(); }
        else if (!part.empty() && part != ".") parts.push_back(part);
        i = j + 1;
    }
    std::string out;
    for (auto &p : parts) out += "/" + p;
    return out.empty() ? "/" : out;
}

bool is_protected_path(const std::string& target) {
    if (target.empty() || target[0] != '/') return false;
    std::string p = normalize(target);
    for (const char* dir : {"/dev", "/etc", "/var", "/usr"}) {
        std::string d = dir;
        if (p == d || p.rfind(d + "/", 0) == 0) return true;
    }
    return false;
}

// Output redirections open their target for writing; `<` and here-docs do not.
static bool writes_target(const Token& t) {
    return t.kind == TokenKind::Redirect && t.lexeme.find('>') != std::string::npos;
}

static bool ends_pipeline_segment(TokenKind k) {
    return k == TokenKind::Eof || (starts_command(k) && k != TokenKind::LeftParen) || k == TokenKind::RightParen;
}

// Source spans [from, to) to erase in one pass over the tokens.
static std::vector<std::pair<size_t, size_t>> protected_spans(const TokenStream& ts) {
    std::vector<std::pair<size_t, size_t>> spans;
    for (size_t i=0;i+1<ts.size();++i) {
        const Token& t = ts[i];
        if (writes_target(t) && ts[i+1].kind == TokenKind::Word && is_protected_path(ts[i+1].lexeme)) {
            spans.emplace_back(t.pos, ts[i+1].end);
            ++i;
            continue;
        }
        if (t.kind == TokenKind::Pipe && ts[i+1].kind == TokenKind::Word) {
            // `| /etc/x` or `| tee [opts] files...` with a protected file
            if (is_protected_path(ts[i+1].lexeme)) { spans.emplace_back(t.pos, ts[i+1].end); ++i; continue; }
            if (ts[i+1].lexeme != "tee") continue;
            size_t j = i + 2; bool hit = false;
            for (; !ends_pipeline_segment(ts[j].kind); ++j) {
                if (ts[j].kind == TokenKind::Word && is_protected_path(ts[j].lexeme)) hit = true;
                if (writes_target(ts[j]) && ts[j+1].kind == TokenKind::Word && is_protected_path(ts[j+1].lexeme)) hit = true;
            }
            if (hit) { spans.emplace_back(t.pos, ts[j-1].end); i = j - 1; }
        }
    }
    return spans;
}

std::string sanitize(const std::string& command) {
    std::string cur = command;
    // Removing one fragment can expose another, so run to a fixed point.
    while (true) {
        auto ts = Lexer(cur).run();
        if (find_invalid(ts)) break;
        auto spans = protected_spans(ts);
        if (spans.empty()) break;
        for (auto it = spans.rbegin(); it != spans.rend(); ++it) {
            size_t from = it->first;
            while (from > 0 && std::isspace((unsigned char)cur[from-1]) && cur[from-1] != '\n') --from;
            cur.erase(from, it->second - from);
        }
    }
    return trim(cur);
}

} // namespace cmdgate
