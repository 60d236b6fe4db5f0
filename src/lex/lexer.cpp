/*
 * AI-CmdGate Lexer Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Splits a command line into words, list operators and
 *              redirections, recording command substitution bodies.
 *              See header for details.
 */
#include <cctype>
#include <ai-cmdgate/lex/lexer.hpp>

namespace cmdgate {

static bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

// "(...)" where the first parenthesis closes at the very end.
static bool wrapped_in_parens(const std::string& s) {
    if (s.size() < 2 || s.front()!='(' || s.back()!=')') return false;
    int depth = 0;
    for (std::size_t i=0;i<s.size();++i) {
        if (s[i]=='(') ++depth;
        else if (s[i]==')' && --depth==0) return i+1 == s.size();
    }
    return false;
}

Lexer::Lexer(std::string input) : m_input(std::move(input)) {}

char Lexer::peek(std::size_t ahead) const {
    return m_pos + ahead < m_input.size() ? m_input[m_pos + ahead] : '\0';
}
char Lexer::get() { return eof() ? '\0' : m_input[m_pos++]; }

bool Lexer::is_break(char c) {
    return c=='|'||c=='&'||c==';'||c=='>'||c=='<'||c=='('||c==')';
}

// At a token boundary: digits followed by < or > name a file descriptor.
bool Lexer::at_redirect() const {
    if (peek()=='&' && peek(1)=='>') return true;
    std::size_t i = 0;
    while (is_digit(peek(i))) ++i;
    return peek(i)=='>' || peek(i)=='<';
}

Token Lexer::lex_list_operator() {
    std::size_t start = m_pos;
    char c = get();
    switch (c) {
        case '|':
            if (peek()=='|') { get(); return {TokenKind::OrIf, "||", start}; }
            if (peek()=='&') { get(); return {TokenKind::Pipe, "|&", start}; }
            return {TokenKind::Pipe, "|", start};
        case '&':
            if (peek()=='&') { get(); return {TokenKind::AndIf, "&&", start}; }
            return {TokenKind::Background, "&", start};
        case ';': return {TokenKind::Semi, ";", start};
        case '(': return {TokenKind::LeftParen, "(", start};
        default:  return {TokenKind::RightParen, ")", start};
    }
}

Token Lexer::lex_redirect() {
    std::size_t start = m_pos;
    std::string op;
    if (peek()=='&') {
        op += get(); op += get();
        if (peek()=='>') op += get();
        return {TokenKind::Redirect, op, start};
    }
    while (is_digit(peek())) op += get();
    char c = get(); op += c;
    if (c=='>' && (peek()=='>' || peek()=='|')) { op += get(); return {TokenKind::Redirect, op, start}; }
    if (c=='<' && peek()=='<') {
        op += get();
        if (peek()=='<') op += get();
        return {TokenKind::Redirect, op, start};
    }
    if (c=='<' && peek()=='>') { op += get(); return {TokenKind::Redirect, op, start}; }
    if (peek()=='&') {
        op += get();
        if (is_digit(peek()) || peek()=='-') {
            while (is_digit(peek()) || peek()=='-') op += get();
            return {TokenKind::RedirDup, op, start};
        }
        // `>& file` is the same as `&> file`
    }
    return {TokenKind::Redirect, op, start};
}

// Called with m_pos on "$(". Copies the raw text into `out` and the inner
// text into `body`; false if the closing parenthesis is missing.
bool Lexer::scan_dollar_paren(std::string& out, std::string& body) {
    out += get(); out += get();
    int depth = 1; bool in_single=false, in_double=false;
    while (!eof()) {
        char c = get();
        if (in_single) { if (c=='\'') in_single=false; body += c; continue; }
        if (c=='\\') { body += c; if (!eof()) body += get(); continue; }
        if (in_double) { if (c=='"') in_double=false; body += c; continue; }
        if (c=='\'') in_single=true;
        else if (c=='"') in_double=true;
        else if (c=='(') ++depth;
        else if (c==')' && --depth==0) { out += body; out += ')'; return true; }
        body += c;
    }
    return false;
}

bool Lexer::scan_backtick(std::string& out, std::string& body) {
    out += get();
    while (!eof()) {
        char c = get();
        if (c=='\\' && !eof()) {
            char n = get();
            if (n!='`' && n!='\\' && n!='$') body += '\\';
            body += n;
            continue;
        }
        if (c=='`') { out += body; out += '`'; return true; }
        body += c;
    }
    return false;
}

Token Lexer::lex_word() {
    Token t{TokenKind::Word, "", m_pos, {}};
    bool in_single=false, in_double=false;
    while (!eof()) {
        char c = peek();
        if (in_single) { get(); if (c=='\'') in_single=false; else t.lexeme.push_back(c); continue; }
        if (!in_double && (std::isspace(static_cast<unsigned char>(c)) || is_break(c))) break;
        if (c=='\\') {
            get();
            if (eof()) break;
            char n = get();
            if (n=='\n') continue;
            if (in_double && n!='"' && n!='\\' && n!='$' && n!='`') t.lexeme.push_back('\\');
            t.lexeme.push_back(n);
            continue;
        }
        if (c=='\'' && !in_double) { in_single=true; get(); continue; }
        if (c=='"') { in_double=!in_double; get(); continue; }
        if ((c=='$' && peek(1)=='(') || c=='`') {
            std::string body;
            bool closed = c=='`' ? scan_backtick(t.lexeme, body) : scan_dollar_paren(t.lexeme, body);
            if (!closed) { t.kind = TokenKind::Invalid; return t; }
            // $((...)) is arithmetic; only keep it when something inside can run a command.
            bool arithmetic = c=='$' && wrapped_in_parens(body);
            if (!arithmetic || body.find("$(")!=std::string::npos || body.find('`')!=std::string::npos)
                t.substitutions.push_back(std::move(body));
            continue;
        }
        t.lexeme.push_back(get());
    }
    if (in_single || in_double) t.kind = TokenKind::Invalid;
    return t;
}

Token Lexer::next() {
    while (!eof() && peek()!='\n' && std::isspace(static_cast<unsigned char>(peek()))) get();
    if (eof()) return {TokenKind::Eof, "", m_pos};
    if (peek()=='\n') { std::size_t start = m_pos; get(); return {TokenKind::Newline, "\n", start}; }
    if (at_redirect()) return lex_redirect();
    if (is_break(peek())) return lex_list_operator();
    return lex_word();
}

TokenStream Lexer::run() {
    TokenStream ts;
    while (true) {
        Token t = next();
        t.end = m_pos;
        bool stop = t.kind==TokenKind::Eof || t.kind==TokenKind::Invalid;
        ts.push_back(std::move(t));
        if (stop) break;
    }
    if (ts.back().kind != TokenKind::Eof) ts.push_back({TokenKind::Eof, "", m_pos, {}, m_pos});
    return ts;
}

const Token* find_invalid(const TokenStream& ts) {
    for (auto &t : ts) if (t.kind == TokenKind::Invalid) return &t;
    return nullptr;
}

} // namespace cmdgate
