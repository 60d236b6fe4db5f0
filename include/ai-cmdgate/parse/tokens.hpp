/*
 * AI-CmdGate Token Definitions
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Token kinds produced by the command lexer. The validator walks them to find
 *   every place the shell would start a program: the first word of the line,
 *   the first word after a list or pipe operator, and the bodies of command
 *   substitutions recorded on each word. The argv runner reuses the Word
 *   tokens as an argument vector.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace cmdgate {

enum class TokenKind {
    Word,
    AndIf,       // &&
    OrIf,        // ||
    Pipe,        // | or |&
    Semi,        // ;
    Newline,     // unquoted line break, a command separator like ;
    Background,  // &
    LeftParen,
    RightParen,
    Redirect,    // >, >>, <, <<, <<<, >|, &>, &>>, N> ... followed by a target word
    RedirDup,    // N>&M, >&-, <&N: no target word
    Eof,
    Invalid      // unterminated quote or substitution
};

struct Token {
    TokenKind kind;
    std::string lexeme;   // quotes removed for words, raw text for operators
    std::size_t pos;
    std::vector<std::string> substitutions; // bodies of $(...) and `...` inside a word
    std::size_t end = 0;  // one past the last input character of the token
};

using TokenStream = std::vector<Token>;

// True for operators after which the next word is a program name.
inline bool starts_command(TokenKind k) {
    switch (k) {
        case TokenKind::AndIf:
        case TokenKind::OrIf:
        case TokenKind::Pipe:
        case TokenKind::Semi:
        case TokenKind::Newline:
        case TokenKind::Background:
        case TokenKind::LeftParen:
            return true;
        default:
            return false;
    }
}

inline bool is_redirection(TokenKind k) { return k == TokenKind::Redirect || k == TokenKind::RedirDup; }

} // namespace cmdgate
