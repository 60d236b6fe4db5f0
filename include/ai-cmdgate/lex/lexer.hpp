/*
 * AI-CmdGate Lexer Module
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Splits a command line the way /bin/sh would before running it, without
 *   expanding anything. Quotes and backslashes are removed from words, list
 *   and pipe operators become separate tokens, and redirections keep their
 *   file descriptor prefix (2>, 2>&1, &>). Command substitutions ($(...) and
 *   backticks) stay in the word text and their bodies are also recorded on
 *   the token so callers can inspect the nested commands.
 *
 *   A quote or substitution still open at end of input produces an Invalid
 *   token; the gate refuses such lines rather than guess where a word ends.
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
#include "ai-cmdgate/parse/tokens.hpp"

namespace cmdgate {

class Lexer {
public:
    explicit Lexer(std::string input);
    TokenStream run();
private:
    Token next();
    Token lex_list_operator();
    Token lex_redirect();
    Token lex_word();
    bool scan_dollar_paren(std::string& out, std::string& body);
    bool scan_backtick(std::string& out, std::string& body);
    bool at_redirect() const;
    static bool is_break(char c);

    char peek(std::size_t ahead = 0) const;
    char get();
    bool eof() const { return m_pos >= m_input.size(); }

    std::string m_input;
    std::size_t m_pos = 0;
};

// First Invalid token of the stream, if any.
const Token* find_invalid(const TokenStream& ts);

} // namespace cmdgate
