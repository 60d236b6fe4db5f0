/*
 * Command validator - AI-CmdGate
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Checks run in a fixed order and the first failure wins:
 *   1. empty (after trimming)          -> Empty
 *   2. longer than max_command_length  -> TooLong
 *   3. forbidden literal substring     -> ForbiddenSubstring(match)
 *   4. dangerous regex, in list order  -> DangerousPattern(id)
 *   5. shell word split; open quote or
 *      substitution                    -> Unparseable
 *      program at a command position
 *      missing from the allowlist      -> CommandNotAllowlisted(token)
 *
 * Steps 3 and 4 work on the lower-cased text, independent of tokenization, so
 * they still see fragments chained behind ';', '&&' or '|'. The regex list
 * cannot enumerate every destructive invocation; the allowlist in step 5 is
 * the default-deny layer.
 */
#pragma once
#include <ai-cmdgate/gate/outcome.hpp>
#include <ai-cmdgate/policy/policy.hpp>
#include <string>
#include <vector>

namespace cmdgate {

// Pure and deterministic. Accepted carries the original command unchanged.
ValidationOutcome validate(const std::string& command, const Policy& policy);

// Program names found at command positions: the first word, the first word
// after each of ; && || | & and '(', and the same positions inside $(...) and
// backtick bodies. Redirection targets are skipped. Empty if the line does
// not lex.
std::vector<std::string> command_words(const std::string& command, bool* unparseable = nullptr);

} // namespace cmdgate
