/*
 * Policy file loader - AI-CmdGate
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * File format (one setting per line, '#' starts a comment line):
 *
 *   allow=ls,pwd,cat          comma separated program names
 *   forbid=rm -rf /           one literal substring per line
 *   pattern.raw-disk=dd\s+of= one regex per line, id after the dot
 *   max_command_length=500
 *   timeout_seconds=30
 *   exec_mode=shell|argv
 *
 * The first allow/forbid/pattern line of a file replaces the corresponding
 * default list, following lines append to it.
 */
#pragma once
#include <ai-cmdgate/policy/policy.hpp>
#include <istream>
#include <string>

namespace cmdgate {

struct PolicyLoad {
    Policy policy;
    bool ok = false;
    std::string error;   // "<source>:<line>: message" when !ok
};

// Parse settings from `in` on top of `base`.
PolicyLoad parse_policy(std::istream& in, Policy base, const std::string& source = "<policy>");

// Load `path` on top of default_policy(). A missing file is an error only
// when `required` is set.
PolicyLoad load_policy_file(const std::string& path, bool required);

// $HOME/.ai-cmdgaterc, or empty when HOME is unset.
std::string default_policy_path();

} // namespace cmdgate
