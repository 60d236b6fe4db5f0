/*
 * Command sanitizer - AI-CmdGate
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace cmdgate {

// Erase output redirections, pipes and `| tee` segments whose target lies
// under /dev/, /etc/, /var/ or /usr/, together with the target word, then trim.
// Targets are compared after quote removal and lexical `.`/`..` resolution;
// relative paths and targets built from expansions are left alone. Only meant
// for commands the validator already accepted; it narrows what an accepted
// command can touch and is not a substitute for rejection.
// sanitize(sanitize(x)) == sanitize(x).
std::string sanitize(const std::string& command);

// Absolute path that resolves into /dev, /etc, /var or /usr.
bool is_protected_path(const std::string& target);

} // namespace cmdgate
