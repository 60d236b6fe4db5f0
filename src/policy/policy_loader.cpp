/*
 * Policy file loader implementation - AI-CmdGate
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-cmdgate/policy/policy_loader.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace cmdgate {

static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }

static std::string lower(std::string s){ std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); }); return s; }

static bool parse_positive(const std::string& val, long& out) {
    try {
        size_t used = 0;
        long v = std::stol(val, &used);
        if (used != val.size() || v <= 0) return false;
        out = v;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

PolicyLoad parse_policy(std::istream& in, Policy base, const std::string& source) {
    PolicyLoad out; out.policy = std::move(base);
    bool seen_allow=false, seen_forbid=false, seen_pattern=false;
    std::string line; size_t lineno=0;
    auto fail=[&](const std::string& msg){ out.ok=false; out.error = source + ":" + std::to_string(lineno) + ": " + msg; return out; };
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0]=='#') continue;
        auto eq = line.find('=');
        if (eq==std::string::npos) return fail("expected key=value");
        std::string key = trim(line.substr(0,eq)); std::string val = trim(line.substr(eq+1));
        if (key=="allow") {
            if (!seen_allow) { out.policy.allowed_commands.clear(); seen_allow=true; }
            std::stringstream ss(val); std::string item;
            while (std::getline(ss, item, ',')) { item = trim(item); if (!item.empty()) out.policy.allowed_commands.insert(item); }
        } else if (key=="forbid") {
            if (!seen_forbid) { out.policy.forbidden_substrings.clear(); seen_forbid=true; }
            if (val.empty()) return fail("empty forbidden substring");
            out.policy.forbidden_substrings.push_back(lower(val));
        } else if (key.rfind("pattern.",0)==0) {
            if (!seen_pattern) { out.policy.dangerous_patterns.clear(); seen_pattern=true; }
            std::string id = key.substr(8);
            auto pat = make_pattern(id, val);
            if (!pat) return fail("invalid pattern '" + id + "'");
            out.policy.dangerous_patterns.push_back(std::move(*pat));
        } else if (key=="max_command_length") {
            long v=0; if (!parse_positive(val, v)) return fail("max_command_length must be a positive integer");
            out.policy.max_command_length = static_cast<size_t>(v);
        } else if (key=="timeout_seconds") {
            long v=0; if (!parse_positive(val, v) || v > 86400) return fail("timeout_seconds must be a positive integer (max 86400)");
            out.policy.timeout_seconds = static_cast<int>(v);
        } else if (key=="exec_mode") {
            if (val=="shell") out.policy.exec_mode = ExecMode::Shell;
            else if (val=="argv") out.policy.exec_mode = ExecMode::Argv;
            else return fail("exec_mode must be shell or argv");
        } else {
            return fail("unknown key '" + key + "'");
        }
    }
    out.ok = true;
    return out;
}

PolicyLoad load_policy_file(const std::string& path, bool required) {
    std::ifstream in(path);
    if (!in) {
        PolicyLoad out; out.policy = default_policy();
        if (required) { out.error = path + ": cannot open policy file"; return out; }
        out.ok = true;
        return out;
    }
    return parse_policy(in, default_policy(), path);
}

std::string default_policy_path() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + "/.ai-cmdgaterc";
}

} // namespace cmdgate
