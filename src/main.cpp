// AI-CmdGate CLI: runs commands through the safety gate and prints results.
#include <ai-cmdgate/exec/runner.hpp>
#include <ai-cmdgate/gate/audit.hpp>
#include <ai-cmdgate/gate/gate.hpp>
#include <ai-cmdgate/plan/json_plan.hpp>
#include <ai-cmdgate/policy/policy.hpp>
#include <ai-cmdgate/policy/policy_loader.hpp>

#include <algorithm>
#include <cctype>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <unistd.h>

namespace {

struct CliOptions {
    std::string policy_path;          // empty: ~/.ai-cmdgaterc if present
    bool policy_required = false;     // --policy given explicitly
    std::string audit_path;           // empty: no audit, "-": stderr
    cmdgate::Origin origin = cmdgate::Origin::UserTyped;
    std::optional<std::string> command; // -c
    std::string plan_path;            // --plan
};

void usage(std::ostream& os) {
    os << "Usage: ai-cmdgate [--policy FILE] [--audit FILE|-] [--origin user|ai]\n"
          "                  [-c COMMAND | --plan FILE]\n"
          "Without -c/--plan, commands are read one per line from stdin.\n"
          "Builtins: policy, reload, help, exit\n";
}

bool parse_args(int argc, char* argv[], CliOptions& o) {
    for (int i=1;i<argc;++i) {
        std::string a = argv[i];
        auto value = [&](std::string& dst) {
            if (i+1 >= argc) { std::cerr << "[gate] missing value for " << a << '\n'; return false; }
            dst = argv[++i]; return true;
        };
        if (a=="--policy") { if (!value(o.policy_path)) return false; o.policy_required = true; }
        else if (a=="--audit") { if (!value(o.audit_path)) return false; }
        else if (a=="-c") { std::string v; if (!value(v)) return false; o.command = v; }
        else if (a=="--plan") { if (!value(o.plan_path)) return false; }
        else if (a=="--origin") {
            std::string v; if (!value(v)) return false;
            if (v=="user") o.origin = cmdgate::Origin::UserTyped;
            else if (v=="ai") o.origin = cmdgate::Origin::AiGenerated;
            else { std::cerr << "[gate] --origin must be user or ai\n"; return false; }
        }
        else if (a=="-h"||a=="--help") { usage(std::cout); std::exit(0); }
        else { std::cerr << "[gate] unknown argument: " << a << '\n'; return false; }
    }
    if (o.command && !o.plan_path.empty()) { std::cerr << "[gate] -c and --plan are exclusive\n"; return false; }
    if (o.policy_path.empty()) o.policy_path = cmdgate::default_policy_path();
    return true;
}

bool load_policy(const CliOptions& o, cmdgate::Policy& out) {
    if (o.policy_path.empty()) { out = cmdgate::default_policy(); return true; }
    auto load = cmdgate::load_policy_file(o.policy_path, o.policy_required);
    if (!load.ok) { std::cerr << "[policy] " << load.error << '\n'; return false; }
    out = std::move(load.policy);
    return true;
}

// Prints captured output and the verdict; returns a shell style status.
int report(const cmdgate::GateResult& r) {
    if (auto rej = cmdgate::rejection(r.validation)) {
        std::cerr << "[gate] rejected: " << cmdgate::describe(*rej) << '\n';
        return 1;
    }
    if (!r.execution) return 1;
    auto &x = *r.execution;
    std::cout << x.stdout_data; std::cout.flush();
    std::cerr << x.stderr_data;
    if (!std::holds_alternative<cmdgate::Exited>(x.status) || cmdgate::shell_status(x.status) != 0)
        std::cerr << "[gate] " << cmdgate::describe(x.status) << '\n';
    return cmdgate::shell_status(x.status);
}

int run_plan(const std::string& path, cmdgate::Gate& gate, const cmdgate::PolicyStore& store) {
    std::ifstream in(path);
    if (!in) { std::cerr << "[plan] cannot open " << path << '\n'; return 1; }
    std::ostringstream oss; oss << in.rdbuf();
    auto parsed = cmdgate::plan::parse_plan_json(oss.str());
    if (!parsed.valid) { std::cerr << "[plan] unparseable plan: " << path << '\n'; return 1; }
    if (parsed.steps.empty()) { std::cerr << "[plan] no steps\n"; return 0; }
    int status = 0;
    for (auto &step : parsed.steps) {
        std::cerr << "[plan] " << step.id << ": " << step.command << '\n';
        auto policy = store.snapshot();
        int st = report(gate.handle({step.command, cmdgate::Origin::AiGenerated}, *policy));
        if (st != 0) std::cerr << "[plan] step " << step.id << " status=" << st << " (continuing)\n";
        status = st;
    }
    return status;
}

std::string trim(const std::string& s) {
    auto notspace = [](int ch){ return !std::isspace(ch); };
    auto b = std::find_if(s.begin(), s.end(), notspace);
    auto e = std::find_if(s.rbegin(), s.rend(), notspace).base();
    return b < e ? std::string(b, e) : std::string();
}

int run_lines(const CliOptions& o, cmdgate::Gate& gate, cmdgate::PolicyStore& store) {
    bool interactive = isatty(STDIN_FILENO);
    int last_status = 0;
    std::string line;
    while (true) {
        if (interactive) { std::cout << "cmdgate> "; std::cout.flush(); }
        if (!std::getline(std::cin, line)) break;
        line = trim(line);
        if (line.empty() || line[0]=='#') continue;
        if (line=="exit") break;
        if (line=="help") { usage(std::cout); continue; }
        if (line=="policy") { std::cout << cmdgate::describe(*store.snapshot()); continue; }
        if (line=="reload") {
            cmdgate::Policy next;
            if (load_policy(o, next)) { store.replace(std::move(next)); std::cerr << "[policy] reloaded\n"; }
            else std::cerr << "[policy] keeping previous policy\n";
            continue;
        }
        auto policy = store.snapshot();
        last_status = report(gate.handle({line, o.origin}, *policy));
    }
    return last_status;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGPIPE, SIG_IGN);
    CliOptions opts;
    if (!parse_args(argc, argv, opts)) { usage(std::cerr); return 2; }

    cmdgate::Policy initial;
    if (!load_policy(opts, initial)) return 2;
    cmdgate::PolicyStore store(std::move(initial));

    std::ofstream audit_file;
    std::unique_ptr<cmdgate::StreamAuditSink> audit;
    if (opts.audit_path == "-") {
        audit = std::make_unique<cmdgate::StreamAuditSink>(std::clog);
    } else if (!opts.audit_path.empty()) {
        audit_file.open(opts.audit_path, std::ios::app);
        if (!audit_file) { std::cerr << "[gate] cannot open audit file " << opts.audit_path << '\n'; return 2; }
        audit = std::make_unique<cmdgate::StreamAuditSink>(audit_file);
    }

    cmdgate::PosixRunner runner;
    cmdgate::Gate gate(runner, audit.get());

    if (opts.command) {
        auto policy = store.snapshot();
        return report(gate.handle({*opts.command, opts.origin}, *policy));
    }
    if (!opts.plan_path.empty()) return run_plan(opts.plan_path, gate, store);
    return run_lines(opts, gate, store);
}
