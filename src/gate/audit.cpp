/*
 * Audit trail implementation - AI-CmdGate
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-cmdgate/gate/audit.hpp>
#include <cstdio>
#include <ctime>
#include <type_traits>

namespace cmdgate {

static std::string escape(const std::string& s) {
    std::string out; out.reserve(s.size()+2);
    for (unsigned char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) { char buf[8]; std::snprintf(buf, sizeof buf, "\\u%04x", c); out += buf; }
                else out += static_cast<char>(c);
        }
    }
    return out;
}

static std::string iso_time(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof buf, "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::string to_json(const AuditEntry& e) {
    std::string out = "{";
    out += "\"timestamp\":\"" + iso_time(e.timestamp) + "\"";
    out += ",\"origin\":\""; out += to_string(e.origin); out += "\"";
    out += ",\"input\":\"" + escape(e.raw_input) + "\"";
    if (auto r = rejection(e.validation)) {
        out += ",\"validation\":\"rejected\",\"reason\":\""; out += to_string(r->reason); out += "\"";
        out += ",\"detail\":\"" + escape(r->detail) + "\"";
    } else {
        out += ",\"validation\":\"accepted\"";
    }
    if (e.executed_command) out += ",\"executed\":\"" + escape(*e.executed_command) + "\"";
    if (e.execution) {
        auto &x = *e.execution;
        out += std::visit([](auto &v)->std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Exited>) return ",\"result\":\"exited\",\"exit_code\":" + std::to_string(v.code);
            else if constexpr (std::is_same_v<T, TimedOut>) return ",\"result\":\"timed-out\"";
            else return ",\"result\":\"failed\",\"error\":\"" + escape(v.reason) + "\"";
        }, x.status);
        out += ",\"duration_ms\":" + std::to_string(x.duration.count());
        out += ",\"stdout_bytes\":" + std::to_string(x.stdout_data.size());
        out += ",\"stderr_bytes\":" + std::to_string(x.stderr_data.size());
    }
    out += "}";
    return out;
}

void StreamAuditSink::record(const AuditEntry& entry) {
    std::string line = to_json(entry);
    std::lock_guard<std::mutex> lk(m_mu);
    m_os << line << '\n';
    m_os.flush();
}

} // namespace cmdgate
