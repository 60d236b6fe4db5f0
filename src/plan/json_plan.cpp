#include <ai-cmdgate/plan/json_plan.hpp>
#include <cctype>

namespace cmdgate::plan {

static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }

namespace {

// Just enough JSON for plan objects: strings are decoded, every other value is skipped.
class Scanner {
public:
    explicit Scanner(const std::string& s) : m_s(s) {}

    bool parse_plan(ParsedPlan& out) {
        return object([&](const std::string& key){
            if (key == "request") return str(out.request);
            if (key == "steps") return steps(out.steps);
            return skip_value();
        });
    }

private:
    // Counts open objects/arrays for the lifetime of one nested value.
    struct Nesting {
        explicit Nesting(int& depth) : m_depth(++depth) {}
        ~Nesting() { --m_depth; }
        bool too_deep() const { return m_depth > kMaxDepth; }
        int& m_depth;
    };

    template <class OnKey>
    bool object(OnKey on_key) {
        Nesting nest(m_depth);
        if (nest.too_deep()) return false;
        ws(); if (!eat('{')) return false;
        ws(); if (eat('}')) return true;
        while (true) {
            std::string key; ws();
            if (!str(key)) return false;
            ws(); if (!eat(':')) return false;
            ws(); if (!on_key(key)) return false;
            ws(); if (eat(',')) continue;
            return eat('}');
        }
    }

    bool steps(std::vector<ParsedStep>& out) {
        Nesting nest(m_depth);
        ws(); if (!eat('[')) return false;
        ws(); if (eat(']')) return true;
        int idx = 1;
        while (true) {
            ParsedStep st; ws();
            bool ok = object([&](const std::string& key){
                if (key == "id") return str(st.id);
                if (key == "description") return str(st.description);
                if (key == "command") return str(st.command);
                return skip_value();
            });
            if (!ok) return false;
            if (st.id.empty()) st.id = "s" + std::to_string(idx);
            ++idx;
            if (!trim(st.command).empty()) out.push_back(st);
            ws(); if (eat(',')) continue;
            return eat(']');
        }
    }

    bool str(std::string& out) {
        if (!eat('"')) return false;
        out.clear();
        while (m_pos < m_s.size()) {
            char c = m_s[m_pos++];
            if (c == '"') return true;
            if (c != '\\') { out.push_back(c); continue; }
            if (m_pos >= m_s.size()) return false;
            char e = m_s[m_pos++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': if (!unicode(out)) return false; break;
                default: return false;
            }
        }
        return false;
    }

    // \uXXXX to UTF-8; surrogate pairs are not combined.
    bool unicode(std::string& out) {
        if (m_pos + 4 > m_s.size()) return false;
        unsigned cp = 0;
        for (int i=0;i<4;++i) {
            char h = m_s[m_pos++]; cp <<= 4;
            if (h>='0'&&h<='9') cp |= h-'0';
            else if (h>='a'&&h<='f') cp |= h-'a'+10;
            else if (h>='A'&&h<='F') cp |= h-'A'+10;
            else return false;
        }
        if (cp < 0x80) out.push_back(static_cast<char>(cp));
        else if (cp < 0x800) { out.push_back(static_cast<char>(0xC0 | (cp>>6))); out.push_back(static_cast<char>(0x80 | (cp&0x3F))); }
        else { out.push_back(static_cast<char>(0xE0 | (cp>>12))); out.push_back(static_cast<char>(0x80 | ((cp>>6)&0x3F))); out.push_back(static_cast<char>(0x80 | (cp&0x3F))); }
        return true;
    }

    bool skip_value() {
        ws();
        if (m_pos >= m_s.size()) return false;
        char c = m_s[m_pos];
        if (c == '"') { std::string tmp; return str(tmp); }
        if (c == '{') return object([&](const std::string&){ return skip_value(); });
        if (c == '[') {
            Nesting nest(m_depth);
            if (nest.too_deep()) return false;
            ++m_pos; ws(); if (eat(']')) return true;
            while (true) { if (!skip_value()) return false; ws(); if (eat(',')) continue; return eat(']'); }
        }
        // number, true, false, null
        size_t start = m_pos;
        while (m_pos < m_s.size() && (std::isalnum((unsigned char)m_s[m_pos]) || m_s[m_pos]=='-' || m_s[m_pos]=='+' || m_s[m_pos]=='.')) ++m_pos;
        return m_pos > start;
    }

    void ws() { while (m_pos < m_s.size() && std::isspace((unsigned char)m_s[m_pos])) ++m_pos; }
    bool eat(char c) { if (m_pos < m_s.size() && m_s[m_pos] == c) { ++m_pos; return true; } return false; }

    static constexpr int kMaxDepth = 64;

    const std::string& m_s;
    size_t m_pos = 0;
    int m_depth = 0;
};

} // namespace

std::string strip_code_fence(const std::string& text) {
    std::string t = trim(text);
    if (t.rfind("```",0) != 0) return t;
    size_t body = t.find('\n');
    if (body == std::string::npos) return t;
    size_t close = t.rfind("```");
    if (close == std::string::npos || close <= body) return trim(t.substr(body+1));
    return trim(t.substr(body+1, close-body-1));
}

ParsedPlan parse_plan_json(const std::string& input) {
    ParsedPlan out;
    std::string json = strip_code_fence(input);
    // isolate outer braces
    size_t a=json.find('{'); size_t b=json.find_last_of('}');
    if (a==std::string::npos || b==std::string::npos || b<=a) return out;
    json = json.substr(a, b-a+1);
    Scanner sc(json);
    if (!sc.parse_plan(out)) { out.steps.clear(); return out; }
    out.valid = true; // syntactically parsed even with zero steps
    return out;
}

}
