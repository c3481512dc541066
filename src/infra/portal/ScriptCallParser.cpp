#include "infra/portal/ScriptCallParser.hpp"

#include <cctype>

#include "infra/html/HtmlDocument.hpp"

namespace gw::agent::infra::portal {

namespace {

constexpr std::string_view kScheme = "javascript:";

class Cursor {
public:
    explicit Cursor(std::string_view s)
        : s_(s) {
    }

    bool atEnd() const noexcept { return pos_ >= s_.size(); }
    char peek() const noexcept { return atEnd() ? '\0' : s_[pos_]; }
    std::size_t pos() const noexcept { return pos_; }

    void skipSpace() {
        while (!atEnd() && std::isspace(static_cast<unsigned char>(s_[pos_]))) ++pos_;
    }

    bool consume(char c) {
        if (peek() != c) return false;
        ++pos_;
        return true;
    }

    bool consumeIgnoreCase(std::string_view word) {
        if (s_.size() - pos_ < word.size()) return false;
        for (std::size_t i = 0; i < word.size(); ++i) {
            const auto a = std::tolower(static_cast<unsigned char>(s_[pos_ + i]));
            const auto b = std::tolower(static_cast<unsigned char>(word[i]));
            if (a != b) return false;
        }
        pos_ += word.size();
        return true;
    }

    std::string identifier() {
        const std::size_t b = pos_;
        while (!atEnd()) {
            const auto c = static_cast<unsigned char>(s_[pos_]);
            if (std::isalnum(c) || c == '_' || c == '$' || c == '.') {
                ++pos_;
            } else {
                break;
            }
        }
        return std::string(s_.substr(b, pos_ - b));
    }

    // Reads a quoted literal starting at the current quote character.
    bool literal(std::string& out) {
        const char quote = peek();
        if (quote != '\'' && quote != '"') return false;
        ++pos_;
        out.clear();
        while (!atEnd()) {
            const char c = s_[pos_++];
            if (c == '\\' && !atEnd()) {
                out.push_back(s_[pos_++]);
                continue;
            }
            if (c == quote) return true;
            out.push_back(c);
        }
        return false;
    }

private:
    std::string_view s_;
    std::size_t pos_{0};
};

ScriptCallParseResult fail(std::string message, std::size_t at) {
    ScriptCallParseResult r;
    r.ok = false;
    r.error = std::move(message) + " at offset " + std::to_string(at);
    return r;
}

} // namespace

ScriptCallParseResult parseScriptCall(std::string_view href) {
    Cursor c(href);

    c.skipSpace();
    if (!c.consumeIgnoreCase(kScheme)) {
        return fail("expected 'javascript:'", c.pos());
    }

    c.skipSpace();
    ScriptCall call;
    call.functionName = c.identifier();
    if (call.functionName.empty()) {
        return fail("expected function name", c.pos());
    }

    c.skipSpace();
    if (!c.consume('(')) {
        return fail("expected '('", c.pos());
    }

    c.skipSpace();
    if (!c.consume(')')) {
        while (true) {
            std::string arg;
            if (!c.literal(arg)) {
                return fail("expected quoted string argument", c.pos());
            }
            call.arguments.push_back(html::trimText(arg));

            c.skipSpace();
            if (c.consume(')')) break;
            if (!c.consume(',')) {
                return fail("expected ',' or ')'", c.pos());
            }
            c.skipSpace();
        }
    }

    ScriptCallParseResult res;
    res.ok = true;
    res.call = std::move(call);
    return res;
}

} // namespace gw::agent::infra::portal
