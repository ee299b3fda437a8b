#include "telexpect/telnet/prompt_pattern.h"

#include <cstring>

namespace telexpect::telnet {

std::string escape_regex(std::string_view text)
{
    static constexpr const char* META = "\\^$.|?*+()[]{}";

    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        if (c != '\0' && std::strchr(META, c) != nullptr) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

PromptPattern PromptPattern::literal(std::string_view text)
{
    PromptPattern p;
    if (text.empty()) {
        return p;
    }
    p._source = escape_regex(text);
    p._literal.assign(text.data(), text.size());
    return p;
}

bool PromptPattern::from_regex(std::string_view expr, PromptPattern& out, std::string* error)
{
    if (expr.empty()) {
        out = PromptPattern{};
        return true;
    }

    std::string anchored;
    anchored.reserve(expr.size() + 6);
    anchored.append("(?:");
    anchored.append(expr.data(), expr.size());
    anchored.append(")$");

    try {
        auto re = std::make_shared<const std::regex>(anchored, std::regex::ECMAScript);
        out._source.assign(expr.data(), expr.size());
        out._literal.clear();
        out._re = std::move(re);
    } catch (const std::regex_error& ex) {
        if (error) {
            *error = ex.what();
        }
        return false;
    }
    return true;
}

bool PromptPattern::matches_tail(std::string_view buffer, std::size_t window) const
{
    if (!_literal.empty()) {
        return buffer.size() >= _literal.size() &&
               buffer.compare(buffer.size() - _literal.size(), _literal.size(), _literal) == 0;
    }
    if (!_re || buffer.empty()) {
        return false;
    }

    std::size_t start = 0;
    if (window > 0 && buffer.size() > window) {
        start = buffer.size() - window;
    }

    // Current line: a trailing newline belongs to it, earlier ones do not.
    for (std::size_t i = buffer.size() - 1; i > start; --i) {
        if (buffer[i - 1] == '\n') {
            start = i;
            break;
        }
    }

    // Starting mid-buffer, let ^ and \b see the byte before the start.
    const auto flags = (start > 0) ? std::regex_constants::match_prev_avail
                                   : std::regex_constants::match_default;
    const char* first = buffer.data() + start;
    const char* last = buffer.data() + buffer.size();
    return std::regex_search(first, last, *_re, flags);
}

} // namespace telexpect::telnet
