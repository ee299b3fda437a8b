#pragma once

#include <cstddef>
#include <memory>
#include <regex>
#include <string>
#include <string_view>

namespace telexpect::telnet {

// Prompt matched against the end of the command buffer.
//
// Literal prompts are a plain suffix compare. Regex prompts are compiled
// once as "(?:expr)$", so only a match that ends on the last received
// byte counts, and are run over the current line only (the bytes after
// the last newline that precedes the final byte). A default constructed
// pattern is empty and never matches.
class PromptPattern {
public:
    PromptPattern() = default;

    // Prompt given as plain text; regex metacharacters are escaped.
    static PromptPattern literal(std::string_view text);

    // Prompt given as an ECMAScript regular expression.
    // Returns false (and leaves out untouched) when expr does not compile.
    static bool from_regex(std::string_view expr, PromptPattern& out, std::string* error = nullptr);

    bool empty() const noexcept { return !_re && _literal.empty(); }
    bool is_literal() const noexcept { return !_literal.empty(); }

    // Expression as supplied (escaped form for literals), without the anchor.
    const std::string& source() const noexcept { return _source; }

    // window > 0 further limits a regex search to the last `window` bytes.
    bool matches_tail(std::string_view buffer, std::size_t window = 0) const;

private:
    std::string _source;
    std::string _literal;
    std::shared_ptr<const std::regex> _re;
};

std::string escape_regex(std::string_view text);

} // namespace telexpect::telnet
