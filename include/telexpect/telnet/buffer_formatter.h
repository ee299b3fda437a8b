#pragma once

#include <string>
#include <string_view>

namespace telexpect::telnet {

// Render a settled command buffer for the caller:
// - "\n\r", "\r\n", "\n", "\r" all become "\n"
// - with strip_prompt, the last line (normally the prompt) is dropped
// - leading/trailing whitespace is trimmed
std::string format_buffer(std::string_view buffer, bool strip_prompt);

// Line ending normalization alone.
std::string normalize_line_endings(std::string_view text);

} // namespace telexpect::telnet
