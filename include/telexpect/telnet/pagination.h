#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace telexpect::telnet {

// Markers some consoles print while holding back output until a key is
// pressed. Matched as exact, case-sensitive substrings.
const std::vector<std::string>& default_pager_markers();

class PaginationDetector {
public:
    PaginationDetector()
        : PaginationDetector(default_pager_markers())
    {
    }

    explicit PaginationDetector(std::vector<std::string> markers);

    // Call after each byte appended to buffer. True when that byte
    // completes a marker, so every marker occurrence fires exactly once.
    bool completes_marker(std::string_view buffer) const;

    const std::vector<std::string>& markers() const noexcept { return _markers; }

private:
    std::vector<std::string> _markers;
};

} // namespace telexpect::telnet
