#include "telexpect/telnet/pagination.h"

#include <algorithm>
#include <utility>

namespace telexpect::telnet {

const std::vector<std::string>& default_pager_markers()
{
    static const std::vector<std::string> markers = {
        "--- more ---",
        "--More--",
        "  --Press any key to continue Ctrl+c to stop-- ",
        "--More ( Press 'Q' to quit )--",
    };
    return markers;
}

PaginationDetector::PaginationDetector(std::vector<std::string> markers)
    : _markers(std::move(markers))
{
    _markers.erase(std::remove_if(_markers.begin(), _markers.end(),
                                  [](const std::string& m) { return m.empty(); }),
                   _markers.end());
}

bool PaginationDetector::completes_marker(std::string_view buffer) const
{
    for (const auto& m : _markers) {
        if (buffer.size() >= m.size() &&
            buffer.compare(buffer.size() - m.size(), m.size(), m) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace telexpect::telnet
