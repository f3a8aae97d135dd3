// local
#include "header-scanner.hpp"

using namespace rubus;


HeaderScanner::HeaderScanner(std::string_view raw)
: rest_(raw)
{}

std::optional<HeaderLine> HeaderScanner::next() {
    std::size_t end = rest_.find('\n');
    if (end == std::string_view::npos || end == 0) {
        // unterminated tail or blank line closing header
        rest_ = {};
        return std::nullopt;
    }

    std::string_view line = rest_.substr(0, end);
    rest_.remove_prefix(end + 1);

    std::size_t space = line.find(' ');
    if (space == std::string_view::npos) {
        return HeaderLine{.key = line, .value = {}, .wellFormed = false};
    }
    return HeaderLine{.key = line.substr(0, space), .value = line.substr(space + 1), .wellFormed = true};
}
