#include "dym.hpp"

#include <vector>

std::size_t lev_edit_distance(std::string_view a, std::string_view b) noexcept {
    std::vector<std::size_t> prev(a.size() + 1);
    std::vector<std::size_t> cur(a.size() + 1);
    for (std::size_t col = 0; col <= a.size(); ++col) {
        prev[col] = col;
    }

    for (std::size_t row = 1; row <= b.size(); ++row) {
        cur[0] = row;
        for (std::size_t col = 1; col <= a.size(); ++col) {
            const std::size_t cost = a[col - 1] == b[row - 1] ? 0 : 1;
            cur[col] = std::min({prev[col] + 1, cur[col - 1] + 1, prev[col - 1] + cost});
        }
        std::swap(prev, cur);
    }
    return prev[a.size()];
}

double similarity(std::string_view a, std::string_view b) noexcept {
    const std::size_t longest = std::max(a.size(), b.size());
    if (longest == 0) return 1.0;
    return 1.0 - static_cast<double>(lev_edit_distance(a, b)) / static_cast<double>(longest);
}
