#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>

std::size_t lev_edit_distance(std::string_view a, std::string_view b) noexcept;

// 1.0 for equal strings, 0.0 when nothing lines up.
double similarity(std::string_view a, std::string_view b) noexcept;

inline constexpr double DYM_MIN_SIMILARITY = 0.6;

// Closest candidate by edit distance, if it is similar enough to be a typo.
template <typename Range>
std::optional<std::string> did_you_mean(std::string_view given, Range&& strings, double min_similarity = DYM_MIN_SIMILARITY) {
    auto cand = std::ranges::min_element(strings, std::less{}, [&](auto&& candidate) {
        return lev_edit_distance(candidate, given);
    });
    if (cand == std::ranges::end(strings) || similarity(*cand, given) < min_similarity) {
        return std::nullopt;
    }
    return std::string(*cand);
}
