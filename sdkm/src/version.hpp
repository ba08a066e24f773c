#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Ordered version value parsed from strings such as "30.0.3" or "25b".
// A revision with no components is the lowest possible value.
struct Revision {
    std::vector<std::uint64_t> numbers;
    std::optional<std::uint32_t> letter; // 'a' == 0, follows the last number

    bool is_lowest() const { return numbers.empty() && !letter; }
    std::string str() const;
};

// Throws MalformedVersion when text holds no recognizable component.
Revision parse_revision(std::string_view text);
Revision parse_revision_or_lowest(std::string_view text);

// Component-wise with zero padding; at equal values a letter component sorts
// after a numeric one, so "25" < "25b" < "26".
std::strong_ordering compare(const Revision& a, const Revision& b);

inline std::strong_ordering operator<=>(const Revision& a, const Revision& b) { return compare(a, b); }
inline bool operator==(const Revision& a, const Revision& b) { return compare(a, b) == 0; }

// True when text is made only of digits and dots, e.g. "8.0".
bool is_numeric_dotted(std::string_view text);
