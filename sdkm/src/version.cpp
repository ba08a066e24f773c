#include "version.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace {
    struct Component {
        std::uint64_t value = 0;
        bool is_letter = false;
    };

    Component component_at(const Revision& r, size_t i) {
        if (i < r.numbers.size()) return {r.numbers[i], false};
        if (i == r.numbers.size() && r.letter) return {*r.letter, true};
        return {};
    }

    size_t component_count(const Revision& r) {
        return r.numbers.size() + (r.letter ? 1 : 0);
    }

    bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
    bool is_alpha(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }
}

std::string Revision::str() const {
    std::string out;
    for (size_t i = 0; i < numbers.size(); ++i) {
        if (i) out += '.';
        out += std::to_string(numbers[i]);
    }
    if (letter) out += static_cast<char>('a' + *letter);
    return out;
}

Revision parse_revision(std::string_view text) {
    size_t pos = 0;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;

    Revision rev;
    auto take_letter = [&](size_t at) {
        // Only a single trailing letter counts, "25b" but not "25beta"
        if (at < text.size() && is_alpha(text[at]) && (at + 1 == text.size() || !is_alpha(text[at + 1]))) {
            rev.letter = static_cast<std::uint32_t>(std::tolower(static_cast<unsigned char>(text[at])) - 'a');
        }
    };

    if (pos < text.size() && !is_digit(text[pos])) {
        take_letter(pos);
        if (!rev.letter) {
            throw MalformedVersion(string_format("error.malformed_version", std::string(text)));
        }
        return rev;
    }

    while (pos < text.size() && is_digit(text[pos])) {
        std::uint64_t value = 0;
        while (pos < text.size() && is_digit(text[pos])) {
            const std::uint64_t digit = static_cast<std::uint64_t>(text[pos] - '0');
            if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
                throw MalformedVersion(string_format("error.malformed_version", std::string(text)));
            }
            value = value * 10 + digit;
            ++pos;
        }
        rev.numbers.push_back(value);

        if (pos + 1 < text.size() && text[pos] == '.' && is_digit(text[pos + 1])) {
            ++pos;
            continue;
        }
        take_letter(pos);
        break;
    }

    if (rev.is_lowest()) {
        throw MalformedVersion(string_format("error.malformed_version", std::string(text)));
    }
    return rev;
}

Revision parse_revision_or_lowest(std::string_view text) {
    try {
        return parse_revision(text);
    } catch (const MalformedVersion&) {
        return Revision{};
    }
}

std::strong_ordering compare(const Revision& a, const Revision& b) {
    if (a.is_lowest() || b.is_lowest()) {
        return !a.is_lowest() <=> !b.is_lowest();
    }

    const size_t len = std::max(component_count(a), component_count(b));
    for (size_t i = 0; i < len; ++i) {
        const Component ca = component_at(a, i);
        const Component cb = component_at(b, i);
        if (ca.value != cb.value) return ca.value <=> cb.value;
        if (ca.is_letter != cb.is_letter) return ca.is_letter <=> cb.is_letter;
    }
    return std::strong_ordering::equal;
}

bool is_numeric_dotted(std::string_view text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) { return is_digit(c) || c == '.'; });
}
