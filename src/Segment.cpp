/**
 * @file Segment.cpp
 * @brief Type-suffix extraction, index resolution and segment classification
 */

#include "treepath/Segment.hpp"
#include "treepath/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace treepath {

namespace {

bool all_digits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

} // anonymous namespace

std::pair<std::optional<TypeFilter>, std::string> extract_type_suffix(std::string_view token,
                                                                      char escape) {
    for (std::size_t width : {std::size_t{2}, std::size_t{1}}) {
        if (token.size() < width) {
            return {std::nullopt, std::string(token)};
        }

        const auto filter = filter_from_suffix(token.substr(token.size() - width));
        if (!filter) {
            continue;
        }

        if (token.size() == width) {
            return {filter, std::string()};
        }

        // Count the escape run right before the suffix
        std::size_t escapes = 0;
        for (std::size_t pos = token.size() - width; pos > 0 && token[pos - 1] == escape; --pos) {
            ++escapes;
        }

        if (escapes % 2 == 0) {
            return {filter, std::string(token.substr(0, token.size() - width))};
        }
        return {std::nullopt, std::string(token)};
    }

    return {std::nullopt, std::string(token)};
}

long long resolve_index(std::string_view token) {
    if (token.empty() || token.front() != kIndexMarker) {
        throw SyntaxError(std::string(token), "Array index must start from @ symbol");
    }

    const std::string_view ref = token.substr(1);
    if (ref == "last") {
        return -1;
    }
    if (ref == "first") {
        return 0;
    }

    const bool negative = !ref.empty() && ref.front() == '-';
    if (!all_digits(negative ? ref.substr(1) : ref)) {
        throw SyntaxError(std::string(ref), "Unknown index reference");
    }

    long long value = 0;
    const auto [ptr, ec] = std::from_chars(ref.data(), ref.data() + ref.size(), value);
    if (ec != std::errc() || ptr != ref.data() + ref.size()) {
        throw SyntaxError(std::string(ref), "Unknown index reference");
    }
    return value;
}

std::optional<std::size_t> normalize_index(long long index, std::size_t size) noexcept {
    const auto signed_size = static_cast<long long>(size);
    if (index < 0) {
        index += signed_size;
    }
    if (index < 0 || index >= signed_size) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(index);
}

Segment classify_segment(std::string_view token) {
    Segment seg;

    if (token == kWildcard) {
        seg.kind = Segment::Kind::Wildcard;
        return seg;
    }

    auto [filter, cleaned] = extract_type_suffix(token);
    seg.filter = filter;

    if (!token.empty() && token.front() == kIndexMarker) {
        seg.kind = Segment::Kind::Index;
        seg.index = resolve_index(cleaned);
    } else {
        seg.kind = Segment::Kind::Key;
        seg.name = unescape(cleaned);
    }
    return seg;
}

} // namespace treepath
