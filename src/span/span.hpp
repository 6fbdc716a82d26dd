#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <ostream>

namespace span {

using FileId = uint32_t;
constexpr FileId kInvalidFileId = std::numeric_limits<FileId>::max();

struct Span {
    FileId file = kInvalidFileId;
    uint32_t start = 0;
    uint32_t end = 0;

    constexpr bool is_valid() const { return file != kInvalidFileId; }
    constexpr uint32_t length() const { return end >= start ? end - start : 0; }

    static constexpr Span invalid() { return {}; }

    static constexpr Span merge(const Span &lhs, const Span &rhs) {
        if (!lhs.is_valid()) return rhs;
        if (!rhs.is_valid()) return lhs;
        if (lhs.file != rhs.file) return rhs;
        return {lhs.file, std::min(lhs.start, rhs.start), std::max(lhs.end, rhs.end)};
    }

    constexpr bool contains(const Span &other) const {
        return is_valid() && other.is_valid() && file == other.file &&
               start <= other.start && other.end <= end;
    }

    // Returns this span if it lies inside `outer`, nullopt otherwise.
    constexpr std::optional<Span> find_ancestor_inside(const Span &outer) const {
        if (outer.contains(*this)) {
            return *this;
        }
        return std::nullopt;
    }

    constexpr Span with_end(uint32_t new_end) const { return {file, start, new_end}; }

    constexpr bool operator==(const Span &other) const = default;
};

inline std::ostream &operator<<(std::ostream &os, const Span &sp) {
    if (!sp.is_valid()) {
        return os << "<no span>";
    }
    return os << sp.file << ":" << sp.start << ".." << sp.end;
}

} // namespace span
