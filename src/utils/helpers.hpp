#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <vector>

template <typename... Ts>
struct Overloaded : Ts... {
	using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

namespace utils {

/**
 * @brief Map the positions of a `..`-split element list onto field indices.
 *
 * For `(a, .., b)` matched against a 5-tuple the written elements sit at
 * positions 0 and 4. Elements before `gap_pos` keep their index, elements after
 * it are shifted by the number of fields the gap stands for.
 */
inline std::vector<std::size_t> enumerate_and_adjust(std::size_t element_count,
                                                     std::size_t expected_len,
                                                     std::optional<std::size_t> gap_pos) {
    std::vector<std::size_t> indices;
    indices.reserve(element_count);
    if (!gap_pos) {
        for (std::size_t i = 0; i < element_count; ++i) {
            indices.push_back(i);
        }
        return indices;
    }
    if (element_count > expected_len) {
        throw std::logic_error("enumerate_and_adjust: more elements than fields");
    }
    const std::size_t gap_len = expected_len - element_count;
    for (std::size_t i = 0; i < element_count; ++i) {
        indices.push_back(i < *gap_pos ? i : i + gap_len);
    }
    return indices;
}

} // namespace utils
