#include <pill_match/internal/matching.hpp>
#include <pill_match/internal/normalization.hpp>

#include <rapidfuzz/fuzz.hpp>

#include <algorithm>
#include <vector>

namespace pill_match {
namespace matching {

std::size_t edit_distance(std::u32string_view a, std::u32string_view b) {
    if (a.empty()) return b.size();
    if (b.empty()) return a.size();

    const std::size_t rows = a.size() + 1;
    const std::size_t cols = b.size() + 1;

    // Full (rows x cols) table, row-major
    std::vector<std::size_t> dist(rows * cols, 0);
    auto at = [cols, &dist](std::size_t i, std::size_t j) -> std::size_t& {
        return dist[i * cols + j];
    };

    for (std::size_t i = 0; i < rows; ++i) at(i, 0) = i;
    for (std::size_t j = 0; j < cols; ++j) at(0, j) = j;

    for (std::size_t i = 1; i < rows; ++i) {
        for (std::size_t j = 1; j < cols; ++j) {
            if (a[i - 1] == b[j - 1]) {
                at(i, j) = at(i - 1, j - 1);
            } else {
                at(i, j) = 1 + std::min({at(i - 1, j),       // deletion
                                         at(i, j - 1),       // insertion
                                         at(i - 1, j - 1)});  // substitution
            }
        }
    }

    return at(rows - 1, cols - 1);
}

std::size_t edit_distance(std::string_view a, std::string_view b) {
    if (a == b) return 0;
    const std::u32string ca = normalization::to_code_points(a);
    const std::u32string cb = normalization::to_code_points(b);
    return edit_distance(std::u32string_view(ca), std::u32string_view(cb));
}

bool within_distance(std::string_view a, std::string_view b, std::size_t max_distance) {
    const std::u32string ca = normalization::to_code_points(a);
    const std::u32string cb = normalization::to_code_points(b);

    // Length difference is a lower bound on the distance
    const std::size_t diff = ca.size() > cb.size() ? ca.size() - cb.size() : cb.size() - ca.size();
    if (diff > max_distance) return false;

    return edit_distance(std::u32string_view(ca), std::u32string_view(cb)) <= max_distance;
}

bool is_partial_match(std::string_view a, std::string_view b) {
    if (a.empty() || b.empty()) return false;
    return a.find(b) != std::string_view::npos || b.find(a) != std::string_view::npos;
}

double similarity(std::string_view a, std::string_view b) {
    if (a.empty() && b.empty()) return 1.0;
    // rapidfuzz returns 0-100, normalize to 0-1
    return rapidfuzz::fuzz::ratio(a, b) / 100.0;
}

}  // namespace matching
}  // namespace pill_match
