#include <pill_match/barcode.hpp>
#include <pill_match/internal/normalization.hpp>

namespace pill_match {

std::optional<ScoredCandidate> find_by_external_code(
    std::string_view code, const std::vector<Record>& candidates) {
    const std::string wanted = normalization::trim(code);
    if (wanted.empty()) {
        return std::nullopt;
    }

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        const std::string* candidate_code = candidates[i].external_code();
        if (candidate_code && normalization::trim(*candidate_code) == wanted) {
            return ScoredCandidate{.record = &candidates[i], .score = 1.0, .index = i};
        }
    }
    return std::nullopt;
}

std::optional<ScoredCandidate> barcode_shortcut(
    const QuerySignals& signals, const std::vector<Record>& candidates) {
    if (!signals.external_code) {
        return std::nullopt;
    }
    return find_by_external_code(*signals.external_code, candidates);
}

}  // namespace pill_match
