#include <pill_match/internal/matching.hpp>
#include <pill_match/internal/normalization.hpp>
#include <pill_match/scorer.hpp>

#include <algorithm>

namespace pill_match {

namespace {

// Hits per tier; the weighted sum is independent of query term order
struct TierCounts {
    std::size_t exact = 0;
    std::size_t partial = 0;
    std::size_t fuzzy = 0;

    void add(MatchTier tier) {
        switch (tier) {
        case MatchTier::Exact:
            ++exact;
            break;
        case MatchTier::Partial:
            ++partial;
            break;
        case MatchTier::Fuzzy:
            ++fuzzy;
            break;
        case MatchTier::None:
            break;
        }
    }

    [[nodiscard]] double mean(const TierWeights& weights, std::size_t term_count) const {
        const double total = static_cast<double>(exact) * weights.exact +
                             static_cast<double>(partial) * weights.partial +
                             static_cast<double>(fuzzy) * weights.fuzzy;
        return std::clamp(total / static_cast<double>(term_count), 0.0, 1.0);
    }
};

}  // namespace

std::string to_string(MatchTier tier) {
    switch (tier) {
    case MatchTier::Exact:
        return "exact";
    case MatchTier::Partial:
        return "partial";
    case MatchTier::Fuzzy:
        return "fuzzy";
    case MatchTier::None:
        return "none";
    }
    return "unknown";
}

MatchTier classify_term(
    std::string_view query,
    const TermSet& record_terms,
    const MatchConfig& config,
    std::string* matched_term) {
    auto found = [matched_term](const std::string& term, MatchTier tier) {
        if (matched_term) *matched_term = term;
        return tier;
    };

    for (const auto& term : record_terms) {
        if (term == query) return found(term, MatchTier::Exact);
    }

    for (const auto& term : record_terms) {
        if (matching::is_partial_match(query, term)) return found(term, MatchTier::Partial);
    }

    for (const auto& term : record_terms) {
        // Blank terms never match fuzzily
        if (term.empty()) continue;
        if (matching::within_distance(query, term, config.max_edit_distance)) {
            return found(term, MatchTier::Fuzzy);
        }
    }

    if (matched_term) matched_term->clear();
    return MatchTier::None;
}

double tier_weight(MatchTier tier, const TierWeights& weights) {
    switch (tier) {
    case MatchTier::Exact:
        return weights.exact;
    case MatchTier::Partial:
        return weights.partial;
    case MatchTier::Fuzzy:
        return weights.fuzzy;
    case MatchTier::None:
        return 0.0;
    }
    return 0.0;
}

double score_normalized(
    const QueryTerms& normalized_terms, const TermSet& record_terms, const MatchConfig& config) {
    if (normalized_terms.empty()) {
        return 0.0;
    }

    TierCounts counts;
    for (const auto& term : normalized_terms) {
        counts.add(classify_term(term, record_terms, config));
    }
    return counts.mean(config.weights, normalized_terms.size());
}

double score(const QueryTerms& query_terms, const TermSet& record_terms, const MatchConfig& config) {
    return score_normalized(normalization::normalize_terms(query_terms), record_terms, config);
}

double score(const QueryTerms& query_terms, const Record& record, const MatchConfig& config) {
    return score(query_terms, extract_terms(record), config);
}

ScoreBreakdown score_breakdown(
    const QueryTerms& query_terms, const TermSet& record_terms, const MatchConfig& config) {
    ScoreBreakdown breakdown;
    const auto terms = normalization::normalize_terms(query_terms);
    if (terms.empty()) {
        return breakdown;
    }

    TierCounts counts;
    for (const auto& term : terms) {
        TermMatch match;
        match.query_term = term;
        match.tier = classify_term(term, record_terms, config, &match.matched_term);
        match.contribution = tier_weight(match.tier, config.weights);
        if (match.tier != MatchTier::None) {
            match.similarity = matching::similarity(term, match.matched_term);
        }
        counts.add(match.tier);
        breakdown.terms.push_back(std::move(match));
    }

    breakdown.score = counts.mean(config.weights, terms.size());
    return breakdown;
}

}  // namespace pill_match
