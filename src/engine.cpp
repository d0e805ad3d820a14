#include <pill_match/aggregator.hpp>
#include <pill_match/barcode.hpp>
#include <pill_match/engine.hpp>
#include <pill_match/errors.hpp>
#include <pill_match/internal/normalization.hpp>
#include <pill_match/log.hpp>
#include <pill_match/ranker.hpp>
#include <pill_match/terms.hpp>

#include <cmath>
#include <string>
#include <unordered_set>

namespace pill_match {

void validate(const QuerySignals& signals) {
    for (std::size_t i = 0; i < signals.recognized_text.size(); ++i) {
        const auto& confidence = signals.recognized_text[i].confidence;
        if (!confidence) continue;
        if (std::isnan(*confidence) || *confidence < 0.0 || *confidence > 1.0) {
            throw ValidationError(
                "recognized_text[" + std::to_string(i) + "].confidence",
                "must be within [0, 1], got " + std::to_string(*confidence));
        }
    }
}

void validate(const std::vector<Record>& candidates) {
    std::unordered_set<std::string> ids;
    ids.reserve(candidates.size());

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        const auto& id = candidates[i].id;
        if (normalization::trim(id).empty()) {
            throw ValidationError("candidates[" + std::to_string(i) + "].id", "must not be blank");
        }
        if (!ids.insert(id).second) {
            throw ValidationError("candidates[" + std::to_string(i) + "].id",
                                  "duplicate identifier '" + id + "'");
        }
    }
}

Engine::Engine(MatchConfig config) : config_(std::move(config)) {
    validate_config(config_);
}

std::vector<ScoredCandidate> Engine::identify_scored(
    const QuerySignals& signals, const std::vector<Record>& candidates) const {
    try {
        validate(signals);
        validate(candidates);
    } catch (const ValidationError& e) {
        logger()->warn("rejected identification request: {}", e.what());
        throw;
    }

    if (candidates.empty()) {
        return {};
    }

    if (auto hit = barcode_shortcut(signals, candidates)) {
        logger()->debug("external code matched record '{}'", hit->record->id);
        return {*hit};
    }

    const auto terms = aggregate_signals(signals, config_);
    auto ranked = rank(candidates, terms, config_);
    logger()->debug("ranked {} of {} candidates for {} query terms",
                    ranked.size(), candidates.size(), terms.size());
    return ranked;
}

std::vector<Record> Engine::identify(
    const QuerySignals& signals, const std::vector<Record>& candidates) const {
    return to_records(identify_scored(signals, candidates));
}

double Engine::score(const QueryTerms& query_terms, const Record& record) const {
    return pill_match::score(query_terms, record, config_);
}

ScoreBreakdown Engine::explain(const QueryTerms& query_terms, const Record& record) const {
    return score_breakdown(query_terms, extract_terms(record), config_);
}

std::vector<Record> identify(const QuerySignals& signals, const std::vector<Record>& candidates) {
    return Engine().identify(signals, candidates);
}

}  // namespace pill_match
