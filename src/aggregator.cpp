#include <pill_match/aggregator.hpp>
#include <pill_match/internal/normalization.hpp>
#include <pill_match/recognition.hpp>

namespace pill_match {

namespace {

bool passes_confidence(const RecognizedText& text, double min_confidence) {
    if (min_confidence <= 0.0 || !text.confidence) {
        return true;
    }
    return *text.confidence >= min_confidence;
}

}  // namespace

QueryTerms aggregate_signals(const QuerySignals& signals, const MatchConfig& config) {
    std::vector<std::string> raw;
    std::vector<RecognizedText> accepted;

    for (const auto& text : signals.recognized_text) {
        if (passes_confidence(text, config.min_text_confidence)) {
            raw.push_back(text.text);
            accepted.push_back(text);
        }
    }

    if (config.extract_dosages) {
        for (auto& dosage : recognition::dosage_candidates(accepted)) {
            raw.push_back(std::move(dosage));
        }
    }

    raw.insert(raw.end(), signals.labels.begin(), signals.labels.end());
    raw.insert(raw.end(), signals.ai_terms.begin(), signals.ai_terms.end());

    if (signals.color) raw.push_back(to_string(*signals.color));
    if (signals.shape) raw.push_back(to_string(*signals.shape));

    return normalization::normalize_terms(raw);
}

}  // namespace pill_match
