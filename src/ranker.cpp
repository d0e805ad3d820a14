#include <pill_match/internal/normalization.hpp>
#include <pill_match/ranker.hpp>
#include <pill_match/scorer.hpp>
#include <pill_match/terms.hpp>

#include <algorithm>
#include <future>

namespace pill_match {

namespace {

void score_range(
    const std::vector<Record>& candidates,
    const QueryTerms& terms,
    const MatchConfig& config,
    std::size_t begin,
    std::size_t end,
    std::vector<double>& scores) {
    for (std::size_t i = begin; i < end; ++i) {
        scores[i] = score_normalized(terms, extract_terms(candidates[i]), config);
    }
}

// Each task writes a disjoint slice of scores
void score_parallel(
    const std::vector<Record>& candidates,
    const QueryTerms& terms,
    const MatchConfig& config,
    std::vector<double>& scores) {
    const std::size_t count = candidates.size();
    const std::size_t workers = std::min(config.parallel_workers, count);
    const std::size_t chunk = (count + workers - 1) / workers;

    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (std::size_t begin = 0; begin < count; begin += chunk) {
        const std::size_t end = std::min(begin + chunk, count);
        futures.push_back(std::async(std::launch::async, [&, begin, end]() {
            score_range(candidates, terms, config, begin, end, scores);
        }));
    }

    for (auto& future : futures) {
        future.get();
    }
}

}  // namespace

std::vector<ScoredCandidate> rank(
    const std::vector<Record>& candidates,
    const QueryTerms& query_terms,
    const MatchConfig& config) {
    if (candidates.empty()) {
        return {};
    }

    const auto terms = normalization::normalize_terms(query_terms);
    if (terms.empty()) {
        return {};
    }

    std::vector<double> scores(candidates.size(), 0.0);
    const bool parallel = config.parallel_threshold > 0 && config.parallel_workers > 1 &&
                          candidates.size() >= config.parallel_threshold;
    if (parallel) {
        score_parallel(candidates, terms, config, scores);
    } else {
        score_range(candidates, terms, config, 0, candidates.size(), scores);
    }

    std::vector<ScoredCandidate> ranked;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (scores[i] > config.min_relevance) {
            ranked.push_back(ScoredCandidate{.record = &candidates[i], .score = scores[i], .index = i});
        }
    }

    // Stable: ties keep candidate-set order
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const ScoredCandidate& a, const ScoredCandidate& b) {
                         return a.score > b.score;
                     });

    if (ranked.size() > config.max_results) {
        ranked.resize(config.max_results);
    }

    return ranked;
}

std::vector<Record> to_records(const std::vector<ScoredCandidate>& ranked) {
    std::vector<Record> records;
    records.reserve(ranked.size());
    for (const auto& candidate : ranked) {
        records.push_back(*candidate.record);
    }
    return records;
}

}  // namespace pill_match
