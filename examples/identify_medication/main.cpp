// Example: Identify a Medication
//
// This example ranks a medication list against query signals and prints a
// per-term explanation of every result.
//
// To run:
//   ./identify_medication medications.json signals.json
//
// medications.json holds an array of records:
//   [{"id": "1", "name": "Ibuprofen", "metadata": {"brand_names": ["Advil"]}}]
// signals.json holds one signals object:
//   {"recognized_text": [{"text": "ADVIL", "confidence": 0.9}], "color": "orange"}

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <pill_match/aggregator.hpp>
#include <pill_match/engine.hpp>
#include <pill_match/errors.hpp>
#include <pill_match/log.hpp>
#include <pill_match/types.hpp>

namespace {

nlohmann::json read_json(const char* path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error(std::string("cannot open ") + path);
    }
    nlohmann::json j;
    file >> j;
    return j;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace pill_match;

    if (argc < 3) {
        std::cout << "Usage: " << argv[0] << " <medications.json> <signals.json>\n";
        return 1;
    }

    if (std::getenv("PILL_MATCH_DEBUG")) {
        set_log_level(spdlog::level::debug);
    }

    try {
        auto candidates = read_json(argv[1]).get<std::vector<Record>>();
        auto signals = read_json(argv[2]).get<QuerySignals>();

        Engine engine(make_config({with_dosage_extraction()}));
        auto terms = aggregate_signals(signals, engine.config());

        std::cout << "Query terms:";
        for (const auto& term : terms) {
            std::cout << " \"" << term << "\"";
        }
        std::cout << "\n\n";

        auto results = engine.identify_scored(signals, candidates);
        if (results.empty()) {
            std::cout << "No medication matched\n";
            return 0;
        }

        std::cout << std::fixed << std::setprecision(2);
        for (size_t i = 0; i < results.size(); ++i) {
            const auto& result = results[i];
            std::cout << i + 1 << ". " << result.record->name << " (" << result.record->id
                      << ") score " << result.score << "\n";

            auto breakdown = engine.explain(terms, *result.record);
            for (const auto& match : breakdown.terms) {
                if (match.tier == MatchTier::None) continue;
                std::cout << "     " << match.query_term << " -> " << match.matched_term << " ["
                          << to_string(match.tier) << "]\n";
            }
        }
    } catch (const PillMatchError& e) {
        std::cerr << "Identify failed: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
