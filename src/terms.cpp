#include <pill_match/internal/normalization.hpp>
#include <pill_match/terms.hpp>

#include <algorithm>

namespace pill_match {

namespace {

void add_term(TermSet& terms, std::string_view raw) {
    std::string term = normalization::normalize_term(raw);
    if (term.empty()) return;
    if (std::find(terms.begin(), terms.end(), term) == terms.end()) {
        terms.push_back(std::move(term));
    }
}

}  // namespace

TermSet extract_terms(const Record& record) {
    TermSet terms;
    // The display name is kept even when blank so the set is never empty
    terms.push_back(normalization::normalize_term(record.name));

    if (!record.metadata) {
        return terms;
    }

    const auto& meta = *record.metadata;
    if (meta.generic_name) add_term(terms, *meta.generic_name);
    for (const auto& brand : meta.brand_names) {
        add_term(terms, brand);
    }
    if (meta.active_ingredient) add_term(terms, *meta.active_ingredient);
    if (meta.dosage_amount) add_term(terms, *meta.dosage_amount);
    if (meta.pill_color) add_term(terms, to_string(*meta.pill_color));
    if (meta.pill_shape) add_term(terms, to_string(*meta.pill_shape));

    return terms;
}

}  // namespace pill_match
