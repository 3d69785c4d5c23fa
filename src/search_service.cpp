#include "search_service.hpp"
#include "errors.hpp"

#include <chrono>
#include <iostream>

namespace prodsearch {

std::vector<FilterClause> buildFilterClauses(const SearchQuery& query) {
    std::vector<FilterClause> clauses;

    if (query.minPrice) {
        clauses.push_back(makeFilterClause(kPriceField, "gte", *query.minPrice));
    }
    if (query.maxPrice) {
        clauses.push_back(makeFilterClause(kPriceField, "lte", *query.maxPrice));
    }
    for (const auto& attribute : query.attributes) {
        clauses.push_back(makeFilterClause(attribute.first, "eq", attribute.second));
    }
    for (const auto& arg : query.filters) {
        if (!arg.empty() && arg.front() == '{') {
            const auto node = nlohmann::json::parse(arg, nullptr, /*allow_exceptions=*/false);
            if (node.is_discarded()) {
                throw InvalidFilterError("Filter is not valid JSON: " + arg);
            }
            clauses.push_back(parseFilterClause(node));
        } else {
            clauses.push_back(parseFilterArg(arg));
        }
    }
    return clauses;
}

SearchService::SearchService(EmbeddingProvider& embedder,
                             VectorStore& store,
                             std::string collection,
                             bool verbose)
    : mEmbedder(embedder)
    , mStore(store)
    , mCollection(std::move(collection))
    , mVerbose(verbose) {}

std::vector<ProductPoint> SearchService::findSimilar(const std::string& queryText,
                                                     const std::vector<FilterClause>& clauses) {
    const auto started = std::chrono::steady_clock::now();

    // Translate first so a malformed filter costs no model call.
    const auto predicate = translateFilters(clauses);
    const Vector queryVector = mEmbedder.encodeText(queryText);
    auto results = mStore.search(mCollection, queryVector, predicate, kSearchLimit);

    if (mVerbose) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        std::cerr << "[SearchService] '" << queryText << "' with "
                  << (predicate ? predicate->must.size() : 0)
                  << " conditions -> " << results.size() << " results in "
                  << elapsed.count() << " ms\n";
    }
    return results;
}

std::vector<ProductPoint> SearchService::findSimilar(const SearchQuery& query) {
    return findSimilar(query.text, buildFilterClauses(query));
}

} // namespace prodsearch
