#pragma once

#include "embedding.hpp"
#include "filter.hpp"
#include "models.hpp"
#include "vector_store.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace prodsearch {

/// One search request as it arrives from a caller.
struct SearchQuery {
    std::string                        text;
    std::optional<double>              minPrice;
    std::optional<double>              maxPrice;
    std::vector<std::string>           filters;     // "field:operation:value" or a JSON clause
    std::map<std::string, std::string> attributes;  // field -> value, equality
};

/// Turn a SearchQuery into validated filter clauses.  Price bounds become
/// gte/lte clauses on the price field.
/// @throws UnsupportedOperationError, InvalidFilterError
std::vector<FilterClause> buildFilterClauses(const SearchQuery& query);

/// Answers text-to-product searches: encode, translate filters, search.
class SearchService {
public:
    SearchService(EmbeddingProvider& embedder,
                  VectorStore& store,
                  std::string collection,
                  bool verbose = false);

    /// Up to kSearchLimit products closest to @p queryText that satisfy @p clauses.
    std::vector<ProductPoint> findSimilar(const std::string& queryText,
                                          const std::vector<FilterClause>& clauses = {});

    std::vector<ProductPoint> findSimilar(const SearchQuery& query);

private:
    EmbeddingProvider& mEmbedder;
    VectorStore&       mStore;
    std::string        mCollection;
    bool               mVerbose;
};

} // namespace prodsearch
