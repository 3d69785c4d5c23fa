#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace prodsearch {

/// Payload field that carries the product price.  Range clauses on it are
/// merged into a single bounded range.
inline const std::string kPriceField = "current_price";

/// Pseudo-field holding the free-text query.  Never becomes a predicate.
inline const std::string kSearchTextField = "query";

enum class FilterOperation { Eq, Gt, Gte, Lt, Lte };

/// Throws UnsupportedOperationError for anything but eq/gt/gte/lt/lte.
FilterOperation parseFilterOperation(const std::string& operation);

const char* toString(FilterOperation operation);

inline bool isRangeOperation(FilterOperation op) { return op != FilterOperation::Eq; }

/// One validated (field, operation, value) filter.  The value is a JSON scalar.
struct FilterClause {
    std::string     field;
    FilterOperation operation = FilterOperation::Eq;
    nlohmann::json  value;
};

/// Build a clause from its loosely-typed parts.
/// @throws UnsupportedOperationError  unknown operation
/// @throws InvalidFilterError         empty field or non-scalar value
FilterClause makeFilterClause(const std::string& field,
                              const std::string& operation,
                              nlohmann::json value);

/// Build a clause from {"field": ..., "operation": ..., "value": ...}.
FilterClause parseFilterClause(const nlohmann::json& node);

/// Build a clause from "field:operation:value".  The value is read as a JSON
/// number, boolean or null when it looks like one and as a string otherwise.
FilterClause parseFilterArg(const std::string& arg);

// ---------------------------------------------------------------------------
// Predicate tree
// ---------------------------------------------------------------------------

/// field == value
struct EqCondition {
    std::string    field;
    nlohmann::json value;
};

/// Bounds of a numeric range.  An unset bound leaves that side open.
struct RangeBounds {
    std::optional<double> gt;
    std::optional<double> gte;
    std::optional<double> lt;
    std::optional<double> lte;

    bool empty() const { return !gt && !gte && !lt && !lte; }

    /// Intersect with another bound set (tightest bound on each side wins).
    void intersect(const RangeBounds& other);

    bool contains(double v) const;
};

struct RangeCondition {
    std::string field;
    RangeBounds bounds;
};

using Condition = std::variant<EqCondition, RangeCondition>;

/// Conjunction of conditions.
struct Predicate {
    std::vector<Condition> must;
};

/// Translate filter clauses into a predicate.  Returns std::nullopt when no
/// condition results ("match everything").
/// @throws InvalidFilterError  range clause with a non-numeric value
std::optional<Predicate> translateFilters(const std::vector<FilterClause>& clauses);

} // namespace prodsearch
