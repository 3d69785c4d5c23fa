#include "filter.hpp"
#include "errors.hpp"

#include <algorithm>
#include <map>

namespace prodsearch {

namespace {

RangeBounds boundsFor(const FilterClause& clause) {
    RangeBounds bounds;
    if (clause.value.is_null()) {
        return bounds;  // open on that side
    }
    if (!clause.value.is_number()) {
        throw InvalidFilterError("Range filter on '" + clause.field +
                                 "' needs a numeric value, got " +
                                 clause.value.dump());
    }

    const double v = clause.value.get<double>();
    switch (clause.operation) {
        case FilterOperation::Gt:  bounds.gt  = v; break;
        case FilterOperation::Gte: bounds.gte = v; break;
        case FilterOperation::Lt:  bounds.lt  = v; break;
        case FilterOperation::Lte: bounds.lte = v; break;
        case FilterOperation::Eq:  break;
    }
    return bounds;
}

void tighten(std::optional<double>& mine, const std::optional<double>& theirs, bool lower) {
    if (!theirs) return;
    if (!mine) {
        mine = theirs;
    } else {
        mine = lower ? std::max(*mine, *theirs) : std::min(*mine, *theirs);
    }
}

} // namespace

FilterOperation parseFilterOperation(const std::string& operation) {
    if (operation == "eq")  return FilterOperation::Eq;
    if (operation == "gt")  return FilterOperation::Gt;
    if (operation == "gte") return FilterOperation::Gte;
    if (operation == "lt")  return FilterOperation::Lt;
    if (operation == "lte") return FilterOperation::Lte;
    throw UnsupportedOperationError(operation);
}

const char* toString(FilterOperation operation) {
    switch (operation) {
        case FilterOperation::Eq:  return "eq";
        case FilterOperation::Gt:  return "gt";
        case FilterOperation::Gte: return "gte";
        case FilterOperation::Lt:  return "lt";
        case FilterOperation::Lte: return "lte";
    }
    return "?";
}

FilterClause makeFilterClause(const std::string& field,
                              const std::string& operation,
                              nlohmann::json value) {
    if (field.empty()) {
        throw InvalidFilterError("Filter clause has an empty field name");
    }

    FilterClause clause;
    clause.field     = field;
    clause.operation = parseFilterOperation(operation);
    if (value.is_structured()) {
        throw InvalidFilterError("Filter value for '" + field +
                                 "' must be a scalar, got " + value.dump());
    }
    if (clause.operation == FilterOperation::Eq && value.is_null()) {
        throw InvalidFilterError("Equality filter on '" + field + "' has no value");
    }
    clause.value = std::move(value);
    return clause;
}

FilterClause parseFilterClause(const nlohmann::json& node) {
    if (!node.is_object() || !node.contains("field") || !node.contains("operation")) {
        throw InvalidFilterError("Filter clause needs 'field' and 'operation': " +
                                 node.dump());
    }
    if (!node["field"].is_string() || !node["operation"].is_string()) {
        throw InvalidFilterError("Filter 'field' and 'operation' must be strings: " +
                                 node.dump());
    }
    return makeFilterClause(node["field"].get<std::string>(),
                            node["operation"].get<std::string>(),
                            node.value("value", nlohmann::json()));
}

FilterClause parseFilterArg(const std::string& arg) {
    const auto first = arg.find(':');
    const auto second = (first == std::string::npos)
                            ? std::string::npos
                            : arg.find(':', first + 1);
    if (second == std::string::npos) {
        throw InvalidFilterError("Expected field:operation:value, got '" + arg + "'");
    }

    const std::string field     = arg.substr(0, first);
    const std::string operation = arg.substr(first + 1, second - first - 1);
    const std::string raw       = arg.substr(second + 1);

    nlohmann::json value = nlohmann::json::parse(raw, nullptr, /*allow_exceptions=*/false);
    if (value.is_discarded() || value.is_structured()) {
        value = raw;
    }
    return makeFilterClause(field, operation, std::move(value));
}

// ---------------------------------------------------------------------------
// RangeBounds
// ---------------------------------------------------------------------------

void RangeBounds::intersect(const RangeBounds& other) {
    tighten(gt,  other.gt,  /*lower=*/true);
    tighten(gte, other.gte, /*lower=*/true);
    tighten(lt,  other.lt,  /*lower=*/false);
    tighten(lte, other.lte, /*lower=*/false);
}

bool RangeBounds::contains(double v) const {
    if (gt  && !(v >  *gt))  return false;
    if (gte && !(v >= *gte)) return false;
    if (lt  && !(v <  *lt))  return false;
    if (lte && !(v <= *lte)) return false;
    return true;
}

// ---------------------------------------------------------------------------
// Translation
// ---------------------------------------------------------------------------

std::optional<Predicate> translateFilters(const std::vector<FilterClause>& clauses) {
    // Partition by field, keeping the order in which fields first appear.
    std::vector<std::string> fieldOrder;
    std::map<std::string, std::vector<const FilterClause*>> byField;
    for (const auto& clause : clauses) {
        if (clause.field == kSearchTextField) {
            continue;
        }
        auto& bucket = byField[clause.field];
        if (bucket.empty()) {
            fieldOrder.push_back(clause.field);
        }
        bucket.push_back(&clause);
    }

    Predicate predicate;
    for (const auto& field : fieldOrder) {
        const auto& bucket = byField[field];

        if (field == kPriceField) {
            RangeBounds merged;
            bool sawRange = false;
            for (const auto* clause : bucket) {
                if (isRangeOperation(clause->operation)) {
                    merged.intersect(boundsFor(*clause));
                    sawRange = true;
                } else {
                    predicate.must.emplace_back(EqCondition{field, clause->value});
                }
            }
            if (sawRange && !merged.empty()) {
                predicate.must.emplace_back(RangeCondition{field, merged});
            }
            continue;
        }

        for (const auto* clause : bucket) {
            if (!isRangeOperation(clause->operation)) {
                predicate.must.emplace_back(EqCondition{field, clause->value});
                continue;
            }
            RangeBounds bounds = boundsFor(*clause);
            if (!bounds.empty()) {
                predicate.must.emplace_back(RangeCondition{field, bounds});
            }
        }
    }

    if (predicate.must.empty()) {
        return std::nullopt;
    }
    return predicate;
}

} // namespace prodsearch
