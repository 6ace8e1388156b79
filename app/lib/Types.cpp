#include "Types.hpp"
#include "Utils.hpp"

using Utils::to_lower_copy;

std::optional<SortColumn> sort_column_from_string(const std::string& value)
{
    const std::string norm = to_lower_copy(value);
    if (norm == "name") return SortColumn::Name;
    if (norm == "extension") return SortColumn::Extension;
    if (norm == "size") return SortColumn::Size;
    if (norm == "modified") return SortColumn::Modified;
    return std::nullopt;
}

std::optional<SortOrder> sort_order_from_string(const std::string& value)
{
    const std::string norm = to_lower_copy(value);
    if (norm == "ascending" || norm == "asc") return SortOrder::Ascending;
    if (norm == "descending" || norm == "desc") return SortOrder::Descending;
    return std::nullopt;
}

std::optional<ConflictPolicy> conflict_policy_from_string(const std::string& value)
{
    const std::string norm = to_lower_copy(value);
    if (norm == "stop") return ConflictPolicy::Stop;
    if (norm == "skip") return ConflictPolicy::Skip;
    if (norm == "overwrite") return ConflictPolicy::Overwrite;
    return std::nullopt;
}

std::optional<ConflictDecision> conflict_decision_from_string(const std::string& value)
{
    const std::string norm = to_lower_copy(value);
    if (norm == "overwrite-this") return ConflictDecision::OverwriteThis;
    if (norm == "skip-this") return ConflictDecision::SkipThis;
    if (norm == "overwrite-remaining") return ConflictDecision::OverwriteRemaining;
    if (norm == "skip-remaining") return ConflictDecision::SkipRemaining;
    if (norm == "abort") return ConflictDecision::Abort;
    return std::nullopt;
}
