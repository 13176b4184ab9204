#include "lotmatch/types.hpp"

#include <algorithm>

namespace lotmatch {

std::size_t RunDiagnostics::count(RowIssueKind kind) const {
    const auto matches = [kind](const RowIssue& issue) { return issue.kind == kind; };
    if (kind == RowIssueKind::InvalidDate) {
        return static_cast<std::size_t>(std::count_if(date_warnings.begin(), date_warnings.end(), matches));
    }
    return static_cast<std::size_t>(std::count_if(skipped_rows.begin(), skipped_rows.end(), matches));
}

const char* to_string(RowIssueKind kind) {
    switch (kind) {
    case RowIssueKind::MissingValue:
        return "missing value";
    case RowIssueKind::InvalidNumber:
        return "invalid number";
    case RowIssueKind::InvalidDate:
        return "invalid date";
    }
    return "unknown";
}

} // namespace lotmatch
