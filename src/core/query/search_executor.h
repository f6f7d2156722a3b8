#pragma once

#include "core/query/compiled_query.h"
#include "core/shared/search_result.h"

namespace cw {

class IndexStore;

struct SearchLimits {
    int maxReturn = 200;     // hard page-size cap
    int budgetMs = 350;      // soft wall-clock budget for one scan
};

// SearchExecutor -- evaluates a compiled query over an IndexStore snapshot.
//
// Sessions are walked by last_at descending and messages in ingestion order.
// Metadata filters from every OR-group apply to every candidate; free-text
// clauses follow the OR-of-ANDs. The budget is checked after each match, so
// a scan may overrun it by one message before it stops and reports
// truncation. Hits are returned newest first, then by source and line.
class SearchExecutor {
public:
    static constexpr int kDefaultLimit = 50;
    static constexpr int kPreviewLength = 240;   // code points

    explicit SearchExecutor(SearchLimits limits = SearchLimits());

    SearchResponse exec(const IndexStore& store, const CompiledQuery& query,
                        int limit, int offset) const;

    const SearchLimits& limits() const { return m_limits; }

private:
    SearchLimits m_limits;
};

} // namespace cw
