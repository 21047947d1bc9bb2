#ifndef CLOAK_SPAN_RESOLVER_H_
#define CLOAK_SPAN_RESOLVER_H_

#include <string>
#include <vector>

#include "cloak/cloak_span.h"

namespace CloakPII {

/**
 * Choose the spans that will be applied.
 *
 * Spans that are empty or end past text_length are dropped first. The rest
 * are sorted by start, ties by priority, and swept left to right: a span
 * starting before the end of the last accepted span is discarded. There is
 * no merging and no longest-match preference.
 *
 * @param rejected When given, receives the number of out-of-range spans
 * @return Accepted spans, sorted and pairwise disjoint
 */
std::vector<Span> ResolveOverlaps(std::vector<Span> candidates, size_t text_length,
                                  size_t* rejected = nullptr);

/**
 * Build the output text in one pass from spans returned by ResolveOverlaps.
 */
std::wstring Reconstruct(const std::wstring& text, const std::vector<Span>& accepted);

/**
 * ResolveOverlaps + Reconstruct. Accepted spans are counted in *stats when
 * given. Returns text unchanged when nothing is accepted.
 */
std::wstring ApplySpans(const std::wstring& text, std::vector<Span> candidates,
                        MaskStats* stats = nullptr);

}  // namespace CloakPII

#endif  // CLOAK_SPAN_RESOLVER_H_
