#include "cloak/cloak_span_resolver.h"
#include "cloak/util/logger.h"
#include <algorithm>

namespace CloakPII {

std::vector<Span> ResolveOverlaps(std::vector<Span> candidates, size_t text_length,
                                  size_t* rejected) {
  auto out_of_range = [text_length](const Span& span) {
    return span.start >= span.end || span.end > text_length;
  };
  auto valid_end = std::remove_if(candidates.begin(), candidates.end(), out_of_range);
  size_t dropped = static_cast<size_t>(candidates.end() - valid_end);
  candidates.erase(valid_end, candidates.end());
  if (rejected) {
    *rejected = dropped;
  }
  if (dropped > 0) {
    LOG_DEBUG("SpanResolver", "Dropped " + std::to_string(dropped) + " out-of-range span(s)");
  }

  std::stable_sort(candidates.begin(), candidates.end(), [](const Span& a, const Span& b) {
    if (a.start != b.start) {
      return a.start < b.start;
    }
    return a.priority < b.priority;
  });

  std::vector<Span> accepted;
  accepted.reserve(candidates.size());
  size_t cursor = 0;
  for (auto& span : candidates) {
    if (span.start < cursor) {
      continue;  // overlaps an accepted span
    }
    cursor = span.end;
    accepted.push_back(std::move(span));
  }

  return accepted;
}

std::wstring Reconstruct(const std::wstring& text, const std::vector<Span>& accepted) {
  if (accepted.empty()) {
    return text;
  }

  size_t replacement_size = 0;
  for (const auto& span : accepted) {
    replacement_size += span.replacement.size();
  }

  std::wstring out;
  out.reserve(text.size() + replacement_size);

  size_t cursor = 0;
  for (const auto& span : accepted) {
    out.append(text, cursor, span.start - cursor);
    out.append(span.replacement);
    cursor = span.end;
  }
  out.append(text, cursor, std::wstring::npos);

  return out;
}

std::wstring ApplySpans(const std::wstring& text, std::vector<Span> candidates,
                        MaskStats* stats) {
  if (candidates.empty()) {
    return text;
  }

  std::vector<Span> accepted = ResolveOverlaps(std::move(candidates), text.size());
  if (stats) {
    for (const auto& span : accepted) {
      stats->AddDetection(span.kind);
    }
  }
  return Reconstruct(text, accepted);
}

}  // namespace CloakPII
