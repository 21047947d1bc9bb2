#ifndef CLOAK_SPAN_COLLECTOR_H_
#define CLOAK_SPAN_COLLECTOR_H_

#include <string>
#include <vector>

#include "cloak/cloak_config.h"
#include "cloak/cloak_detector_registry.h"
#include "cloak/cloak_span_providers.h"

namespace CloakPII {

/**
 * SpanCollector - gathers every candidate span for one text.
 *
 * Runs the registry rules in priority order, then the phone provider, then
 * appends the person spans of an entity result computed by the caller (the
 * batch pipeline obtains those for many documents at once). The result is
 * unordered and may overlap; OverlapResolver decides what survives.
 *
 * Holds only const references, so one collector serves concurrent calls.
 */
class SpanCollector {
 public:
  SpanCollector(const DetectorRegistry& registry,
                const PhoneSpanProvider* phone_provider,
                const AnonymizerConfig& config);

  /**
   * Validator-accepted matches of every enabled rule.
   */
  std::vector<Span> CollectPatternSpans(const std::wstring& text) const;

  /**
   * Phone spans for one document. A provider exception yields no spans for
   * this document and a warning naming doc_index.
   */
  std::vector<Span> CollectPhoneSpans(const std::wstring& text, size_t doc_index) const;

  /**
   * PERSON spans from an entity result. A failed result yields no spans.
   */
  std::vector<Span> CollectPersonSpans(const std::wstring& text,
                                       const EntityResult& entities,
                                       size_t doc_index) const;

  /**
   * All of the above for one document.
   */
  std::vector<Span> Collect(const std::wstring& text,
                            const EntityResult& entities,
                            size_t doc_index) const;

 private:
  const DetectorRegistry& registry_;
  const PhoneSpanProvider* phone_provider_;  // nullptr disables phone detection
  const AnonymizerConfig& config_;
};

}  // namespace CloakPII

#endif  // CLOAK_SPAN_COLLECTOR_H_
