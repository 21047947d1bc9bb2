#ifndef CLOAK_ANONYMIZER_H_
#define CLOAK_ANONYMIZER_H_

#include <memory>
#include <string>
#include <vector>

#include "cloak/cloak_config.h"
#include "cloak/cloak_date_normalizer.h"
#include "cloak/cloak_detector_registry.h"
#include "cloak/cloak_span.h"
#include "cloak/cloak_span_collector.h"
#include "cloak/cloak_span_providers.h"

namespace CloakPII {

/**
 * Anonymizer - masks PII in French free text.
 *
 * Combines the pattern detectors of DetectorRegistry with a phone provider
 * and an entity (person name) provider, resolves overlaps and rebuilds the
 * text in one pass. Detected values are never logged.
 *
 * Stateless per call: the registry, configuration and providers are fixed at
 * construction, so Anonymize may be called concurrently from several threads
 * as long as the providers are thread-safe (the built-in ones are).
 *
 * Usage:
 *   CloakPII::Anonymizer anonymizer;
 *   std::string masked = anonymizer.Anonymize("Carte 4539 1488 0343 6467");
 *   // "Carte ************6467"
 */
class Anonymizer {
 public:
  /**
   * Null providers are allowed and disable that source. The defaults are
   * FrenchPhoneSpanProvider, HonorificNameSpanProvider and
   * LenientDateNormalizer.
   */
  explicit Anonymizer(const AnonymizerConfig& config = AnonymizerConfig());
  Anonymizer(const AnonymizerConfig& config,
             std::shared_ptr<const PhoneSpanProvider> phone_provider,
             std::shared_ptr<const EntitySpanProvider> entity_provider,
             std::shared_ptr<const DateNormalizer> date_normalizer = nullptr);
  ~Anonymizer() = default;

  Anonymizer(const Anonymizer&) = delete;
  Anonymizer& operator=(const Anonymizer&) = delete;

  /**
   * Mask one UTF-8 text.
   *
   * @param stats When given, accepted spans are added to it
   * @return The masked text; the input itself when nothing was found
   */
  std::string Anonymize(const std::string& text, MaskStats* stats = nullptr) const;

  /**
   * Same as Anonymize on already-decoded text.
   */
  std::wstring AnonymizeWide(const std::wstring& text, MaskStats* stats = nullptr) const;

  /**
   * Mask one document given entities already detected for it. Used by
   * BatchPipeline, which queries the entity provider once per batch.
   */
  std::wstring MaskDocument(const std::wstring& text, const EntityResult& entities,
                            size_t doc_index, MaskStats* stats) const;

  /**
   * Pattern rules only, without either provider. Last resort for a document
   * whose full masking failed.
   */
  std::wstring MaskPatterns(const std::wstring& text, size_t doc_index, MaskStats* stats) const;

  /**
   * Entities for one text. Provider exceptions become a failed result.
   */
  EntityResult DetectEntities(const std::wstring& text) const;

  const AnonymizerConfig& config() const { return config_; }
  const DetectorRegistry& registry() const { return registry_; }
  const EntitySpanProvider* entity_provider() const { return entity_provider_.get(); }

 private:
  AnonymizerConfig config_;
  std::shared_ptr<const PhoneSpanProvider> phone_provider_;
  std::shared_ptr<const EntitySpanProvider> entity_provider_;
  DetectorRegistry registry_;
  SpanCollector collector_;
};

}  // namespace CloakPII

#endif  // CLOAK_ANONYMIZER_H_
