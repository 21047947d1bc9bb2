#include "cloak/cloak_anonymizer.h"
#include "cloak/cloak_builtin_providers.h"
#include "cloak/cloak_span_resolver.h"
#include "cloak/cloak_text.h"
#include "cloak/util/logger.h"
#include <exception>

namespace CloakPII {

Anonymizer::Anonymizer(const AnonymizerConfig& config)
    : Anonymizer(config,
                 std::make_shared<FrenchPhoneSpanProvider>(),
                 std::make_shared<HonorificNameSpanProvider>(),
                 std::make_shared<LenientDateNormalizer>()) {}

Anonymizer::Anonymizer(const AnonymizerConfig& config,
                       std::shared_ptr<const PhoneSpanProvider> phone_provider,
                       std::shared_ptr<const EntitySpanProvider> entity_provider,
                       std::shared_ptr<const DateNormalizer> date_normalizer)
    : config_(config),
      phone_provider_(std::move(phone_provider)),
      entity_provider_(std::move(entity_provider)),
      registry_(config_, std::move(date_normalizer)),
      collector_(registry_, phone_provider_.get(), config_) {
  LOG_DEBUG("Anonymizer", "Ready with " + std::to_string(registry_.rules().size()) +
            " pattern rule(s), phone provider " + (phone_provider_ ? "on" : "off") +
            ", entity provider " + (entity_provider_ ? "on" : "off"));
}

std::string Anonymizer::Anonymize(const std::string& text, MaskStats* stats) const {
  if (text.empty()) {
    return text;
  }
  std::wstring wide = Utf8ToWide(text);
  std::wstring masked = AnonymizeWide(wide, stats);
  // Untouched text is returned byte for byte, invalid UTF-8 included
  if (masked == wide) {
    return text;
  }
  return WideToUtf8(masked);
}

std::wstring Anonymizer::AnonymizeWide(const std::wstring& text, MaskStats* stats) const {
  if (text.empty()) {
    return text;
  }
  return MaskDocument(text, DetectEntities(text), 0, stats);
}

EntityResult Anonymizer::DetectEntities(const std::wstring& text) const {
  if (!entity_provider_ || !config_.IsKindEnabled(EntityKind::PERSON)) {
    return EntityResult();
  }
  try {
    return entity_provider_->Detect(text);
  } catch (const std::exception& e) {
    return EntityResult::Failure(e.what());
  } catch (...) {
    return EntityResult::Failure(kNonStandardException);
  }
}

std::wstring Anonymizer::MaskDocument(const std::wstring& text, const EntityResult& entities,
                                      size_t doc_index, MaskStats* stats) const {
  std::vector<Span> candidates = collector_.Collect(text, entities, doc_index);

  MaskStats doc_stats;
  std::wstring masked = ApplySpans(text, std::move(candidates), &doc_stats);

  if (doc_stats.total_masked > 0) {
    LOG_DEBUG("Anonymizer", "Document " + std::to_string(doc_index) + ": " + doc_stats.ToString());
  }
  if (stats) {
    stats->Merge(doc_stats);
  }
  return masked;
}

std::wstring Anonymizer::MaskPatterns(const std::wstring& text, size_t doc_index,
                                      MaskStats* stats) const {
  MaskStats doc_stats;
  std::wstring masked = ApplySpans(text, collector_.CollectPatternSpans(text), &doc_stats);

  LOG_DEBUG("Anonymizer", "Document " + std::to_string(doc_index) + " (patterns only): " +
            doc_stats.ToString());
  if (stats) {
    stats->Merge(doc_stats);
  }
  return masked;
}

}  // namespace CloakPII
