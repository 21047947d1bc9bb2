#include "cloak/cloak_span_collector.h"
#include "cloak/util/logger.h"
#include <exception>
#include <iterator>

namespace CloakPII {

SpanCollector::SpanCollector(const DetectorRegistry& registry,
                             const PhoneSpanProvider* phone_provider,
                             const AnonymizerConfig& config)
    : registry_(registry), phone_provider_(phone_provider), config_(config) {}

std::vector<Span> SpanCollector::CollectPatternSpans(const std::wstring& text) const {
  std::vector<Span> spans;

  for (const DetectorRule& rule : registry_.rules()) {
    int count = 0;
    int rejected = 0;

    std::wsregex_iterator it(text.begin(), text.end(), rule.pattern);
    std::wsregex_iterator end;
    for (; it != end; ++it) {
      std::wstring match = it->str();
      if (match.empty()) {
        continue;
      }
      if (rule.validator && !rule.validator(match)) {
        rejected++;
        continue;
      }

      Span span;
      span.start = static_cast<size_t>(it->position());
      span.end = span.start + match.size();
      span.replacement = rule.masker(match);
      span.kind = rule.kind;
      span.priority = rule.priority;
      spans.push_back(std::move(span));
      count++;
    }

    if (count > 0 || rejected > 0) {
      LOG_DEBUG("SpanCollector", "Rule " + rule.name + ": " + std::to_string(count) +
                " match(es), " + std::to_string(rejected) + " failed validation");
    }
  }

  return spans;
}

std::vector<Span> SpanCollector::CollectPhoneSpans(const std::wstring& text,
                                                   size_t doc_index) const {
  if (phone_provider_ == nullptr || !config_.IsKindEnabled(EntityKind::PHONE)) {
    return {};
  }

  std::vector<PhoneSpan> phones;
  try {
    phones = phone_provider_->FindPhones(text, config_.phone_region);
  } catch (const std::exception& e) {
    LOG_WARN("SpanCollector", "Phone provider failed for document " +
             std::to_string(doc_index) + ": " + e.what());
    return {};
  } catch (...) {
    LOG_WARN("SpanCollector", "Phone provider failed for document " +
             std::to_string(doc_index) + " with a non-standard exception");
    return {};
  }

  size_t rejected = 0;
  std::vector<Span> spans = AdaptPhoneSpans(
      text, phones, static_cast<wchar_t>(config_.phone_mask_char), &rejected);
  if (rejected > 0) {
    LOG_WARN("SpanCollector", "Dropped " + std::to_string(rejected) +
             " out-of-range phone span(s) in document " + std::to_string(doc_index));
  }
  return spans;
}

std::vector<Span> SpanCollector::CollectPersonSpans(const std::wstring& text,
                                                    const EntityResult& entities,
                                                    size_t doc_index) const {
  if (!config_.IsKindEnabled(EntityKind::PERSON)) {
    return {};
  }
  if (!entities.ok) {
    LOG_WARN("SpanCollector", "Entity provider failed for document " +
             std::to_string(doc_index) + ": " + entities.error);
    return {};
  }

  size_t rejected = 0;
  std::vector<Span> spans = AdaptEntitySpans(text, entities.spans, config_.person_labels, &rejected);
  if (rejected > 0) {
    LOG_WARN("SpanCollector", "Dropped " + std::to_string(rejected) +
             " out-of-range entity span(s) in document " + std::to_string(doc_index));
  }
  return spans;
}

std::vector<Span> SpanCollector::Collect(const std::wstring& text,
                                         const EntityResult& entities,
                                         size_t doc_index) const {
  std::vector<Span> spans = CollectPatternSpans(text);

  std::vector<Span> phones = CollectPhoneSpans(text, doc_index);
  spans.insert(spans.end(), std::make_move_iterator(phones.begin()),
               std::make_move_iterator(phones.end()));

  std::vector<Span> persons = CollectPersonSpans(text, entities, doc_index);
  spans.insert(spans.end(), std::make_move_iterator(persons.begin()),
               std::make_move_iterator(persons.end()));

  return spans;
}

}  // namespace CloakPII
