#include "cloak/cloak_span_providers.h"
#include "cloak/cloak_maskers.h"
#include <algorithm>
#include <exception>

namespace CloakPII {

namespace {

bool InRange(size_t start, size_t end, size_t length) {
  return start < end && end <= length;
}

}  // namespace

std::vector<EntityResult> EntitySpanProvider::DetectBatch(
    const std::vector<std::wstring>& texts) const {
  std::vector<EntityResult> results;
  results.reserve(texts.size());
  for (const auto& text : texts) {
    try {
      results.push_back(Detect(text));
    } catch (const std::exception& e) {
      results.push_back(EntityResult::Failure(e.what()));
    } catch (...) {
      results.push_back(EntityResult::Failure(kNonStandardException));
    }
  }
  return results;
}

std::vector<Span> AdaptPhoneSpans(const std::wstring& text,
                                  const std::vector<PhoneSpan>& phones,
                                  wchar_t mask_char,
                                  size_t* rejected) {
  std::vector<Span> out;
  out.reserve(phones.size());
  for (const auto& phone : phones) {
    if (!InRange(phone.start, phone.end, text.size())) {
      if (rejected) (*rejected)++;
      continue;
    }
    Span span;
    span.start = phone.start;
    span.end = phone.end;
    span.replacement = MaskPhone(text.substr(phone.start, phone.end - phone.start), mask_char);
    span.kind = EntityKind::PHONE;
    span.priority = kPhonePriority;
    out.push_back(std::move(span));
  }
  return out;
}

std::vector<Span> AdaptEntitySpans(const std::wstring& text,
                                   const std::vector<EntitySpan>& entities,
                                   const std::vector<std::string>& person_labels,
                                   size_t* rejected) {
  std::vector<Span> out;
  for (const auto& entity : entities) {
    if (std::find(person_labels.begin(), person_labels.end(), entity.label) ==
        person_labels.end()) {
      continue;
    }
    if (!InRange(entity.start, entity.end, text.size())) {
      if (rejected) (*rejected)++;
      continue;
    }
    Span span;
    span.start = entity.start;
    span.end = entity.end;
    span.replacement = MaskPerson(text.substr(entity.start, entity.end - entity.start));
    span.kind = EntityKind::PERSON;
    span.priority = kPersonPriority;
    out.push_back(std::move(span));
  }
  return out;
}

}  // namespace CloakPII
