#ifndef CLOAK_SPAN_PROVIDERS_H_
#define CLOAK_SPAN_PROVIDERS_H_

#include <cstddef>
#include <string>
#include <vector>

#include "cloak/cloak_span.h"

namespace CloakPII {

// Boundary with the external detectors (phone-number library, NER model).
// Providers receive the same wide text the pattern rules scan, so their
// offsets share the engine's unit (see cloak_text.h).

/**
 * A phone number found by a PhoneSpanProvider, already confirmed as a
 * possible number for the requested region.
 */
struct PhoneSpan {
  size_t start = 0;
  size_t end = 0;
};

class PhoneSpanProvider {
 public:
  virtual ~PhoneSpanProvider() = default;

  /**
   * Find phone numbers in text. Spans need not be sorted. May throw; the
   * caller treats a throw as "no phone numbers" for this text.
   *
   * @param region Region hint, e.g. "FR"
   */
  virtual std::vector<PhoneSpan> FindPhones(const std::wstring& text,
                                            const std::string& region) const = 0;
};

/**
 * A labeled entity found by an EntitySpanProvider ("PER", "LOC", ...).
 */
struct EntitySpan {
  size_t start = 0;
  size_t end = 0;
  std::string label;
};

// EntityResult::error for a provider that threw something other than a
// std::exception
constexpr char kNonStandardException[] = "non-standard exception";

/**
 * Entities for one document. When ok is false the spans are ignored and the
 * document gets no PERSON masking.
 */
struct EntityResult {
  bool ok = true;
  std::string error;
  std::vector<EntitySpan> spans;

  static EntityResult Failure(const std::string& message) {
    EntityResult result;
    result.ok = false;
    result.error = message;
    return result;
  }
};

class EntitySpanProvider {
 public:
  virtual ~EntitySpanProvider() = default;

  /**
   * Detect entities in one text.
   */
  virtual EntityResult Detect(const std::wstring& text) const = 0;

  /**
   * Detect entities in many texts with one call, returning exactly one
   * result per text in input order. Model-backed providers override this to
   * amortize inference; the default calls Detect per text and turns a throw
   * into a failed result for that text only.
   */
  virtual std::vector<EntityResult> DetectBatch(const std::vector<std::wstring>& texts) const;
};

/**
 * Convert provider phone spans into masked Spans (priority kPhonePriority).
 * Spans outside [0, text.size()] or empty are dropped and counted in
 * *rejected when given.
 */
std::vector<Span> AdaptPhoneSpans(const std::wstring& text,
                                  const std::vector<PhoneSpan>& phones,
                                  wchar_t mask_char,
                                  size_t* rejected = nullptr);

/**
 * Convert provider entities whose label is in person_labels into masked
 * PERSON Spans (priority kPersonPriority). Other labels are ignored;
 * out-of-range spans are dropped and counted in *rejected when given.
 */
std::vector<Span> AdaptEntitySpans(const std::wstring& text,
                                   const std::vector<EntitySpan>& entities,
                                   const std::vector<std::string>& person_labels,
                                   size_t* rejected = nullptr);

}  // namespace CloakPII

#endif  // CLOAK_SPAN_PROVIDERS_H_
