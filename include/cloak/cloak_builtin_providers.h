#ifndef CLOAK_BUILTIN_PROVIDERS_H_
#define CLOAK_BUILTIN_PROVIDERS_H_

#include <regex>
#include <string>
#include <vector>

#include "cloak/cloak_span_providers.h"

namespace CloakPII {

/**
 * Pattern-based phone provider for French numbers.
 *
 * Reports national numbers ("06 12 34 56 78", "01.23.45.67.89") and
 * international ones ("+33 6 12 34 56 78", "+33 (0)6...", "0033 6...") with
 * space, dot or dash separators. A number glued to a preceding letter or
 * digit, or followed by another digit, is not reported. Other regions yield
 * no spans.
 */
class FrenchPhoneSpanProvider : public PhoneSpanProvider {
 public:
  FrenchPhoneSpanProvider();

  std::vector<PhoneSpan> FindPhones(const std::wstring& text,
                                    const std::string& region) const override;

 private:
  std::wregex phone_pattern_;
};

/**
 * Heuristic person-name provider: capitalized words following a French
 * honorific (M., Mme, Mlle, Dr, Pr, Me, Monsieur, Madame, Mademoiselle).
 * Spans cover the name only, labeled "PER". A stand-in for a real NER model
 * when none is wired in.
 */
class HonorificNameSpanProvider : public EntitySpanProvider {
 public:
  HonorificNameSpanProvider();

  EntityResult Detect(const std::wstring& text) const override;

 private:
  std::wregex name_title_pattern_;
};

class NullPhoneSpanProvider : public PhoneSpanProvider {
 public:
  std::vector<PhoneSpan> FindPhones(const std::wstring&, const std::string&) const override {
    return {};
  }
};

class NullEntitySpanProvider : public EntitySpanProvider {
 public:
  EntityResult Detect(const std::wstring&) const override { return {}; }
};

}  // namespace CloakPII

#endif  // CLOAK_BUILTIN_PROVIDERS_H_
