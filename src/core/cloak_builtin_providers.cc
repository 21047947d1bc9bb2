#include "cloak/cloak_builtin_providers.h"
#include "cloak/cloak_text.h"
#include "cloak/util/logger.h"

namespace CloakPII {

namespace {

// +33 / 0033 / 0 prefix, one non-zero digit, four pairs of digits
const wchar_t kFrenchPhonePattern[] =
    L"(?:\\+33\\s?(?:\\(0\\)\\s?)?|0033\\s?|0)[1-9](?:[ .\\-]?\\d{2}){4}(?!\\d)";

// Honorific, then one to three capitalized words of at most 63 letters;
// group 1 is the name. Longer words are not names and never match.
std::wstring NameTitlePattern() {
  const std::wstring upper = kUpperLetterClass;
  const std::wstring word = L"[" + upper + L"][" + kLetterClass + L"'\\-]{1,62}";
  const std::wstring word_end = std::wstring(L"(?![") + kLetterClass + L"'\\-])";
  return L"\\b(?:Monsieur|Madame|Mademoiselle|Mme|Mlle|M|Dr|Pr|Me)\\.?\\s{1,16}"
         L"(" + word + word_end + L"(?: " + word + word_end + L"){0,2})";
}

bool IsAsciiAlnum(wchar_t c) {
  return (c >= L'0' && c <= L'9') || (c >= L'a' && c <= L'z') || (c >= L'A' && c <= L'Z');
}

}  // namespace

FrenchPhoneSpanProvider::FrenchPhoneSpanProvider()
    : phone_pattern_(kFrenchPhonePattern, std::regex_constants::ECMAScript) {}

std::vector<PhoneSpan> FrenchPhoneSpanProvider::FindPhones(const std::wstring& text,
                                                           const std::string& region) const {
  std::vector<PhoneSpan> phones;
  if (region != "FR") {
    LOG_DEBUG("PhoneProvider", "Region " + region + " not supported, no phone spans");
    return phones;
  }

  std::wsregex_iterator it(text.begin(), text.end(), phone_pattern_);
  std::wsregex_iterator end;
  for (; it != end; ++it) {
    size_t start = static_cast<size_t>(it->position());
    if (start > 0 && IsAsciiAlnum(text[start - 1])) {
      continue;  // part of a longer token
    }
    phones.push_back({start, start + static_cast<size_t>(it->length())});
  }

  return phones;
}

HonorificNameSpanProvider::HonorificNameSpanProvider()
    : name_title_pattern_(NameTitlePattern(), std::regex_constants::ECMAScript) {}

EntityResult HonorificNameSpanProvider::Detect(const std::wstring& text) const {
  EntityResult result;

  std::wsregex_iterator it(text.begin(), text.end(), name_title_pattern_);
  std::wsregex_iterator end;
  for (; it != end; ++it) {
    size_t start = static_cast<size_t>(it->position(1));
    size_t length = static_cast<size_t>(it->length(1));
    result.spans.push_back({start, start + length, "PER"});
  }

  return result;
}

}  // namespace CloakPII
