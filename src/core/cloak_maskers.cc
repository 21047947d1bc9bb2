#include "cloak/cloak_maskers.h"
#include "cloak/cloak_text.h"

namespace CloakPII {

namespace {

// Last n units of text, or all of it when shorter
std::wstring Tail(const std::wstring& text, size_t n) {
  return text.size() > n ? text.substr(text.size() - n) : text;
}

}  // namespace

std::wstring MaskEmail(const std::wstring& email) {
  size_t at_pos = email.find(L'@');
  if (at_pos == std::wstring::npos) {
    return std::wstring(email.size(), L'*');
  }

  std::wstring local = email.substr(0, at_pos);
  std::wstring domain = email.substr(at_pos + 1);

  std::wstring masked_local;
  if (local.size() <= 2) {
    masked_local.assign(local.size(), L'*');
  } else {
    masked_local = local.front() + std::wstring(local.size() - 2, L'*') + local.back();
  }
  return masked_local + L"@" + domain;
}

std::wstring MaskCard(const std::wstring& card) {
  std::wstring digits = DigitsOnly(card);
  size_t keep = digits.size() < 4 ? digits.size() : 4;
  return std::wstring(digits.size() - keep, L'*') + Tail(digits, keep);
}

std::wstring MaskPhone(const std::wstring& phone, wchar_t mask_char) {
  std::wstring digits = DigitsOnly(phone);
  size_t keep = digits.size() < 2 ? digits.size() : 2;
  return std::wstring(digits.size() - keep, mask_char) + Tail(digits, keep);
}

std::wstring MaskIBAN(const std::wstring& iban) {
  return L"FR************" + Tail(StripSeparators(iban), 4);
}

std::wstring MaskRIB(const std::wstring& rib) {
  return L"************" + Tail(StripSeparators(rib), 4);
}

std::wstring MaskDate(const std::wstring& date, const DateNormalizer& normalizer,
                      const std::wstring& fallback_token) {
  std::optional<int> year = normalizer.ParseYear(date, /*day_first=*/true);
  if (!year) {
    return fallback_token;
  }
  return L"XX/XX/" + std::to_wstring(*year);
}

std::wstring MaskNationalID(const std::wstring& nir) {
  return L"***********" + Tail(nir, 4);
}

std::wstring MaskPassport(const std::wstring& passport) {
  if (passport.size() <= 4) {
    return std::wstring(passport.size(), L'*');
  }
  return passport.substr(0, 2) + std::wstring(passport.size() - 4, L'*') + Tail(passport, 2);
}

std::wstring MaskPerson(const std::wstring& name) {
  if (name.size() <= 1) {
    return L"*";
  }
  return name.front() + std::wstring(name.size() - 1, L'*');
}

}  // namespace CloakPII
