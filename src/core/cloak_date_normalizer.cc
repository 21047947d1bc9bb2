#include "cloak/cloak_date_normalizer.h"
#include <utility>
#include <map>
#include <vector>

namespace CloakPII {

namespace {

struct NumberToken {
  int value;
  size_t digits;
};

// Lower-case and drop the Latin-1 accents used in month names
wchar_t FoldChar(wchar_t c) {
  switch (c) {
    case 0x00E0: case 0x00E2: case 0x00E4: case 0x00C0: case 0x00C2: case 0x00C4:
      return L'a';
    case 0x00E7: case 0x00C7:
      return L'c';
    case 0x00E8: case 0x00E9: case 0x00EA: case 0x00EB:
    case 0x00C8: case 0x00C9: case 0x00CA: case 0x00CB:
      return L'e';
    case 0x00EE: case 0x00EF: case 0x00CE: case 0x00CF:
      return L'i';
    case 0x00F4: case 0x00F6: case 0x00D4: case 0x00D6:
      return L'o';
    case 0x00F9: case 0x00FB: case 0x00FC: case 0x00D9: case 0x00DB: case 0x00DC:
      return L'u';
    default:
      break;
  }
  if (c >= L'A' && c <= L'Z') {
    return static_cast<wchar_t>(c - L'A' + L'a');
  }
  return c;
}

bool IsLetter(wchar_t c) {
  return (c >= L'a' && c <= L'z') || (c >= L'A' && c <= L'Z') ||
         (c >= 0x00C0 && c <= 0x00FF && c != 0x00D7 && c != 0x00F7);
}

int ExpandYear(const NumberToken& token) {
  if (token.digits <= 2) {
    return token.value < 50 ? 2000 + token.value : 1900 + token.value;
  }
  return token.value;
}

}  // namespace

int LenientDateNormalizer::MonthFromName(const std::wstring& word) {
  static const std::map<std::wstring, int> kMonths = {
    {L"janvier", 1}, {L"fevrier", 2}, {L"mars", 3}, {L"avril", 4},
    {L"mai", 5}, {L"juin", 6}, {L"juillet", 7}, {L"aout", 8},
    {L"septembre", 9}, {L"octobre", 10}, {L"novembre", 11}, {L"decembre", 12},
    {L"january", 1}, {L"february", 2}, {L"march", 3}, {L"april", 4},
    {L"may", 5}, {L"june", 6}, {L"july", 7}, {L"august", 8},
    {L"september", 9}, {L"october", 10}, {L"november", 11}, {L"december", 12},
  };

  std::wstring folded;
  folded.reserve(word.size());
  for (wchar_t c : word) {
    folded.push_back(FoldChar(c));
  }

  auto it = kMonths.find(folded);
  return it != kMonths.end() ? it->second : 0;
}

bool LenientDateNormalizer::IsValidDate(int year, int month, int day) {
  if (year < 1 || year > 9999 || month < 1 || month > 12 || day < 1) {
    return false;
  }
  static const int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  int limit = kDaysInMonth[month - 1];
  bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  if (month == 2 && leap) {
    limit = 29;
  }
  return day <= limit;
}

std::optional<int> LenientDateNormalizer::ParseYear(const std::wstring& text,
                                                    bool day_first) const {
  std::vector<NumberToken> numbers;
  int month_from_word = 0;

  size_t i = 0;
  while (i < text.size()) {
    wchar_t c = text[i];

    if (c >= L'0' && c <= L'9') {
      NumberToken token{0, 0};
      while (i < text.size() && text[i] >= L'0' && text[i] <= L'9') {
        if (token.digits < 9) {
          token.value = token.value * 10 + (text[i] - L'0');
        }
        token.digits++;
        i++;
      }
      // Ordinal suffix as in "1er"
      if (i + 1 < text.size() && FoldChar(text[i]) == L'e' && FoldChar(text[i + 1]) == L'r') {
        i += 2;
      }
      numbers.push_back(token);
      continue;
    }

    if (IsLetter(c)) {
      size_t start = i;
      while (i < text.size() && IsLetter(text[i])) {
        i++;
      }
      int month = MonthFromName(text.substr(start, i - start));
      if (month != 0) {
        if (month_from_word != 0) {
          return std::nullopt;  // two month names
        }
        month_from_word = month;
      }
      continue;  // fuzzy: unknown words are skipped
    }

    i++;
  }

  int year = 0;
  int month = 0;
  int day = 0;

  if (month_from_word != 0) {
    // "<day> <month> <year>" or "<month> <day> <year>"
    if (numbers.size() != 2) {
      return std::nullopt;
    }
    const NumberToken* year_token = &numbers[1];
    const NumberToken* day_token = &numbers[0];
    if (numbers[0].digits == 4 && numbers[1].digits <= 2) {
      std::swap(year_token, day_token);
    }
    year = ExpandYear(*year_token);
    month = month_from_word;
    day = day_token->value;
  } else {
    if (numbers.size() != 3) {
      return std::nullopt;
    }
    if (numbers[0].digits == 4) {
      // ISO order
      year = numbers[0].value;
      month = numbers[1].value;
      day = numbers[2].value;
    } else {
      year = ExpandYear(numbers[2]);
      int first = numbers[0].value;
      int second = numbers[1].value;
      if (day_first) {
        day = first;
        month = second;
        if (month > 12 && day <= 12) {
          std::swap(day, month);
        }
      } else {
        month = first;
        day = second;
        if (month > 12 && day <= 12) {
          std::swap(day, month);
        }
      }
    }
  }

  if (!IsValidDate(year, month, day)) {
    return std::nullopt;
  }
  return year;
}

}  // namespace CloakPII
