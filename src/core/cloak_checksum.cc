#include "cloak/cloak_checksum.h"
#include <algorithm>
#include <cctype>
#include <cstdint>

namespace CloakPII {

namespace {

std::string Strip(const std::string& raw) {
  std::string clean = raw;
  clean.erase(std::remove_if(clean.begin(), clean.end(),
    [](unsigned char c) { return c == '-' || std::isspace(c); }), clean.end());
  return clean;
}

bool AllDigits(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(),
    [](unsigned char c) { return c >= '0' && c <= '9'; });
}

}  // namespace

bool IsValidIBAN(const std::string& iban) {
  std::string raw = Strip(iban);
  std::transform(raw.begin(), raw.end(), raw.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (raw.length() != 27 || raw.compare(0, 2, "FR") != 0) {
    return false;
  }

  // Rearrange: country code and check digits go to the end
  std::string rearranged = raw.substr(4) + raw.substr(0, 4);

  // Letters expand to two decimal digits (A=10 .. Z=35); the remainder is
  // folded in digit by digit so no big integer is needed.
  int remainder = 0;
  for (unsigned char c : rearranged) {
    if (c >= '0' && c <= '9') {
      remainder = (remainder * 10 + (c - '0')) % 97;
    } else if (c >= 'A' && c <= 'Z') {
      remainder = (remainder * 100 + (c - 'A' + 10)) % 97;
    } else {
      return false;
    }
  }

  return remainder == 1;
}

bool IsValidLuhn(const std::string& number) {
  std::string digits;
  digits.reserve(number.size());
  for (unsigned char c : number) {
    if (c >= '0' && c <= '9') {
      digits.push_back(static_cast<char>(c));
    }
  }

  if (digits.length() < 13 || digits.length() > 19) {
    return false;
  }

  int sum = 0;
  bool alternate = false;

  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    int digit = *it - '0';

    if (alternate) {
      digit *= 2;
      if (digit > 9) {
        digit -= 9;
      }
    }

    sum += digit;
    alternate = !alternate;
  }

  return (sum % 10 == 0);
}

bool IsValidNIR(const std::string& nir) {
  std::string num = Strip(nir);
  if (num.length() != 15 || !AllDigits(num)) {
    return false;
  }

  // 13 digits fit comfortably in 64 bits
  uint64_t n = 0;
  for (size_t i = 0; i < 13; ++i) {
    n = n * 10 + static_cast<uint64_t>(num[i] - '0');
  }
  int key = (num[13] - '0') * 10 + (num[14] - '0');

  return static_cast<int>(97 - (n % 97)) == key;
}

}  // namespace CloakPII
