#include "cloak/cloak_text.h"
#include <cstdint>
#include <cwctype>

namespace CloakPII {

namespace {

constexpr wchar_t kReplacementChar = 0xFFFD;

inline bool IsContinuation(unsigned char c) {
  return (c & 0xC0) == 0x80;
}

}  // namespace

std::wstring Utf8ToWide(const std::string& utf8) {
  std::wstring out;
  out.reserve(utf8.size());

  const auto* bytes = reinterpret_cast<const unsigned char*>(utf8.data());
  const size_t size = utf8.size();
  size_t i = 0;

  while (i < size) {
    const unsigned char c0 = bytes[i];
    if (c0 <= 0x7F) {
      out.push_back(static_cast<wchar_t>(c0));
      ++i;
      continue;
    }

    size_t len = 0;
    uint32_t cp = 0;
    if (c0 >= 0xC2 && c0 <= 0xDF) {
      len = 2;
      cp = c0 & 0x1F;
    } else if (c0 >= 0xE0 && c0 <= 0xEF) {
      len = 3;
      cp = c0 & 0x0F;
    } else if (c0 >= 0xF0 && c0 <= 0xF4) {
      len = 4;
      cp = c0 & 0x07;
    } else {
      out.push_back(kReplacementChar);
      ++i;
      continue;
    }

    if (i + len > size) {
      out.push_back(kReplacementChar);
      break;
    }

    bool ok = true;
    for (size_t k = 1; k < len; ++k) {
      if (!IsContinuation(bytes[i + k])) {
        ok = false;
        break;
      }
    }

    // Overlong forms, surrogates and values above U+10FFFF
    const unsigned char c1 = bytes[i + 1];
    if (ok && len == 3) {
      if (c0 == 0xE0 && c1 < 0xA0) ok = false;
      if (c0 == 0xED && c1 >= 0xA0) ok = false;
    } else if (ok && len == 4) {
      if (c0 == 0xF0 && c1 < 0x90) ok = false;
      if (c0 == 0xF4 && c1 > 0x8F) ok = false;
    }

    if (!ok) {
      out.push_back(kReplacementChar);
      ++i;
      continue;
    }

    for (size_t k = 1; k < len; ++k) {
      cp = (cp << 6) | (bytes[i + k] & 0x3F);
    }
    out.push_back(static_cast<wchar_t>(cp));
    i += len;
  }

  return out;
}

std::string WideToUtf8(const std::wstring& wide) {
  std::string out;
  out.reserve(wide.size());

  for (wchar_t wc : wide) {
    uint32_t cp = static_cast<uint32_t>(wc);
    if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
      cp = kReplacementChar;
    }

    if (cp <= 0x7F) {
      out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  return out;
}

std::wstring StripSeparators(const std::wstring& text) {
  std::wstring out;
  out.reserve(text.size());
  for (wchar_t c : text) {
    if (c == L'-' || std::iswspace(static_cast<wint_t>(c))) {
      continue;
    }
    out.push_back(c);
  }
  return out;
}

std::wstring DigitsOnly(const std::wstring& text) {
  std::wstring out;
  out.reserve(text.size());
  for (wchar_t c : text) {
    if (c >= L'0' && c <= L'9') {
      out.push_back(c);
    }
  }
  return out;
}

bool WideToAscii(const std::wstring& wide, std::string* out) {
  out->clear();
  out->reserve(wide.size());
  for (wchar_t c : wide) {
    if (c < 0 || c > 0x7F) {
      return false;
    }
    out->push_back(static_cast<char>(c));
  }
  return true;
}

}  // namespace CloakPII
