#ifndef CLOAK_TEXT_H_
#define CLOAK_TEXT_H_

#include <string>

namespace CloakPII {

// Text indexing convention
//
// Every offset in the engine (detector matches, provider spans, Span::start
// and Span::end) counts wchar_t units of the std::wstring produced by
// Utf8ToWide. wchar_t is 32 bits on Linux and macOS, so one unit is one code
// point. UTF-8 is decoded once on the way in and encoded once on the way out;
// nothing in between sees bytes.

// Bracket-expression bodies for Latin-1 letters, for building patterns.
// std::wregex case folding only covers ASCII in the default locale, so the
// accented ranges are listed explicitly.
constexpr wchar_t kUpperLetterClass[] = L"A-Z\u00C0-\u00D6\u00D8-\u00DE";
constexpr wchar_t kLetterClass[] = L"A-Za-z\u00C0-\u00D6\u00D8-\u00F6\u00F8-\u00FF";

/**
 * Decode UTF-8 into wide text. Invalid or truncated sequences, overlong
 * forms and surrogates become U+FFFD; decoding never fails.
 */
std::wstring Utf8ToWide(const std::string& utf8);

/**
 * Encode wide text as UTF-8. Unpaired surrogates and values above U+10FFFF
 * become U+FFFD.
 */
std::string WideToUtf8(const std::wstring& wide);

/**
 * Remove whitespace and dashes (identifier separators such as in IBANs and
 * card numbers).
 */
std::wstring StripSeparators(const std::wstring& text);

/**
 * Keep ASCII digits only.
 */
std::wstring DigitsOnly(const std::wstring& text);

/**
 * Narrow an ASCII-only wide string. Returns false when any unit is outside
 * the ASCII range, leaving *out unspecified.
 */
bool WideToAscii(const std::wstring& wide, std::string* out);

}  // namespace CloakPII

#endif  // CLOAK_TEXT_H_
