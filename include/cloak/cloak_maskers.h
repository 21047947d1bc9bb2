#ifndef CLOAK_MASKERS_H_
#define CLOAK_MASKERS_H_

#include <string>

#include "cloak/cloak_date_normalizer.h"

namespace CloakPII {

// Masking transforms, one per entity kind. Each takes the matched text and
// returns its replacement. Kinds replaced by a fixed category token (address,
// vehicle plate, driving license) need no function; see MaskTokens.

/**
 * "john.doe@example.com" -> "j******e@example.com". Local parts of one or two
 * characters are fully masked. Text without '@' is fully masked.
 */
std::wstring MaskEmail(const std::wstring& email);

/**
 * Separators dropped, last 4 digits kept: "4539 1488 0343 6467" ->
 * "************6467".
 */
std::wstring MaskCard(const std::wstring& card);

/**
 * Digits only, last 2 kept, the rest replaced by mask_char.
 */
std::wstring MaskPhone(const std::wstring& phone, wchar_t mask_char = L'X');

/**
 * "FR************" followed by the last 4 characters of the stripped IBAN.
 */
std::wstring MaskIBAN(const std::wstring& iban);

/**
 * Fixed 12-character mask followed by the last 4 characters of the stripped
 * account number.
 */
std::wstring MaskRIB(const std::wstring& rib);

/**
 * "XX/XX/<year>" when the normalizer finds a valid date, else fallback_token.
 */
std::wstring MaskDate(const std::wstring& date, const DateNormalizer& normalizer,
                      const std::wstring& fallback_token);

/**
 * Fixed 11-character mask followed by the last 4 characters.
 */
std::wstring MaskNationalID(const std::wstring& nir);

/**
 * First 2 and last 2 characters kept, '*' in between.
 */
std::wstring MaskPassport(const std::wstring& passport);

/**
 * First character kept, the rest '*'. A one-character name becomes "*".
 */
std::wstring MaskPerson(const std::wstring& name);

}  // namespace CloakPII

#endif  // CLOAK_MASKERS_H_
