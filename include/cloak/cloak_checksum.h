#ifndef CLOAK_CHECKSUM_H_
#define CLOAK_CHECKSUM_H_

#include <string>

namespace CloakPII {

// Checksum validators gating pattern matches. All of them strip whitespace
// and dashes first, never throw, and treat any malformed input as invalid.

/**
 * Validate a French IBAN using the ISO 7064 mod-97-10 checksum.
 *
 * Requires "FR" + 25 alphanumerics (27 characters after stripping, letters
 * case-insensitive). The first 4 characters move to the end, letters map to
 * 10..35, and the resulting number must be 1 modulo 97.
 */
bool IsValidIBAN(const std::string& iban);

/**
 * Validate a payment card number using the Luhn algorithm.
 *
 * Non-digit characters are ignored; 13 to 19 digits are required.
 */
bool IsValidLuhn(const std::string& number);

/**
 * Validate a French NIR (social security number) key.
 *
 * Requires exactly 15 digits: the first 13 form n, the last 2 the key, and
 * 97 - (n mod 97) must equal the key.
 */
bool IsValidNIR(const std::string& nir);

}  // namespace CloakPII

#endif  // CLOAK_CHECKSUM_H_
