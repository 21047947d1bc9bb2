#ifndef CLOAK_DATE_NORMALIZER_H_
#define CLOAK_DATE_NORMALIZER_H_

#include <optional>
#include <string>

namespace CloakPII {

/**
 * Extracts the year from a date-like substring.
 *
 * Used by the date maskers, which keep only the year. A failed parse is not
 * an error: the masker falls back to a generic token.
 */
class DateNormalizer {
 public:
  virtual ~DateNormalizer() = default;

  /**
   * @param text Date-like text, e.g. "12/03/1990" or "12 mars 1990"
   * @param day_first True when the day precedes the month in numeric dates
   * @return The year, or std::nullopt when the text is not a valid date
   */
  virtual std::optional<int> ParseYear(const std::wstring& text, bool day_first) const = 0;
};

/**
 * Default normalizer for French text.
 *
 * Understands numeric dates (separators '/', '-', '.'), ISO order when the
 * first field has four digits, and alphabetic dates with French or English
 * month names (case and accents ignored, "1er" accepted). Words that are not
 * month names are skipped. When the field expected to be the day cannot be
 * one (greater than 12 in month position) the two fields are swapped. The
 * result is checked against the calendar, so "31/02/2020" fails.
 */
class LenientDateNormalizer : public DateNormalizer {
 public:
  std::optional<int> ParseYear(const std::wstring& text, bool day_first) const override;

  /**
   * Month number (1..12) for a French or English month name, 0 if unknown.
   */
  static int MonthFromName(const std::wstring& word);

  static bool IsValidDate(int year, int month, int day);
};

}  // namespace CloakPII

#endif  // CLOAK_DATE_NORMALIZER_H_
