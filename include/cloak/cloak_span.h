#ifndef CLOAK_SPAN_H_
#define CLOAK_SPAN_H_

#include <cstddef>
#include <map>
#include <string>

namespace CloakPII {

/**
 * Kind of PII a span was detected as. Each kind has exactly one masking
 * transform. The closed set below is everything the engine can emit.
 */
enum class EntityKind {
  ADDRESS,
  IBAN,
  RIB,
  DATE_NUMERIC,
  DATE_ALPHA,
  PASSPORT,
  DRIVING_LICENSE,
  VEHICLE_PLATE,
  CARD,
  EMAIL,
  NATIONAL_ID,
  PHONE,
  PERSON
};

// Priorities of the two provider-backed kinds. Registry rules use their table
// index (0..10), so provider spans always lose ties against pattern rules.
constexpr int kPhonePriority = 11;
constexpr int kPersonPriority = 12;

/**
 * A detected PII occurrence: the half-open range [start, end) over the wide
 * text (see cloak_text.h for the unit) and the text that replaces it.
 *
 * Spans are built once by a detector or provider adapter and only read
 * afterwards.
 */
struct Span {
  size_t start = 0;
  size_t end = 0;
  std::wstring replacement;
  EntityKind kind = EntityKind::ADDRESS;
  int priority = 0;  // lower wins when two spans share a start offset

  size_t length() const { return end - start; }
};

/**
 * Counts of masked spans per kind for one call or batch. Never holds text.
 */
struct MaskStats {
  int total_masked = 0;
  std::map<EntityKind, int> by_kind;

  void AddDetection(EntityKind kind) {
    total_masked++;
    by_kind[kind]++;
  }

  void Merge(const MaskStats& other);

  std::string ToString() const;
};

/**
 * Get kind name as string ("EMAIL", "NATIONAL_ID", ...)
 */
std::string GetKindName(EntityKind kind);

/**
 * Parse a kind name as produced by GetKindName (case-insensitive).
 * Returns false when the name is unknown.
 */
bool ParseKindName(const std::string& name, EntityKind* kind);

}  // namespace CloakPII

#endif  // CLOAK_SPAN_H_
