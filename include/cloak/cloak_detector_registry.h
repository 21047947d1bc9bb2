#ifndef CLOAK_DETECTOR_REGISTRY_H_
#define CLOAK_DETECTOR_REGISTRY_H_

#include <functional>
#include <memory>
#include <regex>
#include <string>
#include <vector>

#include "cloak/cloak_config.h"
#include "cloak/cloak_date_normalizer.h"
#include "cloak/cloak_span.h"

namespace CloakPII {

/**
 * One pattern detector: every non-overlapping match of `pattern` that passes
 * `validator` (when set) becomes a span replaced by `masker(match)`.
 */
struct DetectorRule {
  EntityKind kind;
  int priority;  // index in the priority table, lower wins ties
  std::string name;
  std::wregex pattern;
  std::function<std::wstring(const std::wstring&)> masker;
  std::function<bool(const std::wstring&)> validator;  // empty = accept all
};

/**
 * DetectorRegistry - the ordered priority table of pattern detectors.
 *
 * The order is part of the contract: when two spans start at the same offset
 * the one from the earlier rule is kept. Broad structural patterns (address,
 * IBAN) come before narrow digit-run patterns so that a coincidental digit
 * run never shadows a more specific match.
 *
 *   0 ADDRESS          house number, street, 5-digit postal code, locality
 *   1 IBAN             French IBAN, mod-97 validated
 *   2 RIB              5+5+11+2 digit bank account
 *   3 DATE_NUMERIC     dd/mm/yyyy
 *   4 DATE_ALPHA       12 mars 1990
 *   5 PASSPORT         2 digits, 2 letters, 5 digits
 *   6 DRIVING_LICENSE  12 consecutive digits
 *   7 VEHICLE_PLATE    AA-123-AA
 *   8 CARD             13-16 digits, Luhn validated
 *   9 EMAIL            local@domain.tld
 *  10 NATIONAL_ID      NIR, 15 digits, key validated
 *
 * Built once from a configuration and immutable afterwards, so one instance
 * can be shared by any number of threads.
 *
 * Usage:
 *   DetectorRegistry registry(config, std::make_shared<LenientDateNormalizer>());
 *   for (const DetectorRule& rule : registry.rules()) { ... }
 */
class DetectorRegistry {
 public:
  DetectorRegistry(const AnonymizerConfig& config,
                   std::shared_ptr<const DateNormalizer> date_normalizer);

  DetectorRegistry(const DetectorRegistry&) = delete;
  DetectorRegistry& operator=(const DetectorRegistry&) = delete;

  /**
   * Enabled rules in priority order.
   */
  const std::vector<DetectorRule>& rules() const { return rules_; }

  /**
   * Rule for a kind, or nullptr when the kind is disabled or not pattern-based.
   */
  const DetectorRule* FindRule(EntityKind kind) const;

  /**
   * Priority of a pattern kind in the full table, regardless of whether it is
   * enabled. Returns -1 for provider-backed kinds (PHONE, PERSON).
   */
  static int PriorityOf(EntityKind kind);

 private:
  void InitializeRules(const AnonymizerConfig& config);

  std::shared_ptr<const DateNormalizer> date_normalizer_;
  std::vector<DetectorRule> rules_;
};

}  // namespace CloakPII

#endif  // CLOAK_DETECTOR_REGISTRY_H_
