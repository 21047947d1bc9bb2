#include "cloak/cloak_detector_registry.h"
#include "cloak/cloak_checksum.h"
#include "cloak/cloak_maskers.h"
#include "cloak/cloak_text.h"
#include "cloak/util/logger.h"
#include <exception>

namespace CloakPII {

namespace {

// House number, free text, optional comma, postal code, capitalized locality
std::wstring AddressPattern() {
  const std::wstring upper = kUpperLetterClass;
  const std::wstring letter = kLetterClass;
  return L"\\b\\d{1,4}\\s{1,16}[^,\\n]{2,80},?\\s{1,16}\\d{5}\\s{1,16}"
         L"[" + upper + L"][" + letter + L"\\-\\s]{1,49}[" + letter + L"]"
         L"(?![" + letter + L"])";
}

// FR + 2 check digits + 23 alphanumerics, optionally grouped by 4
const wchar_t kIbanPattern[] =
    L"\\bFR[0-9A-Za-z]{2}(?:\\s?[0-9A-Za-z]{4}){5}\\s?[0-9A-Za-z]{3}(?![0-9A-Za-z])";

const wchar_t kRibPattern[] =
    L"\\b\\d{5}\\s?\\d{5}\\s?\\d{11}\\s?\\d{2}\\b";

const wchar_t kDateNumericPattern[] =
    L"\\b\\d{1,2}/\\d{1,2}/\\d{4}\\b";

// Compiled case-insensitive; accented capitals listed next to their
// lower-case forms
const wchar_t kDateAlphaPattern[] =
    L"\\b\\d{1,2} (?:janvier|f[e\u00E9\u00C9]vrier|mars|avril|mai|juin|juillet|"
    L"ao[u\u00FB\u00DB]t|septembre|octobre|novembre|d[e\u00E9\u00C9]cembre) \\d{4}\\b";

const wchar_t kPassportPattern[] =
    L"\\b\\d{2}[A-Za-z]{2}\\d{5}\\b";

const wchar_t kDrivingLicensePattern[] =
    L"\\b\\d{12}\\b";

const wchar_t kVehiclePlatePattern[] =
    L"\\b[A-Za-z]{2}-\\d{3}-[A-Za-z]{2}\\b";

// 13-16 digits, single space or dash allowed between digits
const wchar_t kCardPattern[] =
    L"\\b\\d(?:[ \\-]?\\d){12,15}\\b";

// Local part, domain and top-level label bounded to 64, 253 and 63: the
// libstdc++ matcher recurses once per repeated character.
const wchar_t kEmailPattern[] =
    L"\\b[A-Za-z0-9._%+\\-]{1,64}@[A-Za-z0-9.\\-]{1,253}\\.[A-Za-z]{2,63}\\b";

const wchar_t kNationalIdPattern[] =
    L"\\b[12]\\d{14}\\b";

// Checksum validators work on ASCII; anything else fails closed
std::function<bool(const std::wstring&)> AsciiValidator(bool (*check)(const std::string&)) {
  return [check](const std::wstring& match) {
    std::string ascii;
    if (!WideToAscii(match, &ascii)) {
      return false;
    }
    return check(ascii);
  };
}

std::function<std::wstring(const std::wstring&)> FixedToken(const std::string& token) {
  std::wstring wide = Utf8ToWide(token);
  return [wide](const std::wstring&) { return wide; };
}

}  // namespace

DetectorRegistry::DetectorRegistry(const AnonymizerConfig& config,
                                   std::shared_ptr<const DateNormalizer> date_normalizer)
    : date_normalizer_(std::move(date_normalizer)) {
  if (!date_normalizer_) {
    date_normalizer_ = std::make_shared<LenientDateNormalizer>();
  }
  InitializeRules(config);
}

void DetectorRegistry::InitializeRules(const AnonymizerConfig& config) {
  const auto ecma = std::regex_constants::ECMAScript;
  const auto icase = std::regex_constants::ECMAScript | std::regex_constants::icase;

  std::shared_ptr<const DateNormalizer> normalizer = date_normalizer_;
  std::wstring date_fallback = Utf8ToWide(config.tokens.unparseable_date);
  // A failing normalizer counts as an unparseable date
  auto date_masker = [normalizer, date_fallback](const std::wstring& match) {
    try {
      return MaskDate(match, *normalizer, date_fallback);
    } catch (const std::exception& e) {
      LOG_WARN("DetectorRegistry", std::string("Date normalizer failed: ") + e.what());
    } catch (...) {
      LOG_WARN("DetectorRegistry", "Date normalizer failed with a non-standard exception");
    }
    return date_fallback;
  };

  // The full table, in priority order. Disabled kinds are skipped below
  // without renumbering, so priorities stay stable across configurations.
  std::vector<DetectorRule> table;
  table.push_back({EntityKind::ADDRESS, 0, "address",
                   std::wregex(AddressPattern(), ecma),
                   FixedToken(config.tokens.address), nullptr});
  table.push_back({EntityKind::IBAN, 1, "iban",
                   std::wregex(kIbanPattern, ecma),
                   MaskIBAN, AsciiValidator(IsValidIBAN)});
  table.push_back({EntityKind::RIB, 2, "rib",
                   std::wregex(kRibPattern, ecma),
                   MaskRIB, nullptr});
  table.push_back({EntityKind::DATE_NUMERIC, 3, "date_numeric",
                   std::wregex(kDateNumericPattern, ecma),
                   date_masker, nullptr});
  table.push_back({EntityKind::DATE_ALPHA, 4, "date_alpha",
                   std::wregex(kDateAlphaPattern, icase),
                   date_masker, nullptr});
  table.push_back({EntityKind::PASSPORT, 5, "passport",
                   std::wregex(kPassportPattern, ecma),
                   MaskPassport, nullptr});
  table.push_back({EntityKind::DRIVING_LICENSE, 6, "driving_license",
                   std::wregex(kDrivingLicensePattern, ecma),
                   FixedToken(config.tokens.driving_license), nullptr});
  table.push_back({EntityKind::VEHICLE_PLATE, 7, "vehicle_plate",
                   std::wregex(kVehiclePlatePattern, ecma),
                   FixedToken(config.tokens.vehicle_plate), nullptr});
  table.push_back({EntityKind::CARD, 8, "card",
                   std::wregex(kCardPattern, ecma),
                   MaskCard, AsciiValidator(IsValidLuhn)});
  table.push_back({EntityKind::EMAIL, 9, "email",
                   std::wregex(kEmailPattern, ecma),
                   MaskEmail, nullptr});
  table.push_back({EntityKind::NATIONAL_ID, 10, "national_id",
                   std::wregex(kNationalIdPattern, ecma),
                   MaskNationalID, AsciiValidator(IsValidNIR)});

  for (auto& rule : table) {
    if (!config.IsKindEnabled(rule.kind)) {
      LOG_DEBUG("DetectorRegistry", "Rule " + rule.name + " disabled");
      continue;
    }
    rules_.push_back(std::move(rule));
  }

  LOG_DEBUG("DetectorRegistry", "Initialized " + std::to_string(rules_.size()) + " rule(s)");
}

const DetectorRule* DetectorRegistry::FindRule(EntityKind kind) const {
  for (const auto& rule : rules_) {
    if (rule.kind == kind) {
      return &rule;
    }
  }
  return nullptr;
}

int DetectorRegistry::PriorityOf(EntityKind kind) {
  switch (kind) {
    case EntityKind::ADDRESS: return 0;
    case EntityKind::IBAN: return 1;
    case EntityKind::RIB: return 2;
    case EntityKind::DATE_NUMERIC: return 3;
    case EntityKind::DATE_ALPHA: return 4;
    case EntityKind::PASSPORT: return 5;
    case EntityKind::DRIVING_LICENSE: return 6;
    case EntityKind::VEHICLE_PLATE: return 7;
    case EntityKind::CARD: return 8;
    case EntityKind::EMAIL: return 9;
    case EntityKind::NATIONAL_ID: return 10;
    default: return -1;
  }
}

}  // namespace CloakPII
