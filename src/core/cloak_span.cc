#include "cloak/cloak_span.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace CloakPII {

std::string GetKindName(EntityKind kind) {
  switch (kind) {
    case EntityKind::ADDRESS: return "ADDRESS";
    case EntityKind::IBAN: return "IBAN";
    case EntityKind::RIB: return "RIB";
    case EntityKind::DATE_NUMERIC: return "DATE_NUMERIC";
    case EntityKind::DATE_ALPHA: return "DATE_ALPHA";
    case EntityKind::PASSPORT: return "PASSPORT";
    case EntityKind::DRIVING_LICENSE: return "DRIVING_LICENSE";
    case EntityKind::VEHICLE_PLATE: return "VEHICLE_PLATE";
    case EntityKind::CARD: return "CARD";
    case EntityKind::EMAIL: return "EMAIL";
    case EntityKind::NATIONAL_ID: return "NATIONAL_ID";
    case EntityKind::PHONE: return "PHONE";
    case EntityKind::PERSON: return "PERSON";
    default: return "UNKNOWN";
  }
}

bool ParseKindName(const std::string& name, EntityKind* kind) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  for (int i = static_cast<int>(EntityKind::ADDRESS);
       i <= static_cast<int>(EntityKind::PERSON); i++) {
    EntityKind candidate = static_cast<EntityKind>(i);
    if (GetKindName(candidate) == upper) {
      *kind = candidate;
      return true;
    }
  }
  return false;
}

void MaskStats::Merge(const MaskStats& other) {
  total_masked += other.total_masked;
  for (const auto& [kind, count] : other.by_kind) {
    by_kind[kind] += count;
  }
}

std::string MaskStats::ToString() const {
  std::stringstream ss;
  ss << "Masking stats: " << total_masked << " span(s) masked";
  if (!by_kind.empty()) {
    ss << " (";
    bool first = true;
    for (const auto& [kind, count] : by_kind) {
      if (!first) ss << ", ";
      ss << GetKindName(kind) << ":" << count;
      first = false;
    }
    ss << ")";
  }
  return ss.str();
}

}  // namespace CloakPII
