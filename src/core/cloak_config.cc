#include "cloak/cloak_config.h"
#include "cloak/util/logger.h"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace CloakPII {

namespace {

bool ReadString(const json& obj, const char* key, std::string* out, std::string* error) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return true;
  }
  if (!it->is_string()) {
    *error = std::string("'") + key + "' must be a string";
    return false;
  }
  *out = it->get<std::string>();
  return true;
}

bool ReadSize(const json& obj, const char* key, size_t* out, std::string* error) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return true;
  }
  if (!it->is_number_unsigned()) {
    *error = std::string("'") + key + "' must be a non-negative integer";
    return false;
  }
  *out = it->get<size_t>();
  return true;
}

bool ReadStringList(const json& obj, const char* key, std::vector<std::string>* out,
                    std::string* error) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return true;
  }
  if (!it->is_array()) {
    *error = std::string("'") + key + "' must be an array of strings";
    return false;
  }
  std::vector<std::string> values;
  for (const auto& item : *it) {
    if (!item.is_string()) {
      *error = std::string("'") + key + "' must be an array of strings";
      return false;
    }
    values.push_back(item.get<std::string>());
  }
  *out = std::move(values);
  return true;
}

}  // namespace

bool ApplyConfigJson(const json& root, AnonymizerConfig* config, std::string* error) {
  if (!root.is_object()) {
    *error = "configuration root must be a JSON object";
    return false;
  }

  AnonymizerConfig updated = *config;

  if (!ReadString(root, "phone_region", &updated.phone_region, error)) return false;

  std::string mask_char(1, updated.phone_mask_char);
  if (!ReadString(root, "phone_mask_char", &mask_char, error)) return false;
  if (mask_char.size() != 1) {
    *error = "'phone_mask_char' must be a single ASCII character";
    return false;
  }
  updated.phone_mask_char = mask_char[0];

  if (!ReadStringList(root, "person_labels", &updated.person_labels, error)) return false;

  std::vector<std::string> disabled;
  if (!ReadStringList(root, "disabled_kinds", &disabled, error)) return false;
  if (root.contains("disabled_kinds")) {
    updated.disabled_kinds.clear();
    for (const auto& name : disabled) {
      EntityKind kind;
      if (!ParseKindName(name, &kind)) {
        *error = "unknown entity kind in 'disabled_kinds': " + name;
        return false;
      }
      updated.disabled_kinds.insert(kind);
    }
  }

  auto tokens = root.find("tokens");
  if (tokens != root.end()) {
    if (!tokens->is_object()) {
      *error = "'tokens' must be an object";
      return false;
    }
    if (!ReadString(*tokens, "address", &updated.tokens.address, error)) return false;
    if (!ReadString(*tokens, "vehicle_plate", &updated.tokens.vehicle_plate, error)) return false;
    if (!ReadString(*tokens, "driving_license", &updated.tokens.driving_license, error)) return false;
    if (!ReadString(*tokens, "unparseable_date", &updated.tokens.unparseable_date, error)) return false;
  }

  if (!ReadSize(root, "max_payload_bytes", &updated.max_payload_bytes, error)) return false;
  if (!ReadSize(root, "worker_threads", &updated.worker_threads, error)) return false;
  if (!ReadString(root, "log_file", &updated.log_file, error)) return false;
  if (!ReadString(root, "log_level", &updated.log_level, error)) return false;

  CloakLogger::Level level;
  if (!CloakLogger::Logger::ParseLevel(updated.log_level, &level)) {
    *error = "invalid 'log_level': " + updated.log_level;
    return false;
  }

  *config = std::move(updated);
  return true;
}

bool LoadConfigFile(const std::string& file_path, AnonymizerConfig* config, std::string* error) {
  std::ifstream file(file_path);
  if (!file.is_open()) {
    *error = "cannot open config file: " + file_path;
    LOG_ERROR("Config", *error);
    return false;
  }

  json root = json::parse(file, nullptr, /*allow_exceptions=*/false);
  if (root.is_discarded()) {
    *error = "invalid JSON in config file: " + file_path;
    LOG_ERROR("Config", *error);
    return false;
  }

  if (!ApplyConfigJson(root, config, error)) {
    *error = file_path + ": " + *error;
    LOG_ERROR("Config", *error);
    return false;
  }

  LOG_DEBUG("Config", "Loaded configuration from " + file_path);
  return true;
}

bool ParseSizeValue(const char* value, size_t* out) {
  if (value == nullptr || !std::isdigit(static_cast<unsigned char>(value[0]))) {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  unsigned long long parsed = std::strtoull(value, &end, 10);
  if (*end != '\0' || errno == ERANGE) {
    return false;
  }
  *out = static_cast<size_t>(parsed);
  return true;
}

bool ApplyConfigEnvironment(AnonymizerConfig* config, std::string* error) {
  const char* payload = std::getenv("CLOAK_MAX_PAYLOAD_SIZE");
  if (payload != nullptr && *payload != '\0') {
    if (!ParseSizeValue(payload, &config->max_payload_bytes)) {
      *error = std::string("invalid CLOAK_MAX_PAYLOAD_SIZE: ") + payload;
      return false;
    }
  }

  const char* level_name = std::getenv("CLOAK_LOG_LEVEL");
  if (level_name != nullptr && *level_name != '\0') {
    CloakLogger::Level level;
    if (!CloakLogger::Logger::ParseLevel(level_name, &level)) {
      *error = std::string("invalid CLOAK_LOG_LEVEL: ") + level_name;
      return false;
    }
    config->log_level = level_name;
  }

  return true;
}

json ConfigToJson(const AnonymizerConfig& config) {
  json disabled = json::array();
  for (EntityKind kind : config.disabled_kinds) {
    disabled.push_back(GetKindName(kind));
  }

  return json{
    {"phone_region", config.phone_region},
    {"phone_mask_char", std::string(1, config.phone_mask_char)},
    {"person_labels", config.person_labels},
    {"disabled_kinds", disabled},
    {"tokens", {
      {"address", config.tokens.address},
      {"vehicle_plate", config.tokens.vehicle_plate},
      {"driving_license", config.tokens.driving_license},
      {"unparseable_date", config.tokens.unparseable_date},
    }},
    {"max_payload_bytes", config.max_payload_bytes},
    {"worker_threads", config.worker_threads},
    {"log_file", config.log_file},
    {"log_level", config.log_level},
  };
}

}  // namespace CloakPII
