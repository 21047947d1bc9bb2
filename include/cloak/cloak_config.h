#ifndef CLOAK_CONFIG_H_
#define CLOAK_CONFIG_H_

#include <cstddef>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cloak/cloak_span.h"

namespace CloakPII {

// Defaults
#define CLOAK_DEFAULT_PHONE_REGION "FR"
#define CLOAK_DEFAULT_MAX_PAYLOAD_BYTES 51200  // 50 kB per request or batch

/**
 * Fixed replacement tokens for kinds whose content is fully discarded.
 */
struct MaskTokens {
  std::string address = "ADRESSE";
  std::string vehicle_plate = "IMMATRICULATION";
  std::string driving_license = "PERMIS********";
  std::string unparseable_date = "DATE";
};

/**
 * Engine and CLI configuration.
 *
 * Priority order when the CLI builds one: command-line flags > environment
 * variables > config file > the defaults below.
 */
struct AnonymizerConfig {
  std::string phone_region = CLOAK_DEFAULT_PHONE_REGION;
  char phone_mask_char = 'X';

  // Entity-provider labels treated as person names
  std::vector<std::string> person_labels = {"PER", "PERSON"};

  // Kinds whose detector is skipped entirely
  std::set<EntityKind> disabled_kinds;

  MaskTokens tokens;

  size_t max_payload_bytes = CLOAK_DEFAULT_MAX_PAYLOAD_BYTES;

  // 0 masks batch documents on the calling thread
  size_t worker_threads = 0;

  std::string log_file;
  std::string log_level = "info";

  bool IsKindEnabled(EntityKind kind) const {
    return disabled_kinds.count(kind) == 0;
  }
};

/**
 * Overlay the keys present in a JSON object onto *config. Missing keys keep
 * their current value.
 *
 * @return false with *error set when a key has the wrong type or value
 */
bool ApplyConfigJson(const nlohmann::json& json, AnonymizerConfig* config, std::string* error);

/**
 * Load a JSON configuration file on top of *config.
 *
 * @return false with *error set when the file cannot be read or parsed
 */
bool LoadConfigFile(const std::string& file_path, AnonymizerConfig* config, std::string* error);

/**
 * Parse a whole decimal string as a size. Signs, spaces, trailing characters
 * and overflow are rejected; *out is left untouched on failure.
 */
bool ParseSizeValue(const char* value, size_t* out);

/**
 * Apply CLOAK_MAX_PAYLOAD_SIZE and CLOAK_LOG_LEVEL when set.
 *
 * @return false with *error set when a variable holds an invalid value
 */
bool ApplyConfigEnvironment(AnonymizerConfig* config, std::string* error);

/**
 * Serialize a configuration, e.g. to generate an example file.
 */
nlohmann::json ConfigToJson(const AnonymizerConfig& config);

}  // namespace CloakPII

#endif  // CLOAK_CONFIG_H_
