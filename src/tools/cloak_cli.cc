#include <cstring>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cloak/cloak_anonymizer.h"
#include "cloak/cloak_batch_pipeline.h"
#include "cloak/cloak_config.h"
#include "cloak/util/logger.h"

using json = nlohmann::json;

namespace {

const int kExitOk = 0;
const int kExitUsage = 1;
const int kExitConfig = 2;
const int kExitPayload = 3;

void PrintUsage(const char* program) {
  std::cout << "Usage: " << program << " [options] < input\n\n";
  std::cout << "Masks personal data in French text read from stdin.\n\n";
  std::cout << "Options:\n";
  std::cout << "  --config FILE         Load JSON configuration\n";
  std::cout << "  --batch               Read {\"texts\": [...]}, write {\"anonymized_text\": [...]}\n";
  std::cout << "  --stats               Print masking counts to stderr\n";
  std::cout << "  --workers N           Mask batch documents on N threads\n";
  std::cout << "  --log-file FILE       Also append log lines to FILE\n";
  std::cout << "  --verbose             Log at debug level\n";
  std::cout << "  --print-config        Print the effective configuration and exit\n";
  std::cout << "  --help                Show this help message\n\n";
  std::cout << "Environment:\n";
  std::cout << "  CLOAK_MAX_PAYLOAD_SIZE  Maximum input size in bytes (default: "
            << CLOAK_DEFAULT_MAX_PAYLOAD_BYTES << ")\n";
  std::cout << "  CLOAK_LOG_LEVEL         debug, info, warn or error\n";
}

// Batch input: {"texts": ["...", ...]}
bool ParseBatch(const std::string& input, std::vector<std::string>* texts, std::string* error) {
  json root = json::parse(input, nullptr, /*allow_exceptions=*/false);
  if (root.is_discarded() || !root.is_object()) {
    *error = "batch input must be a JSON object";
    return false;
  }
  auto it = root.find("texts");
  if (it == root.end() || !it->is_array()) {
    *error = "batch input must contain a 'texts' array";
    return false;
  }
  for (const auto& item : *it) {
    if (!item.is_string()) {
      *error = "every entry of 'texts' must be a string";
      return false;
    }
    texts->push_back(item.get<std::string>());
  }
  if (texts->empty()) {
    *error = "batch input must contain at least one text";
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string log_file;
  bool batch = false;
  bool print_stats = false;
  bool verbose = false;
  bool print_config = false;
  bool workers_set = false;
  size_t workers = 0;

  for (int i = 1; i < argc; i++) {
    if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      PrintUsage(argv[0]);
      return kExitOk;
    } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (strcmp(argv[i], "--batch") == 0) {
      batch = true;
    } else if (strcmp(argv[i], "--stats") == 0) {
      print_stats = true;
    } else if (strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
      if (!CloakPII::ParseSizeValue(argv[++i], &workers)) {
        std::cerr << "Invalid value for --workers: " << argv[i] << std::endl;
        return kExitUsage;
      }
      workers_set = true;
    } else if (strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
      log_file = argv[++i];
    } else if (strcmp(argv[i], "--verbose") == 0 || strcmp(argv[i], "-v") == 0) {
      verbose = true;
    } else if (strcmp(argv[i], "--print-config") == 0) {
      print_config = true;
    } else {
      std::cerr << "Unknown option: " << argv[i] << std::endl;
      PrintUsage(argv[0]);
      return kExitUsage;
    }
  }

  // Defaults < config file < environment < command line
  CloakPII::AnonymizerConfig config;
  std::string error;
  if (!config_path.empty() && !CloakPII::LoadConfigFile(config_path, &config, &error)) {
    std::cerr << "Configuration error: " << error << std::endl;
    return kExitConfig;
  }
  if (!CloakPII::ApplyConfigEnvironment(&config, &error)) {
    LOG_ERROR("Config", error);
    std::cerr << "Configuration error: " << error << std::endl;
    return kExitConfig;
  }
  if (!log_file.empty()) {
    config.log_file = log_file;
  }
  if (verbose) {
    config.log_level = "debug";
  }
  if (workers_set) {
    config.worker_threads = workers;
  }

  if (config.log_file.empty()) {
    CloakLogger::Logger::Init();
  } else {
    CloakLogger::Logger::Init(config.log_file);
  }
  CloakLogger::Level level = CloakLogger::INFO;
  if (!CloakLogger::Logger::ParseLevel(config.log_level, &level)) {
    std::cerr << "Configuration error: invalid log level: " << config.log_level << std::endl;
    return kExitConfig;
  }
  CloakLogger::Logger::SetLevel(level);

  if (print_config) {
    std::cout << CloakPII::ConfigToJson(config).dump(2) << std::endl;
    return kExitOk;
  }

  std::string input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());

  CloakPII::Anonymizer anonymizer(config);
  CloakPII::MaskStats stats;

  if (!batch) {
    if (input.size() > config.max_payload_bytes) {
      LOG_ERROR("CLI", "Payload of " + std::to_string(input.size()) + " bytes exceeds limit of " +
                std::to_string(config.max_payload_bytes));
      std::cerr << "Payload too large" << std::endl;
      return kExitPayload;
    }
    std::cout << anonymizer.Anonymize(input, &stats);
  } else {
    std::vector<std::string> texts;
    if (!ParseBatch(input, &texts, &error)) {
      LOG_ERROR("CLI", error);
      std::cerr << "Invalid batch: " << error << std::endl;
      return kExitUsage;
    }

    size_t total = 0;
    for (const auto& text : texts) {
      total += text.size();
    }
    if (total > config.max_payload_bytes) {
      LOG_ERROR("CLI", "Batch of " + std::to_string(total) + " bytes exceeds limit of " +
                std::to_string(config.max_payload_bytes));
      std::cerr << "Payload too large" << std::endl;
      return kExitPayload;
    }

    CloakPII::BatchPipeline pipeline(anonymizer, config.worker_threads);
    std::vector<std::string> masked = pipeline.AnonymizeMany(texts, &stats);

    json output = {{"anonymized_text", masked}};
    // Replace rather than throw on invalid UTF-8 carried through untouched documents
    std::cout << output.dump(-1, ' ', false, json::error_handler_t::replace) << std::endl;
  }

  if (print_stats) {
    std::cerr << stats.ToString() << std::endl;
  }
  LOG_DEBUG("CLI", stats.ToString());

  return kExitOk;
}
