/**
 * Guardian - Configuration
 *
 * Sources, lowest priority first: built-in defaults, JSON config file,
 * environment variables, command-line flags (applied by the caller).
 */

#ifndef GUARDIAN_CONFIG_H_
#define GUARDIAN_CONFIG_H_

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "guardian_contextual_recognizer.h"
#include "guardian_mode_policy.h"

namespace GuardianPII {

#define GUARDIAN_DEFAULT_MODE "balanced"
#define GUARDIAN_DEFAULT_NER_TIMEOUT_MS 2000
#define GUARDIAN_DEFAULT_NER_MAX_LENGTH 2048
#define GUARDIAN_DEFAULT_BATCH_WORKERS 4

// External NER service. When disabled the built-in keyword recognizer
// is used unless that is switched off too.
struct NerConfig {
  bool enabled = false;
  std::string url;
  std::string api_key;
  int timeout_ms = GUARDIAN_DEFAULT_NER_TIMEOUT_MS;
  size_t max_length = GUARDIAN_DEFAULT_NER_MAX_LENGTH;
  size_t concurrency = 1;
  bool keyword_fallback = true;
};

struct BatchConfig {
  size_t workers = GUARDIAN_DEFAULT_BATCH_WORKERS;
};

struct LogConfig {
  std::string level = "info";
  std::string file;  // Empty logs to stderr only
};

struct GuardianConfig {
  std::string mode = GUARDIAN_DEFAULT_MODE;
  ModePolicy policy;  // The preset for |mode|, possibly overridden
  NerConfig ner;
  BatchConfig batch;
  LogConfig log;
};

enum class ConfigStatus {
  OK,
  FILE_ERROR,
  PARSE_ERROR,
  INVALID_VALUE
};

std::string ConfigStatusToString(ConfigStatus status);

struct ConfigResult {
  ConfigStatus status = ConfigStatus::OK;
  std::string error;

  bool success() const { return status == ConfigStatus::OK; }
};

// Defaults with the balanced preset
GuardianConfig DefaultConfig();

// Selects a named preset. Unknown names are rejected.
ConfigResult SetMode(const std::string& mode, GuardianConfig* config);

/**
 * Load a JSON config file on top of |config|.
 *
 * {
 *   "mode": "balanced",
 *   "policy": {"base_threshold": 0.6, "aggressive_regex": "on",
 *              "afn_passes": "double", "accept_invalid_checksum": true,
 *              "afn_trigger_below": 3},
 *   "ner": {"enabled": true, "url": "http://localhost:8000", "api_key": "",
 *           "timeout_ms": 2000, "max_length": 2048, "concurrency": 2,
 *           "keyword_fallback": true},
 *   "batch": {"workers": 8},
 *   "log": {"level": "info", "file": "/var/log/guardian.log"}
 * }
 *
 * Any "policy" field turns the selected preset into a custom policy.
 */
ConfigResult LoadConfigFile(const std::string& path, GuardianConfig* config);

// Same as LoadConfigFile for an already parsed document
ConfigResult ApplyConfigJson(const nlohmann::json& root, GuardianConfig* config);

/**
 * Apply environment variables on top of |config|.
 *
 *   GUARDIAN_MODE            - strict, balanced or precise
 *   GUARDIAN_NER_URL         - NER service base URL (enables the client)
 *   GUARDIAN_NER_API_KEY     - Bearer token for the NER service
 *   GUARDIAN_NER_TIMEOUT_MS  - Recognizer timeout in ms
 *   GUARDIAN_NER_MAX_LENGTH  - Bytes sent to the recognizer
 *   GUARDIAN_BATCH_WORKERS   - Batch worker threads
 *   GUARDIAN_LOG_LEVEL       - debug, info, warn or error
 *   GUARDIAN_LOG_FILE        - Append log lines to this file
 */
ConfigResult ApplyEnvironment(GuardianConfig* config);

// Range checks. Run once before any detection.
ConfigResult ValidateConfig(const GuardianConfig& config);

// NER client, keyword recognizer, or nullptr for regex-only
std::shared_ptr<ContextualRecognizer> CreateRecognizer(const GuardianConfig& config);

}  // namespace GuardianPII

#endif  // GUARDIAN_CONFIG_H_
