#include "guardian_config.h"
#include "guardian_keyword_recognizer.h"
#include "guardian_ner_client.h"
#include "logger.h"
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace GuardianPII {

namespace {

ConfigResult Fail(ConfigStatus status, const std::string& error) {
  ConfigResult result;
  result.status = status;
  result.error = error;
  return result;
}

// Reads a positive integer, rejecting trailing garbage
bool ParsePositive(const char* value, long* out) {
  if (!value || !*value) return false;
  char* end = nullptr;
  long parsed = std::strtol(value, &end, 10);
  if (*end != '\0' || parsed <= 0) return false;
  *out = parsed;
  return true;
}

bool ReadPositive(const json& object, const char* key, long* out, std::string* error) {
  auto it = object.find(key);
  if (it == object.end()) return true;
  if (!it->is_number_integer() || it->get<long>() <= 0) {
    *error = std::string(key) + " must be a positive integer";
    return false;
  }
  *out = it->get<long>();
  return true;
}

bool ReadString(const json& object, const char* key, std::string* out, std::string* error) {
  auto it = object.find(key);
  if (it == object.end()) return true;
  if (!it->is_string()) {
    *error = std::string(key) + " must be a string";
    return false;
  }
  *out = it->get<std::string>();
  return true;
}

bool ReadBool(const json& object, const char* key, bool* out, std::string* error) {
  auto it = object.find(key);
  if (it == object.end()) return true;
  if (!it->is_boolean()) {
    *error = std::string(key) + " must be true or false";
    return false;
  }
  *out = it->get<bool>();
  return true;
}

ConfigResult ApplyPolicyJson(const json& block, GuardianConfig* config) {
  if (!block.is_object()) {
    return Fail(ConfigStatus::INVALID_VALUE, "policy must be an object");
  }
  ModePolicy& policy = config->policy;
  std::string error;
  bool overridden = false;

  if (block.contains("base_threshold")) {
    if (!block["base_threshold"].is_number()) {
      return Fail(ConfigStatus::INVALID_VALUE, "base_threshold must be a number");
    }
    policy.base_threshold = block["base_threshold"].get<double>();
    overridden = true;
  }

  std::string name;
  if (!ReadString(block, "aggressive_regex", &name, &error)) {
    return Fail(ConfigStatus::INVALID_VALUE, error);
  }
  if (!name.empty()) {
    if (!ParseAggressiveRegex(name, &policy.aggressive_regex)) {
      return Fail(ConfigStatus::INVALID_VALUE, "unknown aggressive_regex '" + name + "'");
    }
    overridden = true;
  }

  name.clear();
  if (!ReadString(block, "afn_passes", &name, &error)) {
    return Fail(ConfigStatus::INVALID_VALUE, error);
  }
  if (!name.empty()) {
    if (!ParseAfnPasses(name, &policy.afn_passes)) {
      return Fail(ConfigStatus::INVALID_VALUE, "unknown afn_passes '" + name + "'");
    }
    overridden = true;
  }

  if (block.contains("accept_invalid_checksum")) {
    if (!ReadBool(block, "accept_invalid_checksum", &policy.accept_invalid_checksum, &error)) {
      return Fail(ConfigStatus::INVALID_VALUE, error);
    }
    overridden = true;
  }

  long trigger = 0;
  if (!ReadPositive(block, "afn_trigger_below", &trigger, &error)) {
    return Fail(ConfigStatus::INVALID_VALUE, error);
  }
  if (trigger > 0) {
    policy.afn_trigger_below = static_cast<size_t>(trigger);
    overridden = true;
  }

  if (overridden) {
    policy.name = "custom";
  }
  return ConfigResult();
}

}  // namespace

std::string ConfigStatusToString(ConfigStatus status) {
  switch (status) {
    case ConfigStatus::OK: return "ok";
    case ConfigStatus::FILE_ERROR: return "file_error";
    case ConfigStatus::PARSE_ERROR: return "parse_error";
    case ConfigStatus::INVALID_VALUE: return "invalid_value";
    default: return "unknown";
  }
}

GuardianConfig DefaultConfig() {
  GuardianConfig config;
  FindPreset(GUARDIAN_DEFAULT_MODE, &config.policy);
  return config;
}

ConfigResult SetMode(const std::string& mode, GuardianConfig* config) {
  ModePolicy preset;
  if (!FindPreset(mode, &preset)) {
    return Fail(ConfigStatus::INVALID_VALUE,
                "unknown mode '" + mode + "' (expected strict, balanced or precise)");
  }
  config->mode = mode;
  config->policy = preset;
  return ConfigResult();
}

ConfigResult ApplyConfigJson(const json& root, GuardianConfig* config) {
  if (!root.is_object()) {
    return Fail(ConfigStatus::PARSE_ERROR, "config root must be an object");
  }
  std::string error;

  std::string mode;
  if (!ReadString(root, "mode", &mode, &error)) {
    return Fail(ConfigStatus::INVALID_VALUE, error);
  }
  if (!mode.empty()) {
    ConfigResult result = SetMode(mode, config);
    if (!result.success()) return result;
  }

  if (root.contains("policy")) {
    ConfigResult result = ApplyPolicyJson(root["policy"], config);
    if (!result.success()) return result;
  }

  if (root.contains("ner")) {
    const json& ner = root["ner"];
    if (!ner.is_object()) {
      return Fail(ConfigStatus::INVALID_VALUE, "ner must be an object");
    }
    long timeout = config->ner.timeout_ms;
    long max_length = static_cast<long>(config->ner.max_length);
    long concurrency = static_cast<long>(config->ner.concurrency);
    if (!ReadBool(ner, "enabled", &config->ner.enabled, &error) ||
        !ReadString(ner, "url", &config->ner.url, &error) ||
        !ReadString(ner, "api_key", &config->ner.api_key, &error) ||
        !ReadPositive(ner, "timeout_ms", &timeout, &error) ||
        !ReadPositive(ner, "max_length", &max_length, &error) ||
        !ReadPositive(ner, "concurrency", &concurrency, &error) ||
        !ReadBool(ner, "keyword_fallback", &config->ner.keyword_fallback, &error)) {
      return Fail(ConfigStatus::INVALID_VALUE, "ner." + error);
    }
    config->ner.timeout_ms = static_cast<int>(timeout);
    config->ner.max_length = static_cast<size_t>(max_length);
    config->ner.concurrency = static_cast<size_t>(concurrency);
  }

  if (root.contains("batch")) {
    const json& batch = root["batch"];
    if (!batch.is_object()) {
      return Fail(ConfigStatus::INVALID_VALUE, "batch must be an object");
    }
    long workers = static_cast<long>(config->batch.workers);
    if (!ReadPositive(batch, "workers", &workers, &error)) {
      return Fail(ConfigStatus::INVALID_VALUE, "batch." + error);
    }
    config->batch.workers = static_cast<size_t>(workers);
  }

  if (root.contains("log")) {
    const json& log = root["log"];
    if (!log.is_object()) {
      return Fail(ConfigStatus::INVALID_VALUE, "log must be an object");
    }
    if (!ReadString(log, "level", &config->log.level, &error) ||
        !ReadString(log, "file", &config->log.file, &error)) {
      return Fail(ConfigStatus::INVALID_VALUE, "log." + error);
    }
  }

  return ConfigResult();
}

ConfigResult LoadConfigFile(const std::string& path, GuardianConfig* config) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return Fail(ConfigStatus::FILE_ERROR, "cannot open config file " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  std::string content = buffer.str();

  if (!json::accept(content)) {
    return Fail(ConfigStatus::PARSE_ERROR, "config file " + path + " is not valid JSON");
  }
  json root = json::parse(content, nullptr, false);
  ConfigResult result = ApplyConfigJson(root, config);
  if (result.success()) {
    LOG_DEBUG("Config", "Loaded config file " + path);
  }
  return result;
}

ConfigResult ApplyEnvironment(GuardianConfig* config) {
  if (const char* mode = std::getenv("GUARDIAN_MODE")) {
    ConfigResult result = SetMode(mode, config);
    if (!result.success()) return result;
  }
  if (const char* url = std::getenv("GUARDIAN_NER_URL")) {
    config->ner.url = url;
    config->ner.enabled = !config->ner.url.empty();
  }
  if (const char* key = std::getenv("GUARDIAN_NER_API_KEY")) {
    config->ner.api_key = key;
  }

  long value = 0;
  if (const char* timeout = std::getenv("GUARDIAN_NER_TIMEOUT_MS")) {
    if (!ParsePositive(timeout, &value)) {
      return Fail(ConfigStatus::INVALID_VALUE, "GUARDIAN_NER_TIMEOUT_MS must be a positive integer");
    }
    config->ner.timeout_ms = static_cast<int>(value);
  }
  if (const char* max_length = std::getenv("GUARDIAN_NER_MAX_LENGTH")) {
    if (!ParsePositive(max_length, &value)) {
      return Fail(ConfigStatus::INVALID_VALUE, "GUARDIAN_NER_MAX_LENGTH must be a positive integer");
    }
    config->ner.max_length = static_cast<size_t>(value);
  }
  if (const char* workers = std::getenv("GUARDIAN_BATCH_WORKERS")) {
    if (!ParsePositive(workers, &value)) {
      return Fail(ConfigStatus::INVALID_VALUE, "GUARDIAN_BATCH_WORKERS must be a positive integer");
    }
    config->batch.workers = static_cast<size_t>(value);
  }
  if (const char* level = std::getenv("GUARDIAN_LOG_LEVEL")) {
    config->log.level = level;
  }
  if (const char* file = std::getenv("GUARDIAN_LOG_FILE")) {
    config->log.file = file;
  }
  return ConfigResult();
}

ConfigResult ValidateConfig(const GuardianConfig& config) {
  std::string error;
  if (!ValidatePolicy(config.policy, &error)) {
    return Fail(ConfigStatus::INVALID_VALUE, "policy: " + error);
  }
  if (config.ner.enabled && config.ner.url.empty()) {
    return Fail(ConfigStatus::INVALID_VALUE, "ner.url is required when ner is enabled");
  }
  if (config.ner.timeout_ms <= 0) {
    return Fail(ConfigStatus::INVALID_VALUE, "ner.timeout_ms must be positive");
  }
  if (config.ner.max_length == 0) {
    return Fail(ConfigStatus::INVALID_VALUE, "ner.max_length must be positive");
  }
  if (config.ner.concurrency == 0) {
    return Fail(ConfigStatus::INVALID_VALUE, "ner.concurrency must be at least 1");
  }
  if (config.batch.workers == 0) {
    return Fail(ConfigStatus::INVALID_VALUE, "batch.workers must be at least 1");
  }
  GuardianLogger::Level level;
  if (!GuardianLogger::ParseLevel(config.log.level, &level)) {
    return Fail(ConfigStatus::INVALID_VALUE, "unknown log level '" + config.log.level + "'");
  }
  return ConfigResult();
}

std::shared_ptr<ContextualRecognizer> CreateRecognizer(const GuardianConfig& config) {
  if (config.ner.enabled) {
    NerClientOptions options;
    options.url = config.ner.url;
    options.api_key = config.ner.api_key;
    options.timeout_ms = config.ner.timeout_ms;
    options.max_length = config.ner.max_length;
    options.concurrency = config.ner.concurrency;
    return std::make_shared<NerHttpClient>(options);
  }
  if (config.ner.keyword_fallback) {
    return std::make_shared<KeywordRecognizer>();
  }
  return nullptr;
}

}  // namespace GuardianPII
