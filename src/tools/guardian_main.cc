/**
 * guardian_detect - Command-line front end for the PII detector.
 *
 * Exit codes: 0 no PII, 1 PII found, 2 configuration or input error.
 */

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "guardian_batch_detector.h"
#include "guardian_config.h"
#include "guardian_detector.h"
#include "guardian_result_json.h"
#include "logger.h"

using namespace GuardianPII;

namespace {

constexpr int kExitNoPII = 0;
constexpr int kExitPII = 1;
constexpr int kExitError = 2;

void PrintUsage(const char* program) {
  std::cout << "Usage: " << program << " [options] [text]\n"
            << "\n"
            << "Detects Brazilian PII (CPF, CNPJ, phone, email, CEP, RG, CNH, names,\n"
            << "addresses, birth dates) in text. Reads stdin when no text is given.\n"
            << "\n"
            << "Options:\n"
            << "  --file <path>        Detect each line of a file (batch mode)\n"
            << "  --mode <name>        strict, balanced (default) or precise\n"
            << "  --config <path>      JSON config file\n"
            << "  --json               Print results as JSON\n"
            << "  --ner-url <url>      Use an external NER service\n"
            << "  --no-ner             Regex-only detection\n"
            << "  --workers <n>        Batch worker threads\n"
            << "  --log-level <level>  debug, info, warn or error\n"
            << "  --version            Print version and exit\n"
            << "  -h, --help           Show this help\n";
}

bool ReadLines(const std::string& path, std::vector<std::string>* lines) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return false;
  }
  std::string line;
  while (std::getline(file, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines->push_back(line);
  }
  return true;
}

void PrintResult(const DetectionResult& result) {
  std::cout << "has_pii: " << (result.has_pii ? "yes" : "no")
            << "  classification: " << GetClassificationName(result.classification)
            << "  confidence: " << result.aggregate_confidence
            << "  mode: " << result.mode << "\n";
  for (const auto& entity : result.entities) {
    std::cout << "  " << GetTypeName(entity.type) << " [" << entity.start << ", " << entity.end
              << ") " << entity.raw_value << "  confidence=" << entity.confidence
              << " " << GetValidationStatusName(entity.validation_status);
    for (const auto& source : GetSourceNames(entity.sources)) {
      std::cout << " " << source;
    }
    std::cout << "\n";
  }
  if (result.metadata.contextual_degraded) {
    std::cout << "  (contextual recognizer degraded: " << result.metadata.degraded_reason << ")\n";
  }
  if (result.metadata.truncated) {
    std::cout << "  (contextual recognizer saw a truncated prefix)\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string file_path;
  std::string mode;
  std::string ner_url;
  std::string log_level;
  std::string text;
  bool have_text = false;
  bool json_output = false;
  bool no_ner = false;
  long workers = 0;

  for (int i = 1; i < argc; i++) {
    if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      PrintUsage(argv[0]);
      return kExitNoPII;
    } else if (strcmp(argv[i], "--version") == 0) {
      std::cout << "guardian_detect " << GUARDIAN_VERSION << std::endl;
      return kExitNoPII;
    } else if (strcmp(argv[i], "--file") == 0 && i + 1 < argc) {
      file_path = argv[++i];
    } else if (strcmp(argv[i], "--mode") == 0 && i + 1 < argc) {
      mode = argv[++i];
    } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (strcmp(argv[i], "--ner-url") == 0 && i + 1 < argc) {
      ner_url = argv[++i];
    } else if (strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
      log_level = argv[++i];
    } else if (strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
      char* end = nullptr;
      workers = std::strtol(argv[++i], &end, 10);
      if (*end != '\0' || workers <= 0) {
        std::cerr << "Invalid --workers value: " << argv[i] << std::endl;
        return kExitError;
      }
    } else if (strcmp(argv[i], "--json") == 0) {
      json_output = true;
    } else if (strcmp(argv[i], "--no-ner") == 0) {
      no_ner = true;
    } else if (argv[i][0] == '-' && argv[i][1] == '-') {
      std::cerr << "Unknown option: " << argv[i] << std::endl;
      PrintUsage(argv[0]);
      return kExitError;
    } else {
      if (have_text) text += " ";
      text += argv[i];
      have_text = true;
    }
  }

  // Defaults, then file, then environment, then flags
  GuardianConfig config = DefaultConfig();
  ConfigResult loaded;
  if (!config_path.empty()) {
    loaded = LoadConfigFile(config_path, &config);
  }
  if (loaded.success()) {
    loaded = ApplyEnvironment(&config);
  }
  if (loaded.success() && !mode.empty()) {
    loaded = SetMode(mode, &config);
  }
  if (!loaded.success()) {
    std::cerr << "Configuration error (" << ConfigStatusToString(loaded.status) << "): "
              << loaded.error << std::endl;
    return kExitError;
  }
  if (!ner_url.empty()) {
    config.ner.enabled = true;
    config.ner.url = ner_url;
  }
  if (no_ner) {
    config.ner.enabled = false;
    config.ner.keyword_fallback = false;
  }
  if (!log_level.empty()) {
    config.log.level = log_level;
  }
  if (workers > 0) {
    config.batch.workers = static_cast<size_t>(workers);
  }

  ConfigResult validated = ValidateConfig(config);
  if (!validated.success()) {
    std::cerr << "Configuration error: " << validated.error << std::endl;
    return kExitError;
  }

  if (!config.log.file.empty() && !GuardianLogger::Logger::AttachFile(config.log.file)) {
    std::cerr << "Cannot open log file " << config.log.file << ", logging to stderr only"
              << std::endl;
  }
  GuardianLogger::Level level;
  if (GuardianLogger::ParseLevel(config.log.level, &level)) {
    GuardianLogger::Logger::SetLevel(level);
  }

  DetectorOptions options;
  options.recognizer_timeout_ms = config.ner.timeout_ms;

  std::string error;
  std::shared_ptr<const GuardianDetector> detector(
      GuardianDetector::Create(config.policy, CreateRecognizer(config), options, &error));
  if (!detector) {
    std::cerr << "Configuration error: " << error << std::endl;
    return kExitError;
  }

  // Batch mode
  if (!file_path.empty()) {
    std::vector<std::string> lines;
    if (!ReadLines(file_path, &lines)) {
      std::cerr << "Cannot read input file: " << file_path << std::endl;
      return kExitError;
    }

    GuardianBatchDetector batch(detector, config.batch.workers);
    std::vector<DetectResponse> responses = batch.DetectAll(lines);
    BatchSummary summary = GuardianBatchDetector::Summarize(responses);

    for (size_t i = 0; i < responses.size(); ++i) {
      if (json_output) {
        json line = ResponseToJson(responses[i]);
        line["line"] = i + 1;
        std::cout << line.dump() << "\n";
      } else if (!responses[i].success()) {
        std::cout << "line " << (i + 1) << ": rejected (" << responses[i].error << ")\n";
      } else {
        std::cout << "line " << (i + 1) << ": ";
        PrintResult(responses[i].result);
      }
    }
    if (json_output) {
      json footer;
      footer["summary"] = SummaryToJson(summary);
      std::cout << footer.dump() << std::endl;
    } else {
      std::cout << summary.ToString() << std::endl;
    }

    if (summary.rejected > 0) return kExitError;
    return summary.with_pii > 0 ? kExitPII : kExitNoPII;
  }

  if (!have_text) {
    text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }

  DetectResponse response = detector->Detect(text);
  if (json_output) {
    std::cout << ResponseToJson(response).dump(2) << std::endl;
  } else if (response.success()) {
    PrintResult(response.result);
  }
  if (!response.success()) {
    if (!json_output) {
      std::cerr << "Input rejected: " << response.error << std::endl;
    }
    return kExitError;
  }
  return response.result.has_pii ? kExitPII : kExitNoPII;
}
