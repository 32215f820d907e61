#include "guardian_detector.h"
#include "guardian_afn_escalator.h"
#include "guardian_confidence_scorer.h"
#include "guardian_decision_assembler.h"
#include "guardian_fingerprint.h"
#include "guardian_fusion_engine.h"
#include "guardian_text_utils.h"
#include "guardian_validators.h"
#include "logger.h"
#include <algorithm>
#include <chrono>
#include <cmath>

namespace GuardianPII {

std::string DetectStatusToString(DetectStatus status) {
  switch (status) {
    case DetectStatus::OK: return "ok";
    case DetectStatus::INVALID_ENCODING: return "invalid_encoding";
    default: return "unknown";
  }
}

std::unique_ptr<GuardianDetector> GuardianDetector::Create(
    const ModePolicy& policy,
    std::shared_ptr<ContextualRecognizer> recognizer,
    const DetectorOptions& options,
    std::string* error) {
  if (!ValidatePolicy(policy, error)) {
    LOG_ERROR("Detector", "Rejected policy '" + policy.name + "': " + *error);
    return nullptr;
  }
  if (options.recognizer_timeout_ms <= 0) {
    *error = "recognizer timeout must be positive";
    LOG_ERROR("Detector", *error);
    return nullptr;
  }
  if (!recognizer) {
    recognizer = std::make_shared<UnavailableRecognizer>();
  }
  return std::unique_ptr<GuardianDetector>(
      new GuardianDetector(policy, std::move(recognizer), options));
}

GuardianDetector::GuardianDetector(const ModePolicy& policy,
                                   std::shared_ptr<ContextualRecognizer> recognizer,
                                   const DetectorOptions& options)
    : policy_(policy),
      recognizer_(std::move(recognizer)),
      options_(options),
      ledger_(std::make_shared<CallLedger>()) {
  // Compile the patterns now rather than on the first call
  GuardianPatternLibrary::GetInstance();

  workers_ = std::max<size_t>(1, recognizer_->GetConcurrencyLimit());
  pool_ = std::make_unique<guardian::ThreadPool>(workers_);

  LOG_INFO("Detector", "Initialized mode=" + policy_.name +
           " threshold=" + std::to_string(policy_.base_threshold) +
           " regex=" + GetAggressiveRegexName(policy_.aggressive_regex) +
           " afn=" + GetAfnPassesName(policy_.afn_passes) +
           " recognizer=" + recognizer_->GetName());
}

GuardianDetector::~GuardianDetector() {
  // Waits for any abandoned recognizer call to return
  pool_->Shutdown();
}

std::vector<Entity> GuardianDetector::BuildRegexEntities(
    const std::vector<RawCandidate>& candidates) {
  std::vector<Entity> entities;
  entities.reserve(candidates.size());

  for (const auto& candidate : candidates) {
    ValidationResult verdict = Validate(candidate.type, candidate.raw_value);

    Entity entity;
    entity.type = candidate.type;
    entity.raw_value = candidate.raw_value;
    entity.normalized_value = verdict.normalized;
    entity.start = candidate.start;
    entity.end = candidate.end;
    entity.validation_status = StatusFor(candidate.type, verdict);
    entity.structurally_valid = verdict.structurally_valid;
    entity.base_confidence = candidate.base_confidence;
    if (entity.validation_status == ValidationStatus::INVALID) {
      entity.base_confidence *= kInvalidPenalty;
    }
    entity.confidence = entity.base_confidence;
    entity.sources = SOURCE_REGEX;
    entity.reason = "regex";
    entities.push_back(std::move(entity));
  }
  return entities;
}

bool GuardianDetector::SanitizeCandidates(const std::string& scanned,
                                          RecognizeResponse& response) {
  std::vector<ContextualCandidate> kept;
  int dropped = 0;

  for (auto candidate : response.candidates) {
    if (!IsContextualType(candidate.type)) {
      LOG_ERROR("Detector", "Recognizer returned non-contextual type " +
                GetTypeName(candidate.type));
      return false;
    }
    bool in_bounds = candidate.start < candidate.end && candidate.end <= scanned.size() &&
                     Utf8FloorBoundary(scanned, candidate.start) == candidate.start &&
                     Utf8FloorBoundary(scanned, candidate.end) == candidate.end;
    if (!in_bounds || !std::isfinite(candidate.confidence)) {
      dropped++;
      continue;
    }
    candidate.confidence = std::clamp(candidate.confidence, 0.0, 1.0);
    kept.push_back(candidate);
  }

  if (dropped > 0) {
    LOG_WARN("Detector", "Dropped " + std::to_string(dropped) +
             " recognizer candidates with invalid spans or scores");
  }
  response.candidates = std::move(kept);
  return true;
}

void GuardianDetector::ToCharacterOffsets(const std::string& text,
                                          std::vector<Entity>& entities) {
  size_t byte = 0;
  size_t chars = 0;
  for (auto& entity : entities) {
    // Entities are disjoint and sorted, so the count only moves forward
    for (size_t* offset : {&entity.start, &entity.end}) {
      for (; byte < *offset && byte < text.size(); ++byte) {
        if ((static_cast<unsigned char>(text[byte]) & 0xC0) != 0x80) chars++;
      }
      *offset = chars;
    }
  }
}

GuardianDetector::RecognizerCall GuardianDetector::CallRecognizer(const std::string& text,
                                                                  double min_score) const {
  RecognizerCall call;

  size_t max_length = recognizer_->GetMaxLength();
  size_t length = max_length > 0 ? Utf8SafePrefix(text, max_length) : text.size();
  call.truncated = length < text.size();

  RecognizeRequest request;
  request.text = text.substr(0, length);
  request.max_length = max_length;
  request.min_score = min_score;

  {
    std::lock_guard<std::mutex> lock(ledger_->mutex);
    if (ledger_->stalled >= workers_) {
      call.response.status = RecognizeStatus::BUSY;
      call.response.error = std::to_string(ledger_->stalled) +
                            " timed-out recognizer calls still running";
      return call;
    }
  }

  // The task owns copies of everything it touches, so it can outlive this call
  std::shared_ptr<ContextualRecognizer> recognizer = recognizer_;
  std::shared_ptr<CallLedger> ledger = ledger_;
  auto state = std::make_shared<CallState>();
  auto future = pool_->Submit(guardian::TaskPriority::HIGH,
                              [recognizer, request, ledger, state]() {
    {
      std::lock_guard<std::mutex> lock(ledger->mutex);
      if (state->abandoned) {
        RecognizeResponse skipped;
        skipped.status = RecognizeStatus::TIMEOUT;
        return skipped;
      }
      state->started = true;
    }
    RecognizeResponse response = recognizer->Recognize(request);
    std::lock_guard<std::mutex> lock(ledger->mutex);
    state->finished = true;
    if (state->abandoned) {
      ledger->stalled--;
    }
    return response;
  });

  if (!future.valid()) {
    call.response.status = RecognizeStatus::UNAVAILABLE;
    call.response.error = "recognizer pool is shut down";
    return call;
  }

  if (future.wait_for(std::chrono::milliseconds(options_.recognizer_timeout_ms)) !=
      std::future_status::ready) {
    {
      std::lock_guard<std::mutex> lock(ledger_->mutex);
      state->abandoned = true;
      if (state->started && !state->finished) {
        ledger_->stalled++;
      }
    }
    call.response.status = RecognizeStatus::TIMEOUT;
    call.response.error = "recognizer did not answer within " +
                          std::to_string(options_.recognizer_timeout_ms) + " ms";
    return call;
  }

  call.response = future.get();
  if (call.response.status == RecognizeStatus::OK &&
      !SanitizeCandidates(request.text, call.response)) {
    call.response.status = RecognizeStatus::PROTOCOL_ERROR;
    call.response.error = "recognizer returned a type outside its contract";
    call.response.candidates.clear();
  }
  return call;
}

DetectResponse GuardianDetector::Detect(const std::string& text) const {
  auto started = std::chrono::steady_clock::now();
  DetectResponse response;

  if (!IsValidUtf8(text)) {
    response.status = DetectStatus::INVALID_ENCODING;
    response.error = "input is not valid UTF-8";
    LOG_WARN("Detector", "Rejected input of " + std::to_string(text.size()) +
             " bytes: invalid UTF-8");
    return response;
  }

  ResultMetadata metadata;
  if (options_.compute_fingerprint) {
    metadata.text_fingerprint = TextFingerprint(text);
  }

  if (IsBlank(text)) {
    response.result = DecisionAssembler::Assemble({}, policy_, std::move(metadata));
    return response;
  }

  // Stage 1: structural matches, validated
  std::vector<RawCandidate> raw =
      GuardianPatternLibrary::GetInstance().Extract(text, policy_.aggressive_regex);
  std::vector<Entity> regex_entities = BuildRegexEntities(raw);

  // Stage 2: contextual candidates at the policy threshold
  std::vector<Entity> contextual_entities;
  RecognizerCall call = CallRecognizer(text, policy_.base_threshold);
  metadata.truncated = call.truncated;
  bool contextual_ok = call.response.status == RecognizeStatus::OK;
  if (contextual_ok) {
    for (const auto& candidate : call.response.candidates) {
      if (candidate.confidence >= policy_.base_threshold) {
        contextual_entities.push_back(ToContextualEntity(candidate, text));
      }
    }
  } else {
    metadata.contextual_degraded = true;
    metadata.degraded_reason = RecognizeStatusToString(call.response.status);
    LOG_WARN("Detector", "Contextual recognizer degraded (" + metadata.degraded_reason +
             "): " + call.response.error);
  }
  if (call.truncated) {
    LOG_INFO("Detector", "Recognizer saw " + std::to_string(recognizer_->GetMaxLength()) +
             " of " + std::to_string(text.size()) + " bytes");
  }

  // Stage 3: fusion and scoring
  std::vector<Entity> entities = FusionEngine::Fuse(regex_entities, contextual_entities);
  ConfidenceScorer::ScoreAll(entities, text);

  // Stage 4: escalation
  AfnEscalator::ContextualRescan rescan;
  if (contextual_ok) {
    rescan = [this, &text](double min_score) {
      return CallRecognizer(text, min_score).response;
    };
  }
  AfnOutcome outcome = AfnEscalator::Run(text, policy_, entities, rescan);
  metadata.afn_triggered = outcome.triggered;
  metadata.afn_added = outcome.numeric_added + outcome.keyword_added + outcome.contextual_added;
  if (outcome.contextual_rescan_ran && outcome.contextual_status != RecognizeStatus::OK &&
      !metadata.contextual_degraded) {
    metadata.contextual_degraded = true;
    metadata.degraded_reason = RecognizeStatusToString(outcome.contextual_status);
  }

  // Stage 5: decision
  response.result = DecisionAssembler::Assemble(std::move(entities), policy_, std::move(metadata));
  ToCharacterOffsets(text, response.result.entities);

  auto elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - started).count();
  LOG_DEBUG("Detector", "mode=" + policy_.name + " regex=" + std::to_string(raw.size()) +
            " contextual=" + std::to_string(contextual_entities.size()) + " -> " +
            response.result.metadata.ToString() + " in " +
            std::to_string(elapsed_us) + " us");
  (void)elapsed_us;  // Only logged in debug builds
  return response;
}

}  // namespace GuardianPII
