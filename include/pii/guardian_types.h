#ifndef GUARDIAN_TYPES_H_
#define GUARDIAN_TYPES_H_

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace GuardianPII {

/**
 * PII categories, in declaration order. The order is used as the final
 * tie-break wherever two candidates are otherwise equal.
 */
enum class PIIType {
  CPF,
  CNPJ,
  PHONE,
  EMAIL,
  CEP,
  RG,
  CNH,
  PIS_PASEP,
  VOTER_ID,       // Titulo de eleitor
  CREDIT_CARD,
  VEHICLE_PLATE,
  PASSPORT,
  // Produced by the contextual recognizer
  NAME,
  ADDRESS,
  BIRTH_DATE,
  ORG
};

constexpr int kPIITypeCount = 16;

std::string GetTypeName(PIIType type);
bool ParseTypeName(const std::string& name, PIIType* type);

// NAME, ADDRESS, BIRTH_DATE and ORG
bool IsContextualType(PIIType type);

enum class ValidationStatus {
  VALID,
  INVALID,
  NOT_APPLICABLE
};

std::string GetValidationStatusName(ValidationStatus status);

// Producing stages, combined as a bitmask once fusion merges entities
enum Source : uint8_t {
  SOURCE_REGEX = 1 << 0,
  SOURCE_CONTEXTUAL = 1 << 1,
  SOURCE_AFN = 1 << 2
};

using SourceSet = uint8_t;

int CountSources(SourceSet sources);
std::vector<std::string> GetSourceNames(SourceSet sources);

/**
 * A structural match straight out of the pattern library.
 * Offsets are half-open byte offsets into the scanned text.
 */
struct RawCandidate {
  PIIType type = PIIType::CPF;
  std::string raw_value;
  size_t start = 0;
  size_t end = 0;
  double base_confidence = 0.0;
  int pattern_index = 0;  // Position of the matcher within its type
};

/**
 * A detected PII span.
 *
 * base_confidence is what the producing stage reported; confidence is
 * base_confidence plus the scorer's adjustments.
 *
 * Offsets are half-open. Inside the pipeline they count bytes; in a
 * DetectionResult handed back to callers they count UTF-8 characters.
 */
struct Entity {
  PIIType type = PIIType::CPF;
  std::string raw_value;
  std::string normalized_value;
  size_t start = 0;
  size_t end = 0;
  double confidence = 0.0;
  double base_confidence = 0.0;
  ValidationStatus validation_status = ValidationStatus::NOT_APPLICABLE;
  SourceSet sources = 0;

  // Right length and shape for its type, regardless of checksum
  bool structurally_valid = false;

  // Cutoff this entity is held to. Negative means the policy's base threshold.
  double acceptance_threshold = -1.0;

  // Why the entity was kept: regex, contextual, afn_numeric,
  // afn_contextual, corroborated or won_overlap
  std::string reason;

  size_t Length() const { return end - start; }
  bool Overlaps(const Entity& other) const {
    return start < other.end && other.start < end;
  }
};

enum class Classification {
  PUBLIC,
  NON_PUBLIC
};

std::string GetClassificationName(Classification classification);

/**
 * Per-call facts about how the result was produced. Never holds input text.
 */
struct ResultMetadata {
  bool contextual_degraded = false;
  std::string degraded_reason;  // unavailable, timeout, protocol_error, disabled
  bool truncated = false;       // Collaborator saw only a prefix of the text
  bool afn_triggered = false;
  int afn_added = 0;
  std::map<PIIType, int> by_type;
  std::string text_fingerprint;  // SHA-256 hex of the input

  std::string ToString() const;
};

struct DetectionResult {
  bool has_pii = false;
  Classification classification = Classification::PUBLIC;
  std::vector<Entity> entities;  // Sorted by start, never overlapping
  double aggregate_confidence = 0.0;
  std::string mode;
  ResultMetadata metadata;
};

}  // namespace GuardianPII

#endif  // GUARDIAN_TYPES_H_
