#ifndef GUARDIAN_KEYWORD_RECOGNIZER_H_
#define GUARDIAN_KEYWORD_RECOGNIZER_H_

#include <string>
#include <vector>
#include "guardian_contextual_recognizer.h"

namespace GuardianPII {

/**
 * KeywordRecognizer - Rule-based contextual recognizer for Portuguese text.
 *
 * Finds names after introducers ("meu nome é", "Sr.", "requerente"),
 * street addresses after a street-type word, birth dates near
 * "nascimento", and company names ending in Ltda, S.A., S/A or EIRELI.
 * Deterministic and stateless, so any number of calls may run at once.
 */
class KeywordRecognizer : public ContextualRecognizer {
 public:
  static constexpr size_t kDefaultMaxLength = 20000;

  explicit KeywordRecognizer(size_t max_length = kDefaultMaxLength, size_t concurrency = 4);

  RecognizeResponse Recognize(const RecognizeRequest& request) override;

  std::string GetName() const override { return "keyword"; }
  size_t GetMaxLength() const override { return max_length_; }
  size_t GetConcurrencyLimit() const override { return concurrency_; }

 private:
  void FindNames(const std::string& text, const std::string& folded,
                 std::vector<ContextualCandidate>& out) const;
  void FindAddresses(const std::string& text, const std::string& folded,
                     std::vector<ContextualCandidate>& out) const;
  void FindBirthDates(const std::string& text, const std::string& folded,
                      std::vector<ContextualCandidate>& out) const;
  void FindOrganizations(const std::string& text,
                         std::vector<ContextualCandidate>& out) const;

  size_t max_length_;
  size_t concurrency_;
};

}  // namespace GuardianPII

#endif  // GUARDIAN_KEYWORD_RECOGNIZER_H_
