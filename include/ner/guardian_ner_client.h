#ifndef GUARDIAN_NER_CLIENT_H_
#define GUARDIAN_NER_CLIENT_H_

#include <string>
#include "guardian_contextual_recognizer.h"

// HTTP client for an external named-entity service.
//
// POST {url}/recognize with {"text", "max_length", "threshold"} and expects
// {"entities": [{"type", "start", "end", "score"}]} back, where type is one
// of NAME, ADDRESS, BIRTH_DATE or ORG and offsets are UTF-8 byte offsets.
// Transport failures map to UNAVAILABLE, curl timeouts to TIMEOUT and any
// malformed body to PROTOCOL_ERROR.
namespace GuardianPII {

struct NerClientOptions {
  std::string url;
  std::string api_key;  // Sent as a Bearer token when set
  long timeout_ms = 2000;
  long connect_timeout_ms = 5000;
  size_t max_length = 2048;
  size_t concurrency = 1;
};

class NerHttpClient : public ContextualRecognizer {
 public:
  explicit NerHttpClient(const NerClientOptions& options);
  ~NerHttpClient() override;

  RecognizeResponse Recognize(const RecognizeRequest& request) override;

  std::string GetName() const override { return "ner-http"; }
  size_t GetMaxLength() const override { return options_.max_length; }
  size_t GetConcurrencyLimit() const override { return options_.concurrency; }

  // Request body for |request|
  static std::string BuildPayload(const RecognizeRequest& request);

  // Parses a service response body into |response|. Returns false and sets
  // PROTOCOL_ERROR when the body does not follow the contract.
  static bool ParseResponse(const std::string& body, RecognizeResponse* response);

 private:
  std::string endpoint_;
  NerClientOptions options_;
};

}  // namespace GuardianPII

#endif  // GUARDIAN_NER_CLIENT_H_
