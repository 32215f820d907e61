#include "guardian_ner_client.h"
#include "logger.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <mutex>

using json = nlohmann::json;

namespace GuardianPII {

namespace {

// Callback for curl to write response data
size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
  static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
  return size * nmemb;
}

std::once_flag curl_init_flag;

}  // namespace

NerHttpClient::NerHttpClient(const NerClientOptions& options)
    : options_(options) {
  std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });

  endpoint_ = options_.url;
  if (endpoint_.find("/recognize") == std::string::npos) {
    if (!endpoint_.empty() && endpoint_.back() == '/') {
      endpoint_.pop_back();
    }
    endpoint_ += "/recognize";
  }
  if (options_.concurrency == 0) {
    options_.concurrency = 1;
  }

  LOG_INFO("NerClient", "Using NER service at " + endpoint_ +
           " (timeout " + std::to_string(options_.timeout_ms) + " ms)");
}

NerHttpClient::~NerHttpClient() = default;

std::string NerHttpClient::BuildPayload(const RecognizeRequest& request) {
  json payload;
  payload["text"] = request.text;
  payload["max_length"] = request.max_length;
  payload["threshold"] = request.min_score;
  return payload.dump();
}

bool NerHttpClient::ParseResponse(const std::string& body, RecognizeResponse* response) {
  response->candidates.clear();

  json parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    response->status = RecognizeStatus::PROTOCOL_ERROR;
    response->error = "response is not a JSON object";
    return false;
  }

  auto entities = parsed.find("entities");
  if (entities == parsed.end() || !entities->is_array()) {
    response->status = RecognizeStatus::PROTOCOL_ERROR;
    response->error = "response has no entities array";
    return false;
  }

  for (const auto& item : *entities) {
    if (!item.is_object() ||
        !item.contains("type") || !item["type"].is_string() ||
        !item.contains("start") || !item["start"].is_number_unsigned() ||
        !item.contains("end") || !item["end"].is_number_unsigned() ||
        !item.contains("score") || !item["score"].is_number()) {
      response->status = RecognizeStatus::PROTOCOL_ERROR;
      response->error = "malformed entity in response";
      response->candidates.clear();
      return false;
    }

    ContextualCandidate candidate;
    std::string type_name = item["type"].get<std::string>();
    if (!ParseTypeName(type_name, &candidate.type) || !IsContextualType(candidate.type)) {
      response->status = RecognizeStatus::PROTOCOL_ERROR;
      response->error = "unsupported entity type '" + type_name + "'";
      response->candidates.clear();
      return false;
    }
    candidate.start = item["start"].get<size_t>();
    candidate.end = item["end"].get<size_t>();
    candidate.confidence = item["score"].get<double>();
    response->candidates.push_back(candidate);
  }

  response->status = RecognizeStatus::OK;
  response->error.clear();
  return true;
}

RecognizeResponse NerHttpClient::Recognize(const RecognizeRequest& request) {
  RecognizeResponse response;
  auto start_time = std::chrono::steady_clock::now();

  CURL* curl = curl_easy_init();
  if (!curl) {
    response.status = RecognizeStatus::UNAVAILABLE;
    response.error = "Failed to initialize CURL";
    LOG_ERROR("NerClient", response.error);
    return response;
  }

  std::string payload_json = BuildPayload(request);
  std::string response_str;

  struct curl_slist* headers = nullptr;
  headers = curl_slist_append(headers, "Content-Type: application/json");
  std::string auth_header;
  if (!options_.api_key.empty()) {
    auth_header = "Authorization: Bearer " + options_.api_key;
    headers = curl_slist_append(headers, auth_header.c_str());
  }

  curl_easy_setopt(curl, CURLOPT_URL, endpoint_.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload_json.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload_json.size()));
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_str);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, options_.timeout_ms);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, options_.connect_timeout_ms);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);  // Thread-safe
  curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);

  CURLcode res = curl_easy_perform(curl);

  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  auto latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start_time).count();

  if (res != CURLE_OK) {
    response.status = res == CURLE_OPERATION_TIMEDOUT ? RecognizeStatus::TIMEOUT
                                                      : RecognizeStatus::UNAVAILABLE;
    response.error = "HTTP request failed: " + std::string(curl_easy_strerror(res));
    LOG_ERROR("NerClient", response.error);
    return response;
  }

  if (http_code != 200) {
    response.status = RecognizeStatus::UNAVAILABLE;
    response.error = "HTTP error " + std::to_string(http_code);
    LOG_ERROR("NerClient", response.error);
    return response;
  }

  if (!ParseResponse(response_str, &response)) {
    LOG_ERROR("NerClient", "Invalid response: " + response.error);
    return response;
  }

  LOG_DEBUG("NerClient", "Recognized " + std::to_string(response.candidates.size()) +
            " candidates in " + std::to_string(latency_ms) + " ms");
  (void)latency_ms;  // Only logged in debug builds
  return response;
}

}  // namespace GuardianPII
