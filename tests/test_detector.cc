#include <gtest/gtest.h>
#include <atomic>
#include <cstdint>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "guardian_detector.h"
#include "guardian_result_json.h"

using namespace GuardianPII;

namespace {

// Returns a fixed response and remembers what it was asked
class FakeRecognizer : public ContextualRecognizer {
 public:
  explicit FakeRecognizer(RecognizeResponse response = RecognizeResponse(),
                          size_t max_length = 0, int delay_ms = 0)
      : response_(std::move(response)), max_length_(max_length), delay_ms_(delay_ms) {}

  RecognizeResponse Recognize(const RecognizeRequest& request) override {
    if (delay_ms_ > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    calls_++;
    last_text_ = request.text;
    return response_;
  }

  std::string GetName() const override { return "fake"; }
  size_t GetMaxLength() const override { return max_length_; }
  size_t GetConcurrencyLimit() const override { return concurrency_; }
  void set_concurrency(size_t concurrency) { concurrency_ = concurrency; }

  int calls() {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }
  std::string last_text() {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_text_;
  }

 private:
  RecognizeResponse response_;
  size_t max_length_;
  int delay_ms_;
  size_t concurrency_ = 2;
  std::mutex mutex_;
  int calls_ = 0;
  std::string last_text_;
};

ModePolicy Preset(const std::string& name) {
  ModePolicy policy;
  EXPECT_TRUE(FindPreset(name, &policy));
  return policy;
}

std::unique_ptr<GuardianDetector> MakeDetector(
    const std::string& mode,
    std::shared_ptr<ContextualRecognizer> recognizer = std::make_shared<FakeRecognizer>(),
    DetectorOptions options = DetectorOptions()) {
  std::string error;
  auto detector = GuardianDetector::Create(Preset(mode), std::move(recognizer), options, &error);
  EXPECT_NE(detector, nullptr) << error;
  return detector;
}

DetectionResult Run(const GuardianDetector& detector, const std::string& text) {
  DetectResponse response = detector.Detect(text);
  EXPECT_TRUE(response.success()) << response.error;
  return response.result;
}

void ExpectWellFormed(const DetectionResult& result) {
  for (size_t i = 0; i < result.entities.size(); ++i) {
    const Entity& entity = result.entities[i];
    EXPECT_LT(entity.start, entity.end);
    EXPECT_GE(entity.confidence, 0.0);
    EXPECT_LE(entity.confidence, 1.0);
    if (i > 0) {
      EXPECT_LE(result.entities[i - 1].end, entity.start) << "entities overlap";
    }
  }
  EXPECT_EQ(result.has_pii, !result.entities.empty());
}

}  // namespace

TEST(DetectorTest, SingleFormattedCpf) {
  auto detector = MakeDetector("balanced");
  DetectionResult result = ::Run(*detector, "Meu CPF é 529.982.247-25");
  ASSERT_EQ(result.entities.size(), 1u);
  const Entity& cpf = result.entities[0];
  EXPECT_EQ(cpf.type, PIIType::CPF);
  EXPECT_EQ(cpf.raw_value, "529.982.247-25");
  EXPECT_EQ(cpf.normalized_value, "52998224725");
  EXPECT_EQ(cpf.validation_status, ValidationStatus::VALID);
  EXPECT_NEAR(cpf.confidence, 0.98, 1e-9);
  EXPECT_EQ(cpf.reason, "regex");
  EXPECT_TRUE(result.has_pii);
  EXPECT_EQ(result.classification, Classification::NON_PUBLIC);
  EXPECT_EQ(result.mode, "balanced");
  EXPECT_FALSE(result.metadata.contextual_degraded);
  EXPECT_TRUE(result.metadata.afn_triggered);
  EXPECT_EQ(result.metadata.afn_added, 0);
  EXPECT_EQ(result.metadata.text_fingerprint.size(), 64u);
}

TEST(DetectorTest, PlainTextIsPublic) {
  auto detector = MakeDetector("balanced");
  DetectionResult result =
      ::Run(*detector, "Solicito informações sobre o horário de atendimento da secretaria.");
  EXPECT_FALSE(result.has_pii);
  EXPECT_EQ(result.classification, Classification::PUBLIC);
  EXPECT_TRUE(result.entities.empty());
  EXPECT_DOUBLE_EQ(result.aggregate_confidence, 0.0);
}

TEST(DetectorTest, MaskedIdentifierIsPublic) {
  for (const std::string mode : {"strict", "balanced", "precise"}) {
    auto detector = MakeDetector(mode);
    EXPECT_FALSE(::Run(*detector, "CPF: ***.456.789-**").has_pii) << mode;
  }
}

TEST(DetectorTest, AfnRecoversGluedCpfOnlyWhenEnabled) {
  std::string text = "protocolo abc52998224725def";

  auto balanced = MakeDetector("balanced");
  DetectionResult recovered = ::Run(*balanced, text);
  ASSERT_EQ(recovered.entities.size(), 1u);
  EXPECT_EQ(recovered.entities[0].type, PIIType::CPF);
  EXPECT_EQ(recovered.entities[0].reason, "afn_numeric");
  EXPECT_EQ(recovered.entities[0].sources, SOURCE_AFN);
  EXPECT_TRUE(recovered.metadata.afn_triggered);
  EXPECT_EQ(recovered.metadata.afn_added, 1);

  auto precise = MakeDetector("precise");
  DetectionResult missed = ::Run(*precise, text);
  EXPECT_FALSE(missed.has_pii);
  EXPECT_FALSE(missed.metadata.afn_triggered);
}

TEST(DetectorTest, UnformattedCpfWinsAmbiguousDigits) {
  auto balanced = MakeDetector("balanced");
  DetectionResult result = ::Run(*balanced, "numero 52998224725");
  ASSERT_EQ(result.entities.size(), 1u);
  EXPECT_EQ(result.entities[0].type, PIIType::CPF);
  EXPECT_NEAR(result.entities[0].confidence, 0.75, 1e-9);

  auto precise = MakeDetector("precise");
  EXPECT_FALSE(::Run(*precise, "numero 52998224725").has_pii);
}

TEST(DetectorTest, StrictKeepsBadChecksum) {
  std::string text = "CPF 123.456.789-00";

  DetectionResult strict = ::Run(*MakeDetector("strict"), text);
  ASSERT_EQ(strict.entities.size(), 1u);
  EXPECT_EQ(strict.entities[0].validation_status, ValidationStatus::INVALID);
  EXPECT_LT(strict.entities[0].confidence, 0.5);
  EXPECT_EQ(strict.classification, Classification::NON_PUBLIC);

  EXPECT_FALSE(::Run(*MakeDetector("balanced"), text).has_pii);
}

// Deterministic texts built from fragments whose candidates overlap:
// bare digit runs read as CPF, CNH or voter ID, local phones, keyword
// anchored numbers and checksum failures
std::vector<std::string> MixedTexts(size_t count) {
  const std::vector<std::string> fragments = {
      "Meu CPF é 529.982.247-25", "CPF 123.456.789-00", "numero 52998224725",
      "cpf 10000001333", "cnh 12345678900", "protocolo abc52998224725def",
      "ligue 98765-4321", "telefone: 98765-4321", "(11) 3456-7890", "(61) 7123-4567",
      "celular 11 98765-4321", "cpf: 123456789", "escreva para joao@exemplo.com.br",
      "CEP 01310-100", "CEP 01310100", "RG 12.345.678-9", "placa ABC-1234",
      "passaporte AB123456", "cartão 4111 1111 1111 1111", "título 0043 5687 0906",
      "PIS 170.33259.50-4", "CPF: ***.456.789-**", "CNPJ 11.222.333/0001-81",
      "pedido 20240115", "sem dados", "segue em anexo"};
  const std::vector<std::string> joints = {" ", ", ", " e "};

  std::vector<std::string> texts;
  uint32_t state = 12345;
  auto next = [&state](size_t bound) {
    state = state * 1103515245u + 12345u;
    return static_cast<size_t>((state >> 16) % bound);
  };
  for (size_t i = 0; i < count; ++i) {
    size_t parts = 1 + next(4);
    std::string text = fragments[next(fragments.size())];
    for (size_t p = 1; p < parts; ++p) {
      text += joints[next(joints.size())] + fragments[next(fragments.size())];
    }
    texts.push_back(text);
  }
  return texts;
}

TEST(DetectorTest, RecallIsMonotonicAcrossModes) {
  auto strict = MakeDetector("strict");
  auto balanced = MakeDetector("balanced");
  auto precise = MakeDetector("precise");
  for (const auto& text : MixedTexts(200)) {
    size_t p = ::Run(*precise, text).entities.size();
    size_t b = ::Run(*balanced, text).entities.size();
    size_t s = ::Run(*strict, text).entities.size();
    EXPECT_GE(b, p) << text;
    EXPECT_GE(s, b) << text;
  }
}

TEST(DetectorTest, CpfWinsOverCnhWhenBothChecksumsPass) {
  // 10000001333 carries valid CPF and CNH check digits
  DetectionResult result = ::Run(*MakeDetector("balanced"), "Meu CPF é 10000001333");
  ASSERT_EQ(result.entities.size(), 1u);
  EXPECT_EQ(result.entities[0].type, PIIType::CPF);
  EXPECT_EQ(result.entities[0].validation_status, ValidationStatus::VALID);

  // CNH-only digits stay a CNH
  DetectionResult cnh = ::Run(*MakeDetector("balanced"), "minha cnh 12345678900");
  ASSERT_EQ(cnh.entities.size(), 1u);
  EXPECT_EQ(cnh.entities[0].type, PIIType::CNH);
}

TEST(DetectorTest, OffsetsCountCharacters) {
  std::string text = "Meu CPF é 529.982.247-25";
  DetectionResult result = ::Run(*MakeDetector("balanced"), text);
  ASSERT_EQ(result.entities.size(), 1u);
  EXPECT_EQ(result.entities[0].start, 10u);
  EXPECT_EQ(result.entities[0].end, 24u);
  EXPECT_EQ(result.entities[0].raw_value, "529.982.247-25");

  DetectionResult two = ::Run(*MakeDetector("balanced"),
                            "Ação: CPF 529.982.247-25, e-mail joao@exemplo.com.br");
  ExpectWellFormed(two);
  ASSERT_EQ(two.entities.size(), 2u);
  EXPECT_EQ(two.entities[0].start, 10u);
  EXPECT_EQ(two.entities[0].end, 24u);
  EXPECT_EQ(two.entities[1].type, PIIType::EMAIL);
}

TEST(DetectorTest, KeywordAnchoredPhoneWithoutAreaCode) {
  DetectionResult result = ::Run(*MakeDetector("balanced"), "telefone: 98765-4321");
  ASSERT_EQ(result.entities.size(), 1u);
  EXPECT_EQ(result.entities[0].type, PIIType::PHONE);
  EXPECT_EQ(result.entities[0].raw_value, "98765-4321");
  EXPECT_EQ(result.entities[0].reason, "afn_keyword");
  EXPECT_EQ(result.metadata.afn_added, 1);

  EXPECT_FALSE(::Run(*MakeDetector("precise"), "telefone: 98765-4321").has_pii);
}

TEST(DetectorTest, ContextualCandidatesAreFused) {
  std::string text = "Meu nome é João da Silva e meu CPF é 529.982.247-25";
  size_t name_start = text.find("João");
  size_t name_end = name_start + std::string("João da Silva").size();

  RecognizeResponse canned;
  canned.candidates.push_back({PIIType::NAME, name_start, name_end, 0.85});
  canned.candidates.push_back({PIIType::ORG, 0, 3, 0.40});  // Below threshold
  auto recognizer = std::make_shared<FakeRecognizer>(canned);

  DetectionResult result = ::Run(*MakeDetector("balanced", recognizer), text);
  ExpectWellFormed(result);
  ASSERT_EQ(result.entities.size(), 2u);
  EXPECT_EQ(result.entities[0].type, PIIType::NAME);
  EXPECT_EQ(result.entities[0].raw_value, "João da Silva");
  EXPECT_EQ(result.entities[0].reason, "contextual");
  EXPECT_EQ(result.entities[0].validation_status, ValidationStatus::NOT_APPLICABLE);
  EXPECT_EQ(result.entities[1].type, PIIType::CPF);
  EXPECT_EQ(result.metadata.by_type.at(PIIType::NAME), 1);
  EXPECT_EQ(result.metadata.by_type.at(PIIType::CPF), 1);
}

TEST(DetectorTest, MissingRecognizerDegrades) {
  std::string error;
  auto detector = GuardianDetector::Create(Preset("balanced"), nullptr, DetectorOptions(), &error);
  ASSERT_NE(detector, nullptr);
  EXPECT_EQ(detector->GetRecognizer().GetName(), "unavailable");

  DetectionResult result = ::Run(*detector, "CPF 529.982.247-25");
  EXPECT_TRUE(result.metadata.contextual_degraded);
  EXPECT_EQ(result.metadata.degraded_reason, "unavailable");
  ASSERT_EQ(result.entities.size(), 1u);
  EXPECT_EQ(result.entities[0].type, PIIType::CPF);
}

TEST(DetectorTest, SlowRecognizerTimesOut) {
  RecognizeResponse canned;
  canned.candidates.push_back({PIIType::NAME, 0, 3, 0.99});
  auto recognizer = std::make_shared<FakeRecognizer>(canned, 0, 400);

  DetectorOptions options;
  options.recognizer_timeout_ms = 30;
  auto detector = MakeDetector("balanced", recognizer, options);

  auto started = std::chrono::steady_clock::now();
  DetectionResult result = ::Run(*detector, "Ana CPF 529.982.247-25");
  auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_LT(elapsed, std::chrono::milliseconds(400));
  EXPECT_TRUE(result.metadata.contextual_degraded);
  EXPECT_EQ(result.metadata.degraded_reason, "timeout");
  ASSERT_EQ(result.entities.size(), 1u);
  EXPECT_EQ(result.entities[0].type, PIIType::CPF);
}

TEST(DetectorTest, StalledRecognizerCallsAreCapped) {
  auto recognizer = std::make_shared<FakeRecognizer>(RecognizeResponse(), 0, 150);
  recognizer->set_concurrency(1);

  DetectorOptions options;
  options.recognizer_timeout_ms = 20;
  auto detector = MakeDetector("balanced", recognizer, options);

  int busy = 0;
  for (int i = 0; i < 10; ++i) {
    DetectionResult result = ::Run(*detector, "CPF 529.982.247-25");
    EXPECT_TRUE(result.metadata.contextual_degraded);
    ASSERT_EQ(result.entities.size(), 1u);
    if (result.metadata.degraded_reason == "busy") busy++;
  }
  EXPECT_GT(busy, 0);

  auto started = std::chrono::steady_clock::now();
  detector.reset();
  auto elapsed = std::chrono::steady_clock::now() - started;
  EXPECT_LT(elapsed, std::chrono::milliseconds(600));
  EXPECT_LT(recognizer->calls(), 10);
}

TEST(DetectorTest, ContractViolationIsProtocolError) {
  RecognizeResponse canned;
  canned.candidates.push_back({PIIType::CPF, 0, 3, 0.99});
  auto detector = MakeDetector("balanced", std::make_shared<FakeRecognizer>(canned));

  DetectionResult result = ::Run(*detector, "abc e-mail x@y.com.br");
  EXPECT_TRUE(result.metadata.contextual_degraded);
  EXPECT_EQ(result.metadata.degraded_reason, "protocol_error");
  ASSERT_EQ(result.entities.size(), 1u);
  EXPECT_EQ(result.entities[0].type, PIIType::EMAIL);
}

TEST(DetectorTest, MalformedSpansAreDropped) {
  std::string text = "Olá, João";
  RecognizeResponse canned;
  canned.candidates.push_back({PIIType::NAME, 5, 500, 0.9});  // Out of range
  canned.candidates.push_back({PIIType::NAME, 8, 4, 0.9});    // Reversed
  canned.candidates.push_back({PIIType::NAME, 3, 6, 0.9});    // Starts inside 'á'
  auto detector = MakeDetector("balanced", std::make_shared<FakeRecognizer>(canned));

  DetectionResult result = ::Run(*detector, text);
  EXPECT_FALSE(result.metadata.contextual_degraded);
  EXPECT_FALSE(result.has_pii);
}

TEST(DetectorTest, LongTextIsTruncatedForRecognizer) {
  auto recognizer = std::make_shared<FakeRecognizer>(RecognizeResponse(), 16);
  auto detector = MakeDetector("balanced", recognizer);

  std::string text = "Informação com acentuação e o CPF 529.982.247-25 no final";
  DetectionResult result = ::Run(*detector, text);
  EXPECT_TRUE(result.metadata.truncated);
  std::string seen = recognizer->last_text();
  EXPECT_LE(seen.size(), 16u);
  EXPECT_EQ(text.compare(0, seen.size(), seen), 0);

  // Regex still scans the whole text
  ASSERT_EQ(result.entities.size(), 1u);
  EXPECT_EQ(result.entities[0].type, PIIType::CPF);
}

TEST(DetectorTest, InvalidUtf8IsRejected) {
  auto detector = MakeDetector("balanced");
  DetectResponse response = detector->Detect(std::string("CPF \xff\xfe 529.982.247-25"));
  EXPECT_FALSE(response.success());
  EXPECT_EQ(response.status, DetectStatus::INVALID_ENCODING);
  EXPECT_FALSE(response.error.empty());
  EXPECT_EQ(DetectStatusToString(response.status), "invalid_encoding");
}

TEST(DetectorTest, BlankInput) {
  auto recognizer = std::make_shared<FakeRecognizer>();
  auto detector = MakeDetector("strict", recognizer);
  for (const std::string text : {"", "   ", "\n\t  \r\n"}) {
    DetectResponse response = detector->Detect(text);
    ASSERT_TRUE(response.success());
    EXPECT_FALSE(response.result.has_pii);
    EXPECT_EQ(response.result.metadata.text_fingerprint.size(), 64u);
  }
  EXPECT_EQ(recognizer->calls(), 0);
}

TEST(DetectorTest, FingerprintCanBeDisabled) {
  DetectorOptions options;
  options.compute_fingerprint = false;
  auto detector = MakeDetector("balanced", std::make_shared<FakeRecognizer>(), options);
  EXPECT_TRUE(::Run(*detector, "CPF 529.982.247-25").metadata.text_fingerprint.empty());
}

TEST(DetectorTest, DeterministicOutput) {
  std::string text =
      "Requerente: CPF 529.982.247-25, CNPJ 11.222.333/0001-81, tel (11) 98765-4321, "
      "email maria@exemplo.com.br, CEP 01310-100, RG 12.345.678-9, cnh 12345678900";
  auto detector = MakeDetector("strict");
  DetectionResult first = ::Run(*detector, text);
  ExpectWellFormed(first);
  EXPECT_GE(first.entities.size(), 6u);

  std::string expected = ResultToJson(first).dump();
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(ResultToJson(::Run(*detector, text)).dump(), expected);
  }
}

TEST(DetectorTest, ConcurrentCallsAgree) {
  auto detector = MakeDetector("balanced");
  std::string text = "CPF 529.982.247-25 e email ana@exemplo.com";
  std::string expected = ResultToJson(::Run(*detector, text)).dump();

  std::atomic<int> mismatches{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 20; ++i) {
        if (ResultToJson(detector->Detect(text).result).dump() != expected) {
          mismatches++;
        }
      }
    });
  }
  for (auto& thread : threads) thread.join();
  EXPECT_EQ(mismatches.load(), 0);
}

TEST(DetectorTest, CreateRejectsBadSettings) {
  std::string error;
  ModePolicy broken = Preset("balanced");
  broken.base_threshold = 1.5;
  EXPECT_EQ(GuardianDetector::Create(broken, nullptr, DetectorOptions(), &error), nullptr);
  EXPECT_FALSE(error.empty());

  DetectorOptions options;
  options.recognizer_timeout_ms = 0;
  error.clear();
  EXPECT_EQ(GuardianDetector::Create(Preset("balanced"), nullptr, options, &error), nullptr);
  EXPECT_FALSE(error.empty());
}

TEST(DetectorTest, InvalidMatchesArePenalized) {
  std::vector<RawCandidate> raw(2);
  raw[0].type = PIIType::CPF;
  raw[0].raw_value = "123.456.789-00";
  raw[0].base_confidence = 0.90;
  raw[1].type = PIIType::CPF;
  raw[1].raw_value = "529.982.247-25";
  raw[1].base_confidence = 0.90;

  auto entities = GuardianDetector::BuildRegexEntities(raw);
  ASSERT_EQ(entities.size(), 2u);
  EXPECT_DOUBLE_EQ(entities[0].base_confidence, 0.45);
  EXPECT_EQ(entities[0].validation_status, ValidationStatus::INVALID);
  EXPECT_TRUE(entities[0].structurally_valid);
  EXPECT_DOUBLE_EQ(entities[1].base_confidence, 0.90);
  EXPECT_EQ(entities[1].validation_status, ValidationStatus::VALID);
}
