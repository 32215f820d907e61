#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include "guardian_batch_detector.h"
#include "guardian_result_json.h"

using namespace GuardianPII;

namespace {

std::shared_ptr<const GuardianDetector> MakeDetector(const std::string& mode) {
  ModePolicy policy;
  EXPECT_TRUE(FindPreset(mode, &policy));
  std::string error;
  std::shared_ptr<const GuardianDetector> detector =
      GuardianDetector::Create(policy, nullptr, DetectorOptions(), &error);
  EXPECT_NE(detector, nullptr) << error;
  return detector;
}

}  // namespace

TEST(BatchDetectorTest, ResponsesKeepInputOrder) {
  auto detector = MakeDetector("balanced");
  GuardianBatchDetector batch(detector, 4);

  std::vector<std::string> texts = {
      "CPF 529.982.247-25",
      "nada a declarar",
      "bytes ruins \xff\xfe",
      "email a@b.com e CEP 01310-100",
  };
  auto responses = batch.DetectAll(texts);
  ASSERT_EQ(responses.size(), 4u);

  ASSERT_TRUE(responses[0].success());
  ASSERT_EQ(responses[0].result.entities.size(), 1u);
  EXPECT_EQ(responses[0].result.entities[0].type, PIIType::CPF);

  ASSERT_TRUE(responses[1].success());
  EXPECT_FALSE(responses[1].result.has_pii);

  EXPECT_EQ(responses[2].status, DetectStatus::INVALID_ENCODING);

  ASSERT_TRUE(responses[3].success());
  ASSERT_EQ(responses[3].result.entities.size(), 2u);
  EXPECT_EQ(responses[3].result.entities[0].type, PIIType::EMAIL);
  EXPECT_EQ(responses[3].result.entities[1].type, PIIType::CEP);
}

TEST(BatchDetectorTest, Summary) {
  auto detector = MakeDetector("balanced");
  GuardianBatchDetector batch(detector, 2);
  auto responses = batch.DetectAll({
      "CPF 529.982.247-25",
      "nada a declarar",
      "bytes ruins \xff\xfe",
      "email a@b.com e CEP 01310-100",
  });

  BatchSummary summary = GuardianBatchDetector::Summarize(responses);
  EXPECT_EQ(summary.texts, 4u);
  EXPECT_EQ(summary.with_pii, 2u);
  EXPECT_EQ(summary.rejected, 1u);
  EXPECT_EQ(summary.degraded, 3u);  // No recognizer configured
  EXPECT_EQ(summary.afn_triggered, 2u);
  EXPECT_EQ(summary.by_type.at(PIIType::CPF), 1);
  EXPECT_EQ(summary.by_type.at(PIIType::EMAIL), 1);
  EXPECT_EQ(summary.by_type.at(PIIType::CEP), 1);
  EXPECT_NE(summary.ToString().find("4 texts, 2 with PII"), std::string::npos);
}

TEST(BatchDetectorTest, MatchesSequentialDetection) {
  auto detector = MakeDetector("strict");
  std::vector<std::string> texts;
  for (int i = 0; i < 100; ++i) {
    switch (i % 4) {
      case 0: texts.push_back("registro " + std::to_string(i) + " CPF 529.982.247-25"); break;
      case 1: texts.push_back("protocolo abc52998224725def " + std::to_string(i)); break;
      case 2: texts.push_back("ligue (11) 98765-4321 ou 11 3456-7890"); break;
      default: texts.push_back("texto comum numero " + std::to_string(i)); break;
    }
  }

  GuardianBatchDetector batch(detector, 8);
  auto responses = batch.DetectAll(texts);
  ASSERT_EQ(responses.size(), texts.size());
  for (size_t i = 0; i < texts.size(); ++i) {
    EXPECT_EQ(ResponseToJson(responses[i]).dump(),
              ResponseToJson(detector->Detect(texts[i])).dump()) << texts[i];
  }
}

TEST(BatchDetectorTest, EmptyBatch) {
  GuardianBatchDetector batch(MakeDetector("precise"), 2);
  EXPECT_TRUE(batch.DetectAll({}).empty());
  BatchSummary summary = GuardianBatchDetector::Summarize({});
  EXPECT_EQ(summary.texts, 0u);
  EXPECT_TRUE(summary.by_type.empty());
}

TEST(BatchDetectorTest, AtLeastOneWorker) {
  GuardianBatchDetector batch(MakeDetector("precise"), 0);
  EXPECT_EQ(batch.GetWorkerCount(), 1u);
}
