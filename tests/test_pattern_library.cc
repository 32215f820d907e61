#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>

#include "guardian_pattern_library.h"

using namespace GuardianPII;

namespace {

std::vector<RawCandidate> Extract(const std::string& text,
                                  AggressiveRegex tier = AggressiveRegex::OFF) {
  return GuardianPatternLibrary::GetInstance().Extract(text, tier);
}

bool HasType(const std::vector<RawCandidate>& candidates, PIIType type) {
  return std::any_of(candidates.begin(), candidates.end(),
                     [type](const RawCandidate& c) { return c.type == type; });
}

}  // namespace

TEST(PatternLibraryTest, SingletonIsShared) {
  EXPECT_EQ(&GuardianPatternLibrary::GetInstance(), &GuardianPatternLibrary::GetInstance());
  EXPECT_EQ(GuardianPatternLibrary::GetInstance().GetPatternCount(), 23u);
}

TEST(PatternLibraryTest, FormattedCpfUsesByteOffsets) {
  std::string text = "Meu CPF é 123.456.789-09";
  auto candidates = Extract(text);
  ASSERT_EQ(candidates.size(), 1u);
  EXPECT_EQ(candidates[0].type, PIIType::CPF);
  EXPECT_EQ(candidates[0].raw_value, "123.456.789-09");
  EXPECT_EQ(candidates[0].start, 11u);  // 'é' takes two bytes
  EXPECT_EQ(candidates[0].end, text.size());
  EXPECT_DOUBLE_EQ(candidates[0].base_confidence, 0.90);
  EXPECT_EQ(candidates[0].pattern_index, 0);
}

TEST(PatternLibraryTest, FormattedCnpj) {
  auto candidates = Extract("Empresa CNPJ 11.222.333/0001-81 ativa");
  ASSERT_EQ(candidates.size(), 1u);
  EXPECT_EQ(candidates[0].type, PIIType::CNPJ);
  EXPECT_EQ(candidates[0].raw_value, "11.222.333/0001-81");
}

TEST(PatternLibraryTest, PhoneFormats) {
  for (const std::string phone : {"(11) 98765-4321", "+55 11 98765-4321", "11 3456-7890",
                                  "(21) 3456-7890"}) {
    auto candidates = Extract("Contato: " + phone + ".");
    ASSERT_FALSE(candidates.empty()) << phone;
    EXPECT_EQ(candidates[0].type, PIIType::PHONE) << phone;
    EXPECT_EQ(candidates[0].raw_value, phone);
  }
}

TEST(PatternLibraryTest, LandlinesOutsideTwoToFive) {
  for (const std::string phone : {"(61) 7123-4567", "(11) 8123-4567", "31 6123-4567"}) {
    auto candidates = Extract("fixo " + phone);
    ASSERT_EQ(candidates.size(), 1u) << phone;
    EXPECT_EQ(candidates[0].type, PIIType::PHONE) << phone;
    EXPECT_EQ(candidates[0].raw_value, phone);
  }
}

TEST(PatternLibraryTest, DocumentNumbers) {
  auto pis = Extract("PIS 170.33259.50-4");
  ASSERT_EQ(pis.size(), 1u);
  EXPECT_EQ(pis[0].type, PIIType::PIS_PASEP);

  auto title = Extract("título 0043 5687 0906");
  ASSERT_EQ(title.size(), 1u);
  EXPECT_EQ(title[0].type, PIIType::VOTER_ID);
  EXPECT_EQ(title[0].raw_value, "0043 5687 0906");

  auto card = Extract("cartão 4111-1111-1111-1111 vence");
  ASSERT_EQ(card.size(), 1u);
  EXPECT_EQ(card[0].type, PIIType::CREDIT_CARD);
  EXPECT_EQ(card[0].raw_value, "4111-1111-1111-1111");

  // Space-grouped cards also read as a voter ID; fusion settles it
  EXPECT_TRUE(HasType(Extract("cartão 4111 1111 1111 1111"), PIIType::CREDIT_CARD));

  auto plates = Extract("placas ABC-1234 e BRA2E19");
  ASSERT_EQ(plates.size(), 2u);
  EXPECT_EQ(plates[0].type, PIIType::VEHICLE_PLATE);
  EXPECT_EQ(plates[1].type, PIIType::VEHICLE_PLATE);
  EXPECT_EQ(plates[1].raw_value, "BRA2E19");

  auto passport = Extract("passaporte AB123456");
  ASSERT_EQ(passport.size(), 1u);
  EXPECT_EQ(passport[0].type, PIIType::PASSPORT);
}

TEST(PatternLibraryTest, EmailAndCep) {
  auto candidates = Extract("Escreva para maria.souza@exemplo.com.br ou CEP 01310-100");
  ASSERT_EQ(candidates.size(), 2u);
  EXPECT_EQ(candidates[0].type, PIIType::EMAIL);
  EXPECT_EQ(candidates[0].raw_value, "maria.souza@exemplo.com.br");
  EXPECT_EQ(candidates[1].type, PIIType::CEP);
  EXPECT_EQ(candidates[1].raw_value, "01310-100");
}

TEST(PatternLibraryTest, RgVariants) {
  auto plain = Extract("RG 12.345.678-9");
  ASSERT_EQ(plain.size(), 1u);
  EXPECT_EQ(plain[0].type, PIIType::RG);

  auto with_x = Extract("RG 12.345.678-X emitido");
  ASSERT_EQ(with_x.size(), 1u);
  EXPECT_EQ(with_x[0].raw_value, "12.345.678-X");
}

TEST(PatternLibraryTest, OutputOrderedByStart) {
  auto candidates = Extract("joao@mail.com, 123.456.789-09, (11) 98765-4321");
  ASSERT_EQ(candidates.size(), 3u);
  EXPECT_EQ(candidates[0].type, PIIType::EMAIL);
  EXPECT_EQ(candidates[1].type, PIIType::CPF);
  EXPECT_EQ(candidates[2].type, PIIType::PHONE);
  for (size_t i = 1; i < candidates.size(); ++i) {
    EXPECT_LE(candidates[i - 1].start, candidates[i].start);
  }
}

TEST(PatternLibraryTest, SameSpanTiesFollowTypeOrder) {
  auto candidates = Extract("numero 52998224725 fim", AggressiveRegex::PARTIAL);
  ASSERT_EQ(candidates.size(), 3u);
  EXPECT_EQ(candidates[0].type, PIIType::CPF);
  EXPECT_EQ(candidates[1].type, PIIType::PHONE);
  EXPECT_EQ(candidates[2].type, PIIType::CNH);
}

TEST(PatternLibraryTest, MaskedDataIgnored) {
  EXPECT_TRUE(Extract("CPF: ***.456.789-**", AggressiveRegex::ON).empty());
  EXPECT_TRUE(Extract("CPF: ***123.456.789-09").empty());
  EXPECT_TRUE(Extract("CPF: 123.456.789-09***").empty());
}

TEST(PatternLibraryTest, AggressiveTiers) {
  std::string unformatted = "documento 52998224725";
  EXPECT_FALSE(HasType(Extract(unformatted, AggressiveRegex::OFF), PIIType::CPF));
  EXPECT_TRUE(HasType(Extract(unformatted, AggressiveRegex::PARTIAL), PIIType::CPF));

  std::string bare_cep = "cep 01310100";
  EXPECT_FALSE(HasType(Extract(bare_cep, AggressiveRegex::OFF), PIIType::CEP));
  EXPECT_TRUE(HasType(Extract(bare_cep, AggressiveRegex::PARTIAL), PIIType::CEP));

  std::string bare_digits = "registro 12345678900";
  EXPECT_FALSE(HasType(Extract(bare_digits, AggressiveRegex::OFF), PIIType::CNH));
  EXPECT_TRUE(HasType(Extract(bare_digits, AggressiveRegex::PARTIAL), PIIType::CNH));

  std::string bare_title = "titulo 004356870906";
  EXPECT_TRUE(Extract(bare_title, AggressiveRegex::OFF).empty());
  EXPECT_TRUE(HasType(Extract(bare_title, AggressiveRegex::PARTIAL), PIIType::VOTER_ID));

  std::string local_phone = "ligue 98765-4321";
  EXPECT_FALSE(HasType(Extract(local_phone, AggressiveRegex::PARTIAL), PIIType::PHONE));
  EXPECT_TRUE(HasType(Extract(local_phone, AggressiveRegex::ON), PIIType::PHONE));
}

TEST(PatternLibraryTest, DigitsGluedToLettersAreNotMatched) {
  EXPECT_TRUE(Extract("protocolo52998224725x", AggressiveRegex::ON).empty());
}

TEST(PatternLibraryTest, Deterministic) {
  std::string text = "CPF 529.982.247-25, tel (11) 98765-4321, email a@b.com, cep 01310-100";
  auto first = Extract(text, AggressiveRegex::ON);
  auto second = Extract(text, AggressiveRegex::ON);
  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].type, second[i].type);
    EXPECT_EQ(first[i].start, second[i].start);
    EXPECT_EQ(first[i].end, second[i].end);
  }
}

TEST(PatternLibraryTest, AdversarialInputCompletes) {
  std::string text;
  for (int i = 0; i < 2000; ++i) text += "1.";
  text += std::string(3000, 'a') + "@" + std::string(3000, 'b');
  auto candidates = Extract(text, AggressiveRegex::ON);
  SUCCEED() << candidates.size() << " candidates";
}

TEST(PatternLibraryTest, NoPiiText) {
  EXPECT_TRUE(Extract("Solicito o horário de funcionamento do órgão", AggressiveRegex::ON).empty());
}
