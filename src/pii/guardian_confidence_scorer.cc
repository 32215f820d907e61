#include "guardian_confidence_scorer.h"
#include "guardian_text_utils.h"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace GuardianPII {

std::string ScoreBreakdown::ToString() const {
  std::stringstream ss;
  ss << "base=" << base << " validation=+" << validation
     << " keyword=+" << keyword << " corroboration=+" << corroboration
     << " final=" << final_confidence;
  return ss.str();
}

const std::vector<std::string>& ConfidenceScorer::GetKeywords() {
  static const std::vector<std::string> kKeywords = {
    "cpf", "cnpj", "cnh", "documento", "identidade", "registro geral",
    "habilitação", "habilitacao", "nascimento", "nascido", "nascida",
    "endereço", "endereco", "residente", "domicílio", "cep",
    "telefone", "celular", "contato", "whatsapp", "e-mail", "email",
    "nome", "requerente", "solicitante", "portador"
  };
  return kKeywords;
}

bool ConfidenceScorer::EarnsValidationBonus(PIIType type) {
  return type == PIIType::CPF || type == PIIType::CNPJ ||
         type == PIIType::CEP || type == PIIType::PHONE;
}

bool ConfidenceScorer::HasKeywordNear(const std::string& text, size_t start, size_t end,
                                      size_t window) {
  start = std::min(start, text.size());
  end = std::min(std::max(end, start), text.size());

  size_t left_begin = Utf8Retreat(text, start, window);
  size_t right_end = Utf8Advance(text, end, window);

  std::string left = FoldCase(text.substr(left_begin, start - left_begin));
  std::string right = FoldCase(text.substr(end, right_end - end));

  for (const auto& keyword : GetKeywords()) {
    if (left.find(keyword) != std::string::npos ||
        right.find(keyword) != std::string::npos) {
      return true;
    }
  }
  return false;
}

ScoreBreakdown ConfidenceScorer::Score(Entity& entity, const std::string& text, size_t window) {
  ScoreBreakdown breakdown;
  breakdown.base = std::isfinite(entity.base_confidence)
                       ? std::clamp(entity.base_confidence, 0.0, 1.0)
                       : 0.0;

  if (entity.validation_status == ValidationStatus::VALID &&
      EarnsValidationBonus(entity.type)) {
    breakdown.validation = kValidBonus;
  }
  if (HasKeywordNear(text, entity.start, entity.end, window)) {
    breakdown.keyword = kKeywordBonus;
  }
  if (CountSources(entity.sources) > 1) {
    breakdown.corroboration = kCorroborationBonus;
  }

  breakdown.final_confidence = std::min(
      1.0, breakdown.base + breakdown.validation + breakdown.keyword + breakdown.corroboration);
  entity.confidence = breakdown.final_confidence;
  return breakdown;
}

void ConfidenceScorer::ScoreAll(std::vector<Entity>& entities, const std::string& text) {
  for (auto& entity : entities) {
    Score(entity, text);
  }
}

}  // namespace GuardianPII
