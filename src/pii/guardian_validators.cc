#include "guardian_validators.h"
#include "guardian_text_utils.h"
#include <algorithm>
#include <cstdlib>

namespace GuardianPII {

namespace {

bool AllSameDigit(const std::string& digits) {
  return !digits.empty() &&
         std::all_of(digits.begin(), digits.end(),
                     [&](char c) { return c == digits[0]; });
}

int Digit(char c) { return c - '0'; }

// Mod-11 check digit shared by CPF and CNPJ
int Mod11CheckDigit(const std::string& digits, const int* weights, size_t count) {
  int sum = 0;
  for (size_t i = 0; i < count; ++i) {
    sum += Digit(digits[i]) * weights[i];
  }
  int remainder = sum % 11;
  return remainder < 2 ? 0 : 11 - remainder;
}

constexpr int kValidDDDs[] = {
  11, 12, 13, 14, 15, 16, 17, 18, 19,
  21, 22, 24, 27, 28,
  31, 32, 33, 34, 35, 37, 38,
  41, 42, 43, 44, 45, 46, 47, 48, 49,
  51, 53, 54, 55,
  61, 62, 63, 64, 65, 66, 67, 68, 69,
  71, 73, 74, 75, 77, 79,
  81, 82, 83, 84, 85, 86, 87, 88, 89,
  91, 92, 93, 94, 95, 96, 97, 98, 99
};

struct CepRange {
  int low;   // First five digits, inclusive
  int high;
  const char* state;
};

constexpr CepRange kCepRanges[] = {
  {1000, 19999, "SP"},
  {20000, 28999, "RJ"},
  {29000, 29999, "ES"},
  {30000, 39999, "MG"},
  {40000, 48999, "BA"},
  {49000, 49999, "SE"},
  {50000, 56999, "PE"},
  {57000, 57999, "AL"},
  {58000, 58999, "PB"},
  {59000, 59999, "RN"},
  {60000, 63999, "CE"},
  {64000, 64999, "PI"},
  {65000, 65999, "MA"},
  {66000, 68899, "PA"},
  {68900, 68999, "AP"},
  {69000, 69299, "AM"},
  {69300, 69399, "RR"},
  {69400, 69899, "AM"},
  {69900, 69999, "AC"},
  {70000, 72799, "DF"},
  {72800, 72999, "GO"},
  {73000, 73699, "DF"},
  {73700, 76799, "GO"},
  {76800, 76999, "RO"},
  {77000, 77999, "TO"},
  {78000, 78899, "MT"},
  {78900, 78999, "RO"},
  {79000, 79999, "MS"},
  {80000, 87999, "PR"},
  {88000, 89999, "SC"},
  {90000, 99999, "RS"},
};

}  // namespace

bool ComputeCPFCheckDigits(const std::string& base, int* first, int* second) {
  if (base.size() < 9 ||
      !std::all_of(base.begin(), base.begin() + 9, IsAsciiDigit)) {
    return false;
  }

  static const int kFirstWeights[] = {10, 9, 8, 7, 6, 5, 4, 3, 2};
  static const int kSecondWeights[] = {11, 10, 9, 8, 7, 6, 5, 4, 3, 2};

  std::string digits = base.substr(0, 9);
  *first = Mod11CheckDigit(digits, kFirstWeights, 9);
  digits.push_back(static_cast<char>('0' + *first));
  *second = Mod11CheckDigit(digits, kSecondWeights, 10);
  return true;
}

ValidationResult ValidateCPF(const std::string& raw) {
  ValidationResult result;
  result.normalized = DigitsOnly(raw);
  const std::string& cpf = result.normalized;

  if (cpf.size() != 11 || AllSameDigit(cpf)) {
    return result;
  }
  result.structurally_valid = true;

  int first = 0;
  int second = 0;
  if (!ComputeCPFCheckDigits(cpf, &first, &second)) {
    return result;
  }
  result.valid = Digit(cpf[9]) == first && Digit(cpf[10]) == second;
  return result;
}

ValidationResult ValidateCNPJ(const std::string& raw) {
  ValidationResult result;
  result.normalized = DigitsOnly(raw);
  const std::string& cnpj = result.normalized;

  if (cnpj.size() != 14 || AllSameDigit(cnpj)) {
    return result;
  }
  result.structurally_valid = true;

  static const int kFirstWeights[] = {5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};
  static const int kSecondWeights[] = {6, 5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};

  int first = Mod11CheckDigit(cnpj, kFirstWeights, 12);
  int second = Mod11CheckDigit(cnpj, kSecondWeights, 13);
  result.valid = Digit(cnpj[12]) == first && Digit(cnpj[13]) == second;
  return result;
}

bool IsValidDDD(int ddd) {
  return std::find(std::begin(kValidDDDs), std::end(kValidDDDs), ddd) !=
         std::end(kValidDDDs);
}

ValidationResult ValidatePhone(const std::string& raw) {
  ValidationResult result;
  std::string digits = DigitsOnly(raw);
  if (digits.size() > 11 && digits.compare(0, 2, "55") == 0) {
    digits = digits.substr(2);
  }
  result.normalized = digits;

  if (digits.size() != 10 && digits.size() != 11) {
    return result;
  }
  result.structurally_valid = true;

  int ddd = std::atoi(digits.substr(0, 2).c_str());
  if (!IsValidDDD(ddd)) {
    return result;
  }

  // Subscriber part made of one repeated digit is filler, not a number
  if (AllSameDigit(digits.substr(2))) {
    return result;
  }
  result.valid = digits.size() == 10 || digits[2] == '9';
  return result;
}

std::string GetCepRegion(const std::string& digits) {
  if (digits.size() != 8 || !std::all_of(digits.begin(), digits.end(), IsAsciiDigit)) {
    return "";
  }
  int prefix = std::atoi(digits.substr(0, 5).c_str());
  for (const auto& range : kCepRanges) {
    if (prefix >= range.low && prefix <= range.high) {
      return range.state;
    }
  }
  return "";
}

ValidationResult ValidateCEP(const std::string& raw) {
  ValidationResult result;
  result.normalized = DigitsOnly(raw);
  const std::string& cep = result.normalized;

  if (cep.size() != 8 || AllSameDigit(cep)) {
    return result;
  }
  result.structurally_valid = true;
  result.valid = !GetCepRegion(cep).empty();
  return result;
}

ValidationResult ValidateEmail(const std::string& raw) {
  ValidationResult result;
  std::string email = FoldCase(raw);
  size_t first = email.find_first_not_of(" \t\r\n");
  size_t last = email.find_last_not_of(" \t\r\n");
  email = first == std::string::npos ? "" : email.substr(first, last - first + 1);
  result.normalized = email;

  size_t at = email.rfind('@');
  if (at == std::string::npos || at == 0 || email.find('@') != at) {
    return result;
  }
  std::string local = email.substr(0, at);
  std::string domain = email.substr(at + 1);
  if (local.size() > 64 || domain.empty() || domain.size() > 255) {
    return result;
  }

  for (char c : local) {
    if (!IsAsciiAlpha(c) && !IsAsciiDigit(c) && std::string("._%+-").find(c) == std::string::npos) {
      return result;
    }
  }
  for (char c : domain) {
    if (!IsAsciiAlpha(c) && !IsAsciiDigit(c) && c != '.' && c != '-') {
      return result;
    }
  }
  if (domain.front() == '.' || domain.back() == '.' ||
      domain.find("..") != std::string::npos) {
    return result;
  }

  size_t dot = domain.rfind('.');
  if (dot == std::string::npos) {
    return result;
  }
  std::string tld = domain.substr(dot + 1);
  if (tld.size() < 2 || tld.size() > 24 ||
      !std::all_of(tld.begin(), tld.end(), IsAsciiAlpha)) {
    return result;
  }

  result.structurally_valid = true;
  result.valid = true;
  return result;
}

ValidationResult ValidateRG(const std::string& raw) {
  ValidationResult result;
  std::string value;
  for (char c : raw) {
    if (IsAsciiDigit(c)) {
      value.push_back(c);
    } else if (c == 'x' || c == 'X') {
      value.push_back('X');
    }
  }
  result.normalized = value;

  // X is only allowed as the final check character
  size_t x = value.find('X');
  bool x_ok = x == std::string::npos || x == value.size() - 1;
  result.structurally_valid = x_ok && value.size() >= 7 && value.size() <= 9 &&
                              !AllSameDigit(value);
  result.valid = result.structurally_valid;
  return result;
}

ValidationResult ValidateCNH(const std::string& raw) {
  ValidationResult result;
  result.normalized = DigitsOnly(raw);
  const std::string& cnh = result.normalized;

  if (cnh.size() != 11 || AllSameDigit(cnh)) {
    return result;
  }
  result.structurally_valid = true;

  int sum = 0;
  for (int i = 0; i < 9; ++i) {
    sum += Digit(cnh[i]) * (9 - i);
  }
  int first = sum % 11;
  int discount = 0;
  if (first >= 10) {
    first = 0;
    discount = 2;
  }

  sum = 0;
  for (int i = 0; i < 9; ++i) {
    sum += Digit(cnh[i]) * (1 + i);
  }
  int second = sum % 11;
  if (second >= 10) {
    second = 0;
  } else {
    second -= discount;
  }
  if (second < 0) {
    return result;
  }

  result.valid = Digit(cnh[9]) == first && Digit(cnh[10]) == second;
  return result;
}

ValidationResult ValidatePIS(const std::string& raw) {
  ValidationResult result;
  result.normalized = DigitsOnly(raw);
  const std::string& pis = result.normalized;

  if (pis.size() != 11 || AllSameDigit(pis)) {
    return result;
  }
  result.structurally_valid = true;

  static const int kWeights[] = {3, 2, 9, 8, 7, 6, 5, 4, 3, 2};
  int sum = 0;
  for (int i = 0; i < 10; ++i) {
    sum += Digit(pis[i]) * kWeights[i];
  }
  int check = 11 - sum % 11;
  if (check >= 10) {
    check = 0;
  }
  result.valid = Digit(pis[10]) == check;
  return result;
}

ValidationResult ValidateVoterId(const std::string& raw) {
  ValidationResult result;
  result.normalized = DigitsOnly(raw);
  const std::string& title = result.normalized;

  if (title.size() != 12 || AllSameDigit(title)) {
    return result;
  }
  int state = Digit(title[8]) * 10 + Digit(title[9]);
  if (state < 1 || state > 28) {
    return result;
  }
  result.structurally_valid = true;

  // SP (01) and MG (02) turn a zero remainder into 1
  bool zero_is_one = state == 1 || state == 2;

  int sum = 0;
  for (int i = 0; i < 8; ++i) {
    sum += Digit(title[i]) * (2 + i);
  }
  int first = sum % 11;
  if (first == 10) {
    first = 0;
  } else if (first == 0 && zero_is_one) {
    first = 1;
  }

  sum = Digit(title[8]) * 7 + Digit(title[9]) * 8 + first * 9;
  int second = sum % 11;
  if (second == 10) {
    second = 0;
  } else if (second == 0 && zero_is_one) {
    second = 1;
  }

  result.valid = Digit(title[10]) == first && Digit(title[11]) == second;
  return result;
}

bool PassesLuhn(const std::string& digits) {
  if (digits.empty() || !std::all_of(digits.begin(), digits.end(), IsAsciiDigit)) {
    return false;
  }

  int sum = 0;
  bool alternate = false;
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    int digit = Digit(*it);
    if (alternate) {
      digit *= 2;
      if (digit > 9) {
        digit -= 9;
      }
    }
    sum += digit;
    alternate = !alternate;
  }
  return sum % 10 == 0;
}

ValidationResult ValidateCreditCard(const std::string& raw) {
  ValidationResult result;
  result.normalized = DigitsOnly(raw);
  const std::string& card = result.normalized;

  if (card.size() < 13 || card.size() > 19 || AllSameDigit(card)) {
    return result;
  }
  result.structurally_valid = true;
  result.valid = PassesLuhn(card);
  return result;
}

ValidationResult ValidateVehiclePlate(const std::string& raw) {
  ValidationResult result;
  std::string plate;
  for (char c : raw) {
    if (IsAsciiAlpha(c) || IsAsciiDigit(c)) {
      plate.push_back(IsAsciiUpper(c) || IsAsciiDigit(c) ? c : static_cast<char>(c - 0x20));
    }
  }
  result.normalized = plate;

  // AAA9999 (old) or AAA9A99 (Mercosul)
  bool shape = plate.size() == 7 && IsAsciiAlpha(plate[0]) && IsAsciiAlpha(plate[1]) &&
               IsAsciiAlpha(plate[2]) && IsAsciiDigit(plate[3]) &&
               (IsAsciiDigit(plate[4]) || IsAsciiAlpha(plate[4])) &&
               IsAsciiDigit(plate[5]) && IsAsciiDigit(plate[6]);
  result.structurally_valid = shape;
  result.valid = shape;
  return result;
}

ValidationResult ValidatePassport(const std::string& raw) {
  ValidationResult result;
  std::string passport;
  for (char c : raw) {
    if (IsAsciiAlpha(c) || IsAsciiDigit(c)) {
      passport.push_back(IsAsciiUpper(c) || IsAsciiDigit(c) ? c : static_cast<char>(c - 0x20));
    }
  }
  result.normalized = passport;

  bool shape = passport.size() == 8 && IsAsciiAlpha(passport[0]) && IsAsciiAlpha(passport[1]) &&
               std::all_of(passport.begin() + 2, passport.end(), IsAsciiDigit) &&
               !AllSameDigit(passport.substr(2));
  result.structurally_valid = shape;
  result.valid = shape;
  return result;
}

ValidationResult Validate(PIIType type, const std::string& raw) {
  switch (type) {
    case PIIType::CPF: return ValidateCPF(raw);
    case PIIType::CNPJ: return ValidateCNPJ(raw);
    case PIIType::PHONE: return ValidatePhone(raw);
    case PIIType::EMAIL: return ValidateEmail(raw);
    case PIIType::CEP: return ValidateCEP(raw);
    case PIIType::RG: return ValidateRG(raw);
    case PIIType::CNH: return ValidateCNH(raw);
    case PIIType::PIS_PASEP: return ValidatePIS(raw);
    case PIIType::VOTER_ID: return ValidateVoterId(raw);
    case PIIType::CREDIT_CARD: return ValidateCreditCard(raw);
    case PIIType::VEHICLE_PLATE: return ValidateVehiclePlate(raw);
    case PIIType::PASSPORT: return ValidatePassport(raw);
    default: {
      ValidationResult result;
      result.normalized = raw;
      result.structurally_valid = true;
      return result;
    }
  }
}

ValidationStatus StatusFor(PIIType type, const ValidationResult& result) {
  if (type == PIIType::RG || type == PIIType::VEHICLE_PLATE || type == PIIType::PASSPORT ||
      IsContextualType(type)) {
    return ValidationStatus::NOT_APPLICABLE;
  }
  return result.valid ? ValidationStatus::VALID : ValidationStatus::INVALID;
}

bool IsChecksumType(PIIType type) {
  return type == PIIType::CPF || type == PIIType::CNPJ || type == PIIType::CNH ||
         type == PIIType::PIS_PASEP || type == PIIType::VOTER_ID ||
         type == PIIType::CREDIT_CARD;
}

}  // namespace GuardianPII
