#ifndef GUARDIAN_VALIDATORS_H_
#define GUARDIAN_VALIDATORS_H_

#include <string>
#include "guardian_types.h"

namespace GuardianPII {

/**
 * Outcome of validating a raw match. Validators never fail: malformed
 * input yields valid=false and a best-effort normalized value.
 */
struct ValidationResult {
  std::string normalized;
  bool valid = false;
  // Correct length and not a repeated-digit filler, checksum aside
  bool structurally_valid = false;
};

// Brazilian individual taxpayer number, 11 digits, two mod-11 check digits
ValidationResult ValidateCPF(const std::string& raw);

// Brazilian company taxpayer number, 14 digits, two mod-11 check digits
ValidationResult ValidateCNPJ(const std::string& raw);

// Landline (10 digits) or mobile (11 digits, subscriber starts with 9)
// behind an assigned DDD. A leading 55 country code is stripped. A
// subscriber part of one repeated digit is rejected.
ValidationResult ValidatePhone(const std::string& raw);

// 8 digits inside the postal range table
ValidationResult ValidateCEP(const std::string& raw);

// Shape only: local@domain.tld with length limits
ValidationResult ValidateEmail(const std::string& raw);

// 7 to 9 characters of digits with an optional X check character.
// There is no national checksum, so only shape is checked.
ValidationResult ValidateRG(const std::string& raw);

// Driver licence number, 11 digits, two check digits with discount rule
ValidationResult ValidateCNH(const std::string& raw);

// Social integration number, 11 digits, one mod-11 check digit
ValidationResult ValidatePIS(const std::string& raw);

// Voter registration title, 12 digits: 8 sequence digits, a two-digit
// state code (01 to 28) and two check digits
ValidationResult ValidateVoterId(const std::string& raw);

// Payment card, 13 to 19 digits passing the Luhn check
ValidationResult ValidateCreditCard(const std::string& raw);

// Shape only: AAA9999 or the Mercosul AAA9A99
ValidationResult ValidateVehiclePlate(const std::string& raw);

// Shape only: two letters and six digits
ValidationResult ValidatePassport(const std::string& raw);

bool PassesLuhn(const std::string& digits);

// Dispatch on type. Contextual types pass through unvalidated.
ValidationResult Validate(PIIType type, const std::string& raw);

// Status reported on an entity of |type| given its validation result
ValidationStatus StatusFor(PIIType type, const ValidationResult& result);

// Types whose invalid verdict means a failed check digit
bool IsChecksumType(PIIType type);

// Check digits for the first nine digits of a CPF. Returns false if
// |base| is not nine ASCII digits.
bool ComputeCPFCheckDigits(const std::string& base, int* first, int* second);

// Two-letter state for a CEP's 8 digits, or empty when out of range
std::string GetCepRegion(const std::string& digits);

// True if |ddd| is an assigned Brazilian area code
bool IsValidDDD(int ddd);

}  // namespace GuardianPII

#endif  // GUARDIAN_VALIDATORS_H_
