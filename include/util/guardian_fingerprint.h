#ifndef GUARDIAN_FINGERPRINT_H_
#define GUARDIAN_FINGERPRINT_H_

#include <string>

namespace GuardianPII {

// Lowercase hex SHA-256 of |text|. Lets results be audited and correlated
// without keeping the text itself. Returns an empty string if the digest
// could not be computed.
std::string TextFingerprint(const std::string& text);

}  // namespace GuardianPII

#endif  // GUARDIAN_FINGERPRINT_H_
