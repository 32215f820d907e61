#include "guardian_fingerprint.h"
#include "logger.h"
#include <openssl/evp.h>
#include <cstdio>

namespace GuardianPII {

std::string TextFingerprint(const std::string& text) {
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    LOG_ERROR("Fingerprint", "Failed to allocate digest context");
    return "";
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
            EVP_DigestUpdate(ctx, text.data(), text.size()) == 1 &&
            EVP_DigestFinal_ex(ctx, digest, &digest_len) == 1;
  EVP_MD_CTX_free(ctx);

  if (!ok) {
    LOG_ERROR("Fingerprint", "SHA-256 digest failed");
    return "";
  }

  std::string hex;
  hex.reserve(digest_len * 2);
  char buf[3];
  for (unsigned int i = 0; i < digest_len; ++i) {
    snprintf(buf, sizeof(buf), "%02x", digest[i]);
    hex.append(buf, 2);
  }
  return hex;
}

}  // namespace GuardianPII
