/**
 * @file HmacSigner.h
 * @brief HMAC-SHA256 signer/verifier for outbound payloads -
 * NemoBridge::Bridge::Security
 */

#ifndef BRIDGE_SECURITY_HMAC_SIGNER_H
#define BRIDGE_SECURITY_HMAC_SIGNER_H

#include <optional>
#include <string>

namespace NemoBridge {
namespace Bridge {
namespace Security {

struct VerifyResult {
  bool valid = false;
  std::optional<std::string> payload; // set only when valid
};

/**
 * @brief Signs payloads and verifies signed envelopes with one secret key
 * @details Stateless apart from the key. The key is captured when the
 * signer is built; a rotated key needs a new signer.
 */
class HmacSigner {
public:
  explicit HmacSigner(std::string secret_key);

  /**
   * @brief Lowercase hex HMAC-SHA256 of payload
   * @throws BridgeError if OpenSSL fails
   */
  std::string sign(const std::string &payload) const;

  /**
   * @brief Checks a serialized {"payload","hmac","algo"} envelope
   * @details Malformed JSON, missing keys, an algo other than "sha256" or
   * a digest mismatch all yield {false, nullopt}. Comparison is constant
   * time.
   */
  VerifyResult verify(const std::string &envelope) const;

  /**
   * @brief Constant-time check of a hex digest against payload
   */
  bool verifyDigest(const std::string &payload,
                    const std::string &hex_digest) const;

  static std::string hmacSha256Hex(const std::string &key,
                                   const std::string &data);

private:
  std::string secret_key_;
};

} // namespace Security
} // namespace Bridge
} // namespace NemoBridge

#endif // BRIDGE_SECURITY_HMAC_SIGNER_H
