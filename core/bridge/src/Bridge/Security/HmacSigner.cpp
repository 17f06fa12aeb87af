/**
 * @file HmacSigner.cpp
 * @brief HMAC-SHA256 signer/verifier - NemoBridge::Bridge::Security
 */

#include "Bridge/Security/HmacSigner.h"
#include "Bridge/BridgeErrors.h"
#include "Constants/BridgeConstants.h"

#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace NemoBridge {
namespace Bridge {
namespace Security {

using json = nlohmann::json;
namespace Envelope = NemoBridge::Constants::Bridge::Envelope;

HmacSigner::HmacSigner(std::string secret_key)
    : secret_key_(std::move(secret_key)) {}

std::string HmacSigner::hmacSha256Hex(const std::string &key,
                                      const std::string &data) {
  unsigned char result[EVP_MAX_MD_SIZE];
  unsigned int result_len = 0;

  unsigned char *digest =
      HMAC(EVP_sha256(), key.data(), static_cast<int>(key.length()),
           reinterpret_cast<const unsigned char *>(data.data()), data.length(),
           result, &result_len);
  if (digest == nullptr) {
    throw BridgeError("HMAC-SHA256 computation failed");
  }

  std::ostringstream ss;
  for (unsigned int i = 0; i < result_len; ++i) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(result[i]);
  }
  return ss.str();
}

std::string HmacSigner::sign(const std::string &payload) const {
  return hmacSha256Hex(secret_key_, payload);
}

bool HmacSigner::verifyDigest(const std::string &payload,
                              const std::string &hex_digest) const {
  std::string expected = sign(payload);
  std::string given = hex_digest;
  std::transform(given.begin(), given.end(), given.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (given.size() != expected.size()) {
    return false;
  }
  return CRYPTO_memcmp(expected.data(), given.data(), expected.size()) == 0;
}

VerifyResult HmacSigner::verify(const std::string &envelope) const {
  VerifyResult result;

  json parsed = json::parse(envelope, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return result;
  }

  auto payload_it = parsed.find(Envelope::KEY_PAYLOAD);
  auto hmac_it = parsed.find(Envelope::KEY_HMAC);
  auto algo_it = parsed.find(Envelope::KEY_ALGO);
  if (payload_it == parsed.end() || hmac_it == parsed.end() ||
      algo_it == parsed.end()) {
    return result;
  }
  if (!payload_it->is_string() || !hmac_it->is_string() ||
      !algo_it->is_string()) {
    return result;
  }
  if (algo_it->get<std::string>() != Envelope::ALGO_SHA256) {
    return result;
  }

  std::string payload = payload_it->get<std::string>();
  if (!verifyDigest(payload, hmac_it->get<std::string>())) {
    return result;
  }

  result.valid = true;
  result.payload = std::move(payload);
  return result;
}

} // namespace Security
} // namespace Bridge
} // namespace NemoBridge
