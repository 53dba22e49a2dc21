#pragma once

#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace authorizer {

/*
Signed policy document
======================

Wire shape (as served by the distribution authority):

{
  "keyId": "<zts key id>",
  "signature": "<zts signature over canonical(signedPolicyData)>",
  "signedPolicyData": {
    "zmsKeyId": "<zms key id>",
    "zmsSignature": "<zms signature over canonical(policyData)>",
    "expires": "2026-01-19T12:34:56.000Z",
    "modified": "2026-01-18T12:34:56.000Z",
    "policyData": { "domain": "<name>", "policies": [ ... ] }
  }
}

Two fixed tiers: ZTS vouches for the envelope, ZMS vouches for the payload.
The policies array is opaque here; it only matters as signed bytes.
*/

enum class KeyEnv : int {
  ZTS = 0,
  ZMS = 1,
};

const char* key_env_name(KeyEnv env);

// Checks one signature over one canonical string.
// Throws std::runtime_error (message = reason) when the signature does not verify.
class Verifier {
public:
  virtual ~Verifier() = default;
  virtual void verify(const std::string& data, const std::string& signature) const = 0;
};

// Returns nullptr when no key is known for (env, key_id).
using KeyProvider =
    std::function<std::shared_ptr<const Verifier>(KeyEnv env, const std::string& key_id)>;

struct PolicyData {
  std::string domain;
  nlohmann::json policies = nlohmann::json::array();
};

struct SignedPolicyData {
  std::string zms_key_id;
  std::string zms_signature;
  std::string expires;   // RFC 3339 UTC, empty if not set
  std::string modified;  // RFC 3339 UTC, empty if not set
  PolicyData policy_data;
};

struct DomainSignedPolicyData {
  std::string key_id;
  std::string signature;
  SignedPolicyData signed_policy_data;
};

void to_json(nlohmann::json& j, const PolicyData& p);
void from_json(const nlohmann::json& j, PolicyData& p);
void to_json(nlohmann::json& j, const SignedPolicyData& s);
void from_json(const nlohmann::json& j, SignedPolicyData& s);
void to_json(nlohmann::json& j, const DomainSignedPolicyData& d);
void from_json(const nlohmann::json& j, DomainSignedPolicyData& d);

// Canonical "data to be signed": compact JSON, keys sorted, empty optional
// strings omitted. Throws nlohmann::json::exception on invalid UTF-8.
std::string canonical_policy_data(const PolicyData& p);
std::string canonical_signed_policy_data(const SignedPolicyData& s);

enum class SignedPolicyRc : int {
  OK = 0,

  ZTS_KEY_NOT_FOUND = 10,
  ZTS_SIG_INVALID = 11,

  ZMS_KEY_NOT_FOUND = 20,
  ZMS_SIG_INVALID = 21,

  INTERNAL = 99,
};

struct SignedPolicyResult {
  bool ok = false;
  SignedPolicyRc rc = SignedPolicyRc::INTERNAL;
  std::string detail; // verbatim error, empty on success
};

class SignedPolicy {
public:
  explicit SignedPolicy(DomainSignedPolicyData data);

  // Parse the wire document. Throws std::runtime_error on malformed input.
  static SignedPolicy parse(const std::string& json_text);

  /*
  Verify the two-tier signature chain.

  Order (stops at first failure):
    1) ZTS key for keyId                     -> "zts key not found"
    2) ZTS signature over signedPolicyData   -> "error verify signature: <cause>"
    3) ZMS key for zmsKeyId                  -> "zms key not found"
    4) ZMS signature over policyData         -> "error verify zms signature: <cause>"

  An empty key_provider behaves like one that knows no keys.
  Stateless; safe to call concurrently if key_provider is.
  */
  SignedPolicyResult verify(const KeyProvider& key_provider) const;

  // True if "expires" is set and not after now. An unparsable value counts as expired.
  bool expired(long now_unix_sec) const;

  const DomainSignedPolicyData& data() const { return data_; }

private:
  DomainSignedPolicyData data_;
};

} // namespace authorizer
