#include "signed_policy.h"
#include "authorizer_util.h"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace authorizer {
using json = nlohmann::json;

const char* key_env_name(KeyEnv env) {
  switch (env) {
    case KeyEnv::ZTS: return "zts";
    case KeyEnv::ZMS: return "zms";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// JSON model
// -----------------------------------------------------------------------------

static std::string opt_string(const json& j, const char* k) {
  if (!j.contains(k) || j.at(k).is_null()) return "";
  if (!j.at(k).is_string()) throw std::runtime_error(std::string("field must be string: ") + k);
  return j.at(k).get<std::string>();
}

void to_json(json& j, const PolicyData& p) {
  j = json::object();
  j["domain"] = p.domain;
  j["policies"] = p.policies;
}

void from_json(const json& j, PolicyData& p) {
  if (!j.is_object()) throw std::runtime_error("policyData must be object");
  p.domain = opt_string(j, "domain");
  p.policies = j.contains("policies") ? j.at("policies") : json::array();
}

void to_json(json& j, const SignedPolicyData& s) {
  j = json::object();
  if (!s.expires.empty()) j["expires"] = s.expires;
  if (!s.modified.empty()) j["modified"] = s.modified;
  j["policyData"] = s.policy_data;
  j["zmsKeyId"] = s.zms_key_id;
  j["zmsSignature"] = s.zms_signature;
}

void from_json(const json& j, SignedPolicyData& s) {
  if (!j.is_object()) throw std::runtime_error("signedPolicyData must be object");
  s.zms_key_id = opt_string(j, "zmsKeyId");
  s.zms_signature = opt_string(j, "zmsSignature");
  s.expires = opt_string(j, "expires");
  s.modified = opt_string(j, "modified");
  s.policy_data = j.contains("policyData") ? j.at("policyData").get<PolicyData>() : PolicyData{};
}

void to_json(json& j, const DomainSignedPolicyData& d) {
  j = json::object();
  j["keyId"] = d.key_id;
  j["signature"] = d.signature;
  j["signedPolicyData"] = d.signed_policy_data;
}

void from_json(const json& j, DomainSignedPolicyData& d) {
  if (!j.is_object()) throw std::runtime_error("signed policy must be object");
  d.key_id = opt_string(j, "keyId");
  d.signature = opt_string(j, "signature");
  d.signed_policy_data = j.contains("signedPolicyData")
                             ? j.at("signedPolicyData").get<SignedPolicyData>()
                             : SignedPolicyData{};
}

// nlohmann::json objects are std::map backed, so dump() emits sorted keys.
std::string canonical_policy_data(const PolicyData& p) {
  return json(p).dump(-1, ' ', false, json::error_handler_t::strict);
}

std::string canonical_signed_policy_data(const SignedPolicyData& s) {
  return json(s).dump(-1, ' ', false, json::error_handler_t::strict);
}

// -----------------------------------------------------------------------------
// Verification
// -----------------------------------------------------------------------------

static SignedPolicyResult fail(SignedPolicyRc rc, const std::string& msg) {
  SignedPolicyResult r;
  r.ok = false;
  r.rc = rc;
  r.detail = msg;
  return r;
}

// The cause is always appended, even when the verifier gave an empty message.
static SignedPolicyResult fail(SignedPolicyRc rc, const std::string& msg, const std::string& detail) {
  return fail(rc, msg + ": " + detail);
}

SignedPolicy::SignedPolicy(DomainSignedPolicyData data) : data_(std::move(data)) {}

SignedPolicy SignedPolicy::parse(const std::string& json_text) {
  json j;
  try {
    j = json::parse(json_text);
  } catch (const json::exception& e) {
    throw std::runtime_error(std::string("signed policy parse failed: ") + e.what());
  }

  try {
    return SignedPolicy(j.get<DomainSignedPolicyData>());
  } catch (const json::exception& e) {
    throw std::runtime_error(std::string("signed policy schema: ") + e.what());
  }
}

static SignedPolicyResult verify_chain(const DomainSignedPolicyData& d, const KeyProvider& key_provider) {
  const SignedPolicyData& spd = d.signed_policy_data;

  // 1) Envelope key
  std::shared_ptr<const Verifier> zts;
  if (key_provider) zts = key_provider(KeyEnv::ZTS, d.key_id);
  if (!zts) return fail(SignedPolicyRc::ZTS_KEY_NOT_FOUND, "zts key not found");

  // 2) Envelope signature over the inner payload
  try {
    zts->verify(canonical_signed_policy_data(spd), d.signature);
  } catch (const std::exception& e) {
    return fail(SignedPolicyRc::ZTS_SIG_INVALID, "error verify signature", e.what());
  }

  // 3) Payload key
  std::shared_ptr<const Verifier> zms = key_provider(KeyEnv::ZMS, spd.zms_key_id);
  if (!zms) return fail(SignedPolicyRc::ZMS_KEY_NOT_FOUND, "zms key not found");

  // 4) Payload signature over the policy content
  try {
    zms->verify(canonical_policy_data(spd.policy_data), spd.zms_signature);
  } catch (const std::exception& e) {
    return fail(SignedPolicyRc::ZMS_SIG_INVALID, "error verify zms signature", e.what());
  }

  SignedPolicyResult out;
  out.ok = true;
  out.rc = SignedPolicyRc::OK;
  return out;
}

SignedPolicyResult SignedPolicy::verify(const KeyProvider& key_provider) const {
  SignedPolicyResult r = verify_chain(data_, key_provider);
  if (!r.ok) {
    // ids only, never signatures
    std::cerr << "[signed-policy] verify failed rc=" << static_cast<int>(r.rc)
              << " domain=" << data_.signed_policy_data.policy_data.domain
              << " zts_key=" << data_.key_id
              << " zms_key=" << data_.signed_policy_data.zms_key_id
              << " detail=" << r.detail << std::endl;
  }
  return r;
}

bool SignedPolicy::expired(long now_unix_sec) const {
  const std::string& exp = data_.signed_policy_data.expires;
  if (exp.empty()) return false;

  long exp_unix = 0;
  if (!parse_rfc3339_utc(exp, exp_unix)) return true;
  return now_unix_sec >= exp_unix;
}

} // namespace authorizer
