#pragma once
#include <map>
#include <memory>
#include <string>
#include <utility>

#include "signed_policy.h"

namespace authorizer {

/*
Public key trust store
======================

Holds the verifier keys for both policy authorities, addressed by
(environment, key id). It is the default KeyProvider backing for
SignedPolicy::verify().

Expected JSON format:
{
  "zts": {
    "0": "<PEM text or ybase64(PEM)>",
    "1": { "type": "ed25519", "key": "<base64 32-byte key>" }
  },
  "zms": {
    "0": "<PEM text or ybase64(PEM)>"
  }
}

Entries that fail to parse are skipped with a warning. A policy signed with
such a key then fails with "zts key not found" / "zms key not found".

Threading model
---------------
load() builds a complete new key map and swaps it in. provider() captures the
map current at call time, so a provider keeps seeing one consistent snapshot.
*/
class PubKeyStore {
public:
    // Returns false on I/O or parse errors (caller decides whether that is fatal).
    bool load(const std::string& path);

    // Same as load(), from an already parsed document.
    bool load_json(const nlohmann::json& j);

    // Manual registration (tests, embedded keys).
    void add(KeyEnv env, const std::string& key_id, std::shared_ptr<const Verifier> v);

    std::shared_ptr<const Verifier> find(KeyEnv env, const std::string& key_id) const;

    KeyProvider provider() const;

    size_t size() const { return keys_ ? keys_->size() : 0; }

private:
    using KeyMap = std::map<std::pair<KeyEnv, std::string>, std::shared_ptr<const Verifier>>;

    std::shared_ptr<const KeyMap> keys_ = std::make_shared<const KeyMap>();
};

} // namespace authorizer
