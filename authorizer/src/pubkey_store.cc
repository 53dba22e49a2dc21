#include "pubkey_store.h"
#include "verify_crypto.h"
#include "authorizer_util.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
using json = nlohmann::json;

namespace authorizer {

static std::shared_ptr<const Verifier> verifier_from_entry(const json& v) {
    // "<PEM or ybase64(PEM)>"
    if (v.is_string()) {
        return std::make_shared<PemPublicKeyVerifier>(pem_from_key_material(v.get<std::string>()));
    }

    // { "type": "pem"|"ed25519", "key": "..." }
    if (v.is_object()) {
        const std::string type = lower_ascii(v.value("type", "pem"));
        const std::string key = v.value("key", "");
        if (type == "ed25519") return std::make_shared<Ed25519Verifier>(Ed25519Verifier::from_b64(key));
        if (type == "pem") return std::make_shared<PemPublicKeyVerifier>(pem_from_key_material(key));
        throw std::runtime_error("unknown key type: " + type);
    }

    throw std::runtime_error("key entry must be string or object");
}

bool PubKeyStore::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.good()) {
        std::cerr << "[pubkeys] file not found: " << path << std::endl;
        return false;
    }

    json j;
    try {
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[pubkeys] parse error: " << e.what() << std::endl;
        return false;
    }

    if (!load_json(j)) return false;
    std::cerr << "[pubkeys] loaded " << size() << " keys from " << path << std::endl;
    return true;
}

bool PubKeyStore::load_json(const json& j) {
    if (!j.is_object()) {
        std::cerr << "[pubkeys] invalid format (expected {\"zts\": {...}, \"zms\": {...}})" << std::endl;
        return false;
    }

    // Build into a fresh map, publish at the end.
    auto tmp = std::make_shared<KeyMap>();

    for (KeyEnv env : {KeyEnv::ZTS, KeyEnv::ZMS}) {
        const char* name = key_env_name(env);
        if (!j.contains(name)) continue;

        const json& section = j.at(name);
        if (!section.is_object()) {
            std::cerr << "[pubkeys] invalid format: \"" << name << "\" must be object" << std::endl;
            return false;
        }

        for (auto it = section.begin(); it != section.end(); ++it) {
            try {
                (*tmp)[{env, it.key()}] = verifier_from_entry(it.value());
            } catch (const std::exception& e) {
                std::cerr << "[pubkeys] WARNING: skipping " << name << " key " << it.key()
                          << ": " << e.what() << std::endl;
            }
        }
    }

    keys_ = std::move(tmp);
    return true;
}

void PubKeyStore::add(KeyEnv env, const std::string& key_id, std::shared_ptr<const Verifier> v) {
    auto next = std::make_shared<KeyMap>(*keys_);
    (*next)[{env, key_id}] = std::move(v);
    keys_ = std::move(next);
}

std::shared_ptr<const Verifier> PubKeyStore::find(KeyEnv env, const std::string& key_id) const {
    auto it = keys_->find({env, key_id});
    if (it == keys_->end()) return nullptr;
    return it->second;
}

KeyProvider PubKeyStore::provider() const {
    std::shared_ptr<const KeyMap> snapshot = keys_;
    return [snapshot](KeyEnv env, const std::string& key_id) -> std::shared_ptr<const Verifier> {
        auto it = snapshot->find({env, key_id});
        if (it == snapshot->end()) return nullptr;
        return it->second;
    };
}

} // namespace authorizer
