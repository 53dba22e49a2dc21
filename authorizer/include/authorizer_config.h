#pragma once
#include <string>

namespace authorizer {

struct AuthorizerConfig {
    // Derived from the running binary: build/bin/<exe> -> build/bin/../..
    std::string repo_root;

    // AUTHORIZER_PUBKEYS_PATH, else <repo_root>/config/pubkeys.json
    std::string pubkeys_path;
};

// Directory of the running executable ("." if it cannot be determined).
std::string exe_dir();

// Resolve a config file: env_var if set and non-empty, else <repo_root>/config/<name>.
std::string authorizer_config_path(const std::string& repo_root,
                                   const std::string& name,
                                   const char* env_var);

AuthorizerConfig authorizer_config_from_env();

} // namespace authorizer
