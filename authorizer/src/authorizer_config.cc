#include "authorizer_config.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <system_error>

#include <limits.h>
#include <unistd.h>

namespace authorizer {

std::string exe_dir() {
    char buf[PATH_MAX] = {0};
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) return ".";
    std::string p(buf, (size_t)n);
    return std::filesystem::path(p).parent_path().string();
}

std::string authorizer_config_path(const std::string& repo_root,
                                   const std::string& name,
                                   const char* env_var) {
    if (env_var) {
        if (const char* v = std::getenv(env_var)) {
            if (*v) return v;
        }
    }
    return (std::filesystem::path(repo_root) / "config" / name).string();
}

AuthorizerConfig authorizer_config_from_env() {
    AuthorizerConfig cfg;

    std::error_code ec;
    auto root = std::filesystem::weakly_canonical(std::filesystem::path(exe_dir()) / ".." / "..", ec);
    if (ec) {
        std::cerr << "[config] WARNING: cannot resolve repo root: " << ec.message() << std::endl;
        root = std::filesystem::path(exe_dir()) / ".." / "..";
    }
    cfg.repo_root = root.string();

    cfg.pubkeys_path = authorizer_config_path(cfg.repo_root, "pubkeys.json", "AUTHORIZER_PUBKEYS_PATH");
    std::cerr << "[config] pubkeys_path=" << cfg.pubkeys_path << std::endl;
    return cfg;
}

} // namespace authorizer
