#pragma once
#include <map>
#include <string>
#include <vector>

namespace authorizer {

    std::string lower_ascii(std::string s);

    // Split on every occurrence of sep. Empty fields are kept, so the
    // result always has count(sep) + 1 elements ("" -> {""}, "/" -> {"", ""}).
    std::vector<std::string> split_keep_empty(const std::string& s, char sep);

    // Standard or URL-safe base64, padding optional. Throws std::runtime_error.
    // Uses libsodium: sodium_init() must have run.
    std::vector<unsigned char> b64decode_loose(const std::string& in);

    // Athenz "ybase64": base64 with '+' -> '.', '/' -> '_', '=' -> '-'.
    // Throws std::runtime_error on invalid input.
    std::vector<unsigned char> ybase64_decode(const std::string& in);

    // application/x-www-form-urlencoded component decoding ('+' and %XX).
    // Throws std::invalid_argument on a malformed escape.
    std::string query_unescape(const std::string& s);

    // Parse a raw query string into key -> values, keeping repeated keys.
    // Empty "&&" fields are skipped. Throws std::invalid_argument on a
    // malformed escape.
    std::map<std::string, std::vector<std::string>> parse_query(const std::string& query);

    // RFC 3339 UTC timestamp ("2026-01-19T12:34:56.123Z") to unix seconds.
    // Returns false if the string is not in that form.
    bool parse_rfc3339_utc(const std::string& s, long& out_unix_sec);

} // namespace authorizer
