#include "authorizer_util.h"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <vector>
#include <sodium.h>


namespace authorizer {

std::string lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::vector<std::string> split_keep_empty(const std::string& s, char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    for (;;) {
        const size_t pos = s.find(sep, start);
        if (pos == std::string::npos) {
            out.push_back(s.substr(start));
            return out;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

// NOTE: loose decoding is only used for signatures and key material that are
// checked cryptographically right after. It never feeds canonical signed bytes.
std::vector<unsigned char> b64decode_loose(const std::string& in) {
    std::string s;
    s.reserve(in.size());
    for (char c : in) {
        if (c != '\n' && c != '\r' && c != ' ' && c != '\t') s.push_back(c);
    }

    std::vector<unsigned char> out(s.size() + 8);
    size_t out_len = 0;

    auto try_variant = [&](int variant) -> bool {
        out_len = 0;
        return sodium_base642bin(out.data(), out.size(),
                                 s.c_str(), s.size(),
                                 nullptr, &out_len, nullptr,
                                 variant) == 0;
    };

    if (try_variant(sodium_base64_VARIANT_ORIGINAL) ||
        try_variant(sodium_base64_VARIANT_ORIGINAL_NO_PADDING) ||
        try_variant(sodium_base64_VARIANT_URLSAFE) ||
        try_variant(sodium_base64_VARIANT_URLSAFE_NO_PADDING)) {
        out.resize(out_len);
        return out;
    }

    throw std::runtime_error("invalid base64");
}

std::vector<unsigned char> ybase64_decode(const std::string& in) {
    std::string s;
    s.reserve(in.size());
    for (char c : in) {
        switch (c) {
            case '.': s.push_back('+'); break;
            case '_': s.push_back('/'); break;
            case '-': s.push_back('='); break;
            case '+': case '/': case '=':
                throw std::runtime_error("invalid ybase64");
            default:  s.push_back(c);   break;
        }
    }

    std::vector<unsigned char> out(s.size() + 8);
    size_t out_len = 0;
    if (sodium_base642bin(out.data(), out.size(),
                          s.c_str(), s.size(),
                          /*ignore=*/"\r\n",
                          &out_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0) {
        throw std::runtime_error("invalid ybase64");
    }
    out.resize(out_len);
    return out;
}

static int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string query_unescape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        const char c = s[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%') {
            if (i + 2 >= s.size() || hex_nibble(s[i + 1]) < 0 || hex_nibble(s[i + 2]) < 0) {
                const std::string esc = s.substr(i, 3);
                throw std::invalid_argument("invalid URL escape \"" + esc + "\"");
            }
            out.push_back((char)((hex_nibble(s[i + 1]) << 4) | hex_nibble(s[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::map<std::string, std::vector<std::string>> parse_query(const std::string& query) {
    std::map<std::string, std::vector<std::string>> out;
    if (query.empty()) return out;

    for (const auto& field : split_keep_empty(query, '&')) {
        if (field.empty()) continue;

        std::string key = field;
        std::string value;
        const size_t eq = field.find('=');
        if (eq != std::string::npos) {
            key = field.substr(0, eq);
            value = field.substr(eq + 1);
        }
        out[query_unescape(key)].push_back(query_unescape(value));
    }
    return out;
}

bool parse_rfc3339_utc(const std::string& s, long& out_unix_sec) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &y, &mo, &d, &h, &mi, &sec, &consumed) != 6) {
        return false;
    }

    size_t i = (size_t)consumed;
    if (i < s.size() && s[i] == '.') {
        i++;
        const size_t digits_start = i;
        while (i < s.size() && std::isdigit((unsigned char)s[i])) i++;
        if (i == digits_start) return false;
    }
    if (i + 1 != s.size() || s[i] != 'Z') return false;

    if (mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || sec > 60) return false;

    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon  = mo - 1;
    tm.tm_mday = d;
    tm.tm_hour = h;
    tm.tm_min  = mi;
    tm.tm_sec  = sec;
    out_unix_sec = (long)timegm(&tm);
    return true;
}

} // namespace authorizer
