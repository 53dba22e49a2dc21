#include "mapping_rules.h"
#include "authorizer_util.h"

#include <iostream>
#include <set>
#include <utility>

namespace authorizer {

/*
Mapping rule compiler + translator
==================================

Compile phase (validate)
------------------------
Path templates are split at the FIRST '?':
  "/a/{x}?q=v?w"  -> path "/a/{x}", query "q=v?w"
so a literal '?' can appear inside a query value.

The path part is split on every '/', empty segments included:
  "/a//b/" -> ["", "a", "", "b", ""]

A segment or query value of the form "{name}" is a placeholder. Placeholder
names share one namespace per rule (path and query together).

Translate phase
---------------
Linear scan in authored order, first match wins. There is deliberately no
index by method or path length: the authored order is the tie-break and must
stay observable.
*/

bool operator==(const Literal& a, const Literal& b) { return a.value == b.value; }
bool operator==(const Placeholder& a, const Placeholder& b) { return a.name == b.name; }

[[noreturn]] static void fail(const std::string& msg) {
    throw MappingRuleError(msg);
}

static bool is_placeholder_token(const std::string& s) {
    return s.size() >= 2 && s.front() == '{' && s.back() == '}';
}

// Classify one template token. Tracks placeholder names in `seen`.
static Validated compile_token(const std::string& token, std::set<std::string>& seen) {
    if (!is_placeholder_token(token)) return Literal{token};

    if (token == "{}") fail("placeholder is empty");
    if (!seen.insert(token).second) fail("placeholder(" + token + ") is duplicated");
    return Placeholder{token};
}

Rule compile_rule(const RawRule& raw) {
    if (raw.method.empty() || raw.path.empty() || raw.action.empty() || raw.resource.empty()) {
        fail("rule is empty, method:" + raw.method +
             ", path:" + raw.path +
             ", action:" + raw.action +
             ", resource:" + raw.resource);
    }
    if (raw.path.front() != '/') fail("path(" + raw.path + ") doesn't start with slash");
    if (raw.path == "/") fail("path is slash only");

    Rule r;
    r.method   = raw.method;
    r.action   = raw.action;
    r.resource = raw.resource;

    std::string path_part = raw.path;
    std::string query_part;
    bool has_query = false;
    const size_t qpos = raw.path.find('?');
    if (qpos != std::string::npos) {
        path_part  = raw.path.substr(0, qpos);
        query_part = raw.path.substr(qpos + 1);
        has_query  = true;
    }

    std::set<std::string> seen;

    for (const auto& seg : split_keep_empty(path_part, '/')) {
        r.split_paths.push_back(compile_token(seg, seen));
    }

    if (has_query) {
        for (const auto& pair : split_keep_empty(query_part, '&')) {
            std::string key = pair;
            std::string value;
            const size_t eq = pair.find('=');
            if (eq != std::string::npos) {
                key   = pair.substr(0, eq);
                value = pair.substr(eq + 1);
            }

            if (r.query_value_map.count(key) != 0) fail("query multiple values is not allowed");
            r.query_value_map.emplace(key, compile_token(value, seen));
        }
    }

    return r;
}

MappingRules::MappingRules(std::map<std::string, std::vector<Rule>> rules)
    : rules_(std::move(rules)) {}

MappingRules MappingRules::validate(const RawMappingRules& raw) {
    std::map<std::string, std::vector<Rule>> compiled;

    try {
        for (const auto& kv : raw) {
            const std::string& domain = kv.first;
            if (domain.empty()) fail("domain is empty");
            if (!kv.second.has_value()) fail("rules is nil");

            std::vector<Rule> rules;
            rules.reserve(kv.second->size());
            for (const auto& rr : *kv.second) {
                rules.push_back(compile_rule(rr));
            }
            compiled.emplace(domain, std::move(rules));
        }
    } catch (const MappingRuleError& e) {
        std::cerr << "[mapping-rules] rejected rule set: " << e.what() << std::endl;
        throw;
    }

    return MappingRules(std::move(compiled));
}

const std::vector<Rule>* MappingRules::domain_rules(const std::string& domain) const {
    auto it = rules_.find(domain);
    if (it == rules_.end()) return nullptr;
    return &it->second;
}

// Single pass over the template. "{name}" tokens with a capture are replaced,
// anything else (unknown names, stray braces) is copied through.
static std::string render_resource(const std::string& tmpl,
                                   const std::map<std::string, std::string>& captured) {
    if (captured.empty()) return tmpl;

    std::string out;
    out.reserve(tmpl.size());
    size_t i = 0;
    while (i < tmpl.size()) {
        if (tmpl[i] == '{') {
            const size_t close = tmpl.find('}', i + 1);
            if (close != std::string::npos) {
                auto it = captured.find(tmpl.substr(i, close - i + 1));
                if (it != captured.end()) {
                    out += it->second;
                    i = close + 1;
                    continue;
                }
            }
        }
        out.push_back(tmpl[i]);
        i++;
    }
    return out;
}

static bool match_rule(const Rule& rule,
                       const std::string& method,
                       const std::vector<std::string>& req_paths,
                       const std::map<std::string, std::vector<std::string>>& req_query,
                       std::map<std::string, std::string>& captured) {
    if (rule.method != method) return false;
    if (rule.split_paths.size() != req_paths.size()) return false;

    // repeated request keys are ambiguous and do not count as usable
    size_t usable_keys = 0;
    for (const auto& kv : req_query) {
        if (kv.second.size() == 1) usable_keys++;
    }
    if (rule.query_value_map.size() != usable_keys) return false;

    captured.clear();

    for (size_t i = 0; i < req_paths.size(); i++) {
        const Validated& tok = rule.split_paths[i];
        if (const auto* lit = std::get_if<Literal>(&tok)) {
            if (lit->value != req_paths[i]) return false;
        } else {
            captured[std::get<Placeholder>(tok).name] = req_paths[i];
        }
    }

    for (const auto& kv : rule.query_value_map) {
        auto it = req_query.find(kv.first);
        // a key given more than once is ambiguous and never matches
        if (it == req_query.end() || it->second.size() != 1) return false;

        const std::string& req_value = it->second.front();
        if (const auto* lit = std::get_if<Literal>(&kv.second)) {
            if (lit->value != req_value) return false;
        } else {
            captured[std::get<Placeholder>(kv.second).name] = req_value;
        }
    }

    return true;
}

Translation MappingRules::translate(const std::string& domain,
                                    const std::string& method,
                                    const std::string& path,
                                    const std::string& query) const {
    return translate_parsed(domain, method, path, parse_query(query));
}

Translation MappingRules::translate_parsed(const std::string& domain,
                                           const std::string& method,
                                           const std::string& path,
                                           const std::map<std::string, std::vector<std::string>>& query) const {
    const std::vector<Rule>* rules = domain_rules(domain);
    if (!rules || rules->empty()) return Translation{method, path};

    const std::vector<std::string> req_paths = split_keep_empty(path, '/');

    std::map<std::string, std::string> captured;
    for (const auto& rule : *rules) {
        if (match_rule(rule, method, req_paths, query, captured)) {
            return Translation{rule.action, render_resource(rule.resource, captured)};
        }
    }

    return Translation{method, path};
}

} // namespace authorizer
