#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace authorizer {

/*
Mapping rules (request -> action/resource translation)
======================================================

Authored rules look like:

  { method: "get", path: "/users/{id}?view={v}", action: "read", resource: "user.{id}.{v}" }

A rule is compiled once into positional path tokens and a query token map.
At request time the first rule (in authored order) whose method, path and
query all match wins, and its resource template is rendered with the values
captured by the placeholders.

This layer never denies anything. A request with no matching rule maps to
(method, path) unchanged and the authorization evaluator decides.
*/

// One compiled path segment or query value.
struct Literal {
    std::string value;  // may be empty ("//" or the leading "/")
};

struct Placeholder {
    std::string name;   // bracketed form, e.g. "{id}"
};

using Validated = std::variant<Literal, Placeholder>;

bool operator==(const Literal& a, const Literal& b);
bool operator==(const Placeholder& a, const Placeholder& b);

struct RawRule {
    std::string method;
    std::string path;      // "/a/{x}/b?q={y}"
    std::string action;
    std::string resource;  // may reference placeholders: "res.{x}.{y}"
};

// std::nullopt models an absent rule list; an engaged empty vector is allowed.
using RawMappingRules = std::map<std::string, std::optional<std::vector<RawRule>>>;

struct Rule {
    std::string method;
    std::string action;
    std::string resource;

    std::vector<Validated> split_paths;
    std::map<std::string, Validated> query_value_map;
};

struct Translation {
    std::string action;
    std::string resource;
};

// Compile errors. what() is the user-facing message.
class MappingRuleError : public std::runtime_error {
public:
    explicit MappingRuleError(const std::string& msg) : std::runtime_error(msg) {}
};

// Compile one raw rule. Throws MappingRuleError.
Rule compile_rule(const RawRule& raw);

class MappingRules {
public:
    MappingRules() = default;

    /*
    Compile a whole rule set.

    Stops at the first malformed entry and throws MappingRuleError; a
    partially compiled set is never returned. Rule order per domain is kept.
    */
    static MappingRules validate(const RawMappingRules& raw);

    /*
    Translate a request into (action, resource).

    Falls back to (method, path) when the domain is unknown, has no rules,
    or no rule matches. Throws std::invalid_argument only when the query
    string carries a malformed percent escape.

    Thread safety: const, no hidden state. Safe to call concurrently.
    */
    Translation translate(const std::string& domain,
                          const std::string& method,
                          const std::string& path,
                          const std::string& query) const;

    // Same as translate() with the query already parsed into key -> values.
    Translation translate_parsed(const std::string& domain,
                                 const std::string& method,
                                 const std::string& path,
                                 const std::map<std::string, std::vector<std::string>>& query) const;

    const std::map<std::string, std::vector<Rule>>& rules() const { return rules_; }
    const std::vector<Rule>* domain_rules(const std::string& domain) const;

private:
    // Only validate() builds a populated instance.
    explicit MappingRules(std::map<std::string, std::vector<Rule>> rules);

    std::map<std::string, std::vector<Rule>> rules_;
};

} // namespace authorizer
