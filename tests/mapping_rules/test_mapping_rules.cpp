// tests/mapping_rules/test_mapping_rules.cpp
//
// Rule compiler + translator regression test.
//
// What it tests:
// 1) Compiled token shapes (path segments, query map, placeholders)
// 2) Every compile error message, verbatim
// 3) Translate: first match, captures, repeated placeholders, fallbacks
//
// Build target links mapping_rules.cc + authorizer_util.cc.

#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include "mapping_rules.h"

using namespace authorizer;

static int failures = 0;

static void check(bool cond, const std::string& what) {
    if (!cond) {
        std::cerr << "FAIL: " << what << "\n";
        failures++;
    }
}

static RawMappingRules one_rule(const std::string& method, const std::string& path,
                                const std::string& action, const std::string& resource) {
    RawMappingRules raw;
    raw["domain"] = std::vector<RawRule>{RawRule{method, path, action, resource}};
    return raw;
}

// Returns the error message, or "" if validate() succeeded.
static std::string validate_error(const RawMappingRules& raw) {
    try {
        MappingRules::validate(raw);
    } catch (const MappingRuleError& e) {
        return e.what();
    }
    return "";
}

static void expect_error(const std::string& name, const RawMappingRules& raw, const std::string& want) {
    const std::string got = validate_error(raw);
    check(got == want, name + ": got \"" + got + "\" want \"" + want + "\"");
}

static const Rule& only_rule(const MappingRules& mr) {
    return mr.rules().at("domain").at(0);
}

// ---------------------------------------------------------------------------
// Compile
// ---------------------------------------------------------------------------

static_assert(!std::is_constructible<MappingRules, std::map<std::string, std::vector<Rule>>>::value,
              "compiled rule sets come only from MappingRules::validate");

static void test_compile_shapes() {
    {
        auto mr = MappingRules::validate(one_rule("get", "/path1/path2/path3", "read", "resource"));
        const std::vector<Validated> want = {Literal{""}, Literal{"path1"}, Literal{"path2"}, Literal{"path3"}};
        check(only_rule(mr).split_paths == want, "path only: split_paths");
        check(only_rule(mr).query_value_map.empty(), "path only: empty query map");
    }
    {
        auto mr = MappingRules::validate(one_rule("get", "/path1//path2/", "read", "resource"));
        const std::vector<Validated> want = {Literal{""}, Literal{"path1"}, Literal{""}, Literal{"path2"}, Literal{""}};
        check(only_rule(mr).split_paths == want, "continuous slashes keep empty segments");
    }
    {
        auto mr = MappingRules::validate(
            one_rule("get", "/path1/{placeholder1}/path2/{placeholder2}", "read", "resource"));
        const std::vector<Validated> want = {Literal{""}, Literal{"path1"}, Placeholder{"{placeholder1}"},
                                             Literal{"path2"}, Placeholder{"{placeholder2}"}};
        check(only_rule(mr).split_paths == want, "path placeholders");
        check(only_rule(mr).query_value_map.empty(), "path placeholders: empty query map");
        check(only_rule(mr).method == "get" && only_rule(mr).action == "read" &&
                  only_rule(mr).resource == "resource",
              "rule fields carried over");
    }
    {
        auto mr = MappingRules::validate(
            one_rule("get", "/path1/path2?param1=value1&param2=value2", "read", "resource"));
        const std::map<std::string, Validated> want = {{"param1", Literal{"value1"}}, {"param2", Literal{"value2"}}};
        check(only_rule(mr).split_paths.size() == 3, "path and query: 3 segments");
        check(only_rule(mr).query_value_map == want, "path and query: query map");
    }
    {
        // only the first '?' splits path from query
        auto mr = MappingRules::validate(one_rule("get", "/path1?param1=value1?&param2=value2", "read", "resource"));
        const std::vector<Validated> want_path = {Literal{""}, Literal{"path1"}};
        const std::map<std::string, Validated> want = {{"param1", Literal{"value1?"}}, {"param2", Literal{"value2"}}};
        check(only_rule(mr).split_paths == want_path, "question mark in query: path");
        check(only_rule(mr).query_value_map == want, "question mark in query: value keeps '?'");
    }
    {
        auto mr = MappingRules::validate(
            one_rule("get", "/path1/{path2}?param1=value1&param2={value2}", "read", "resource"));
        const std::vector<Validated> want_path = {Literal{""}, Literal{"path1"}, Placeholder{"{path2}"}};
        const std::map<std::string, Validated> want = {{"param1", Literal{"value1"}},
                                                       {"param2", Placeholder{"{value2}"}}};
        check(only_rule(mr).split_paths == want_path, "path+query placeholders: path");
        check(only_rule(mr).query_value_map == want, "path+query placeholders: query");
    }
    {
        // empty key and missing '=' are literal entries
        auto mr = MappingRules::validate(one_rule("get", "/p?=v&flag", "read", "resource"));
        const std::map<std::string, Validated> want = {{"", Literal{"v"}}, {"flag", Literal{""}}};
        check(only_rule(mr).query_value_map == want, "empty query key accepted as literal");
    }
    {
        RawMappingRules raw;
        raw["domain"] = std::vector<RawRule>{};
        auto mr = MappingRules::validate(raw);
        check(mr.rules().count("domain") == 1 && mr.rules().at("domain").empty(),
              "empty but present rule list is accepted");
    }
    {
        RawMappingRules raw;
        raw["domain"] = std::vector<RawRule>{RawRule{"get", "/b", "read", "rb"}, RawRule{"get", "/a", "read", "ra"}};
        auto mr = MappingRules::validate(raw);
        const auto& rules = mr.rules().at("domain");
        check(rules.size() == 2 && rules[0].resource == "rb" && rules[1].resource == "ra",
              "authored order is kept");
    }
}

static void test_compile_errors() {
    expect_error("path placeholder empty", one_rule("get", "/path1/{}", "read", "resource"), "placeholder is empty");
    expect_error("query placeholder empty", one_rule("get", "/path1?param1=value1&param2={}", "read", "resource"),
                 "placeholder is empty");
    expect_error("query multiple values", one_rule("get", "/path1?param1=value1&param1=value2", "read", "resource"),
                 "query multiple values is not allowed");

    {
        RawMappingRules raw;
        raw[""] = std::vector<RawRule>{RawRule{"method", "/path", "read", "resource"}};
        expect_error("domain empty", raw, "domain is empty");
    }
    {
        RawMappingRules raw;
        raw["domain"] = std::nullopt;
        expect_error("rules nil", raw, "rules is nil");
    }

    expect_error("method empty", one_rule("", "/path", "read", "resource"),
                 "rule is empty, method:, path:/path, action:read, resource:resource");
    expect_error("path empty", one_rule("get", "", "read", "resource"),
                 "rule is empty, method:get, path:, action:read, resource:resource");
    expect_error("action empty", one_rule("get", "/path", "", "resource"),
                 "rule is empty, method:get, path:/path, action:, resource:resource");
    expect_error("resource empty", one_rule("get", "/path", "read", ""),
                 "rule is empty, method:get, path:/path, action:read, resource:");

    expect_error("slash only", one_rule("get", "/", "read", "resource"), "path is slash only");
    expect_error("no leading slash", one_rule("get", "path", "read", "resource"),
                 "path(path) doesn't start with slash");

    expect_error("duplicated path placeholder",
                 one_rule("get", "/path1/{placeholder1}/{placeholder1}", "read", "resource"),
                 "placeholder({placeholder1}) is duplicated");
    expect_error("duplicated path and query placeholder",
                 one_rule("get", "/path1/{placeholder1}?param1={placeholder1}", "read", "resource"),
                 "placeholder({placeholder1}) is duplicated");
    expect_error("duplicated query placeholder",
                 one_rule("get", "/path1?a={p}&b={p}", "read", "resource"),
                 "placeholder({p}) is duplicated");
}

// ---------------------------------------------------------------------------
// Translate
// ---------------------------------------------------------------------------

static void expect_translate(const std::string& name, const MappingRules& mr,
                             const std::string& domain, const std::string& method,
                             const std::string& path, const std::string& query,
                             const std::string& want_action, const std::string& want_resource) {
    Translation t;
    try {
        t = mr.translate(domain, method, path, query);
    } catch (const std::exception& e) {
        check(false, name + ": unexpected exception: " + e.what());
        return;
    }
    check(t.action == want_action && t.resource == want_resource,
          name + ": got (" + t.action + ", " + t.resource + ") want (" + want_action + ", " + want_resource + ")");
}

static void test_translate() {
    const auto simple = MappingRules::validate(one_rule("get", "/path1/path2", "read", "resource"));
    expect_translate("path matches", simple, "domain", "get", "/path1/path2", "", "read", "resource");
    expect_translate("domain didn't match", simple, "domain1", "get", "/path1/path2", "", "get", "/path1/path2");
    expect_translate("method didn't match", simple, "domain", "post", "/path1/path2", "", "post", "/path1/path2");
    expect_translate("method is case sensitive", simple, "domain", "GET", "/path1/path2", "", "GET", "/path1/path2");

    const MappingRules none;
    expect_translate("rules is nil", none, "domain", "get", "/path1/path2", "", "get", "/path1/path2");

    {
        RawMappingRules raw;
        raw["domain"] = std::vector<RawRule>{};
        const auto empty = MappingRules::validate(raw);
        expect_translate("domain with no rules", empty, "domain", "get", "/x", "", "get", "/x");
    }

    const auto one_ph = MappingRules::validate(
        one_rule("get", "/path1/{placeholder1}/path3", "read", "resource.{placeholder1}"));
    expect_translate("path placeholder", one_ph, "domain", "get", "/path1/path2/path3", "", "read", "resource.path2");

    const auto two_ph = MappingRules::validate(
        one_rule("get", "/{placeholder1}/{placeholder2}", "read", "resource.{placeholder1}.{placeholder2}"));
    expect_translate("two path placeholders", two_ph, "domain", "get", "/path1/path2", "", "read",
                     "resource.path1.path2");

    const auto repeat = MappingRules::validate(
        one_rule("get", "/path1/{placeholder1}/path3", "read", "resource.{placeholder1}.{placeholder1}.{placeholder1}"));
    expect_translate("repeated placeholder in resource", repeat, "domain", "get", "/path1/path2/path3", "", "read",
                     "resource.path2.path2.path2");

    const auto pq = MappingRules::validate(
        one_rule("get", "/path1/{placeholder1}?param1=value1&param2={placeholder2}", "read",
                 "resource.{placeholder1}.{placeholder2}"));
    expect_translate("path and query placeholders", pq, "domain", "get", "/path1/path2",
                     "param2=value2&param1=value1", "read", "resource.path2.value2");

    const auto pqq = MappingRules::validate(
        one_rule("get", "/path1/{placeholder1}?param1={placeholder2}&param2={placeholder3}", "read",
                 "resource.{placeholder1}.{placeholder2}.{placeholder3}"));
    expect_translate("three placeholders", pqq, "domain", "get", "/path1/path2", "param2=value2&param1=value1",
                     "read", "resource.path2.value1.value2");

    const auto len = MappingRules::validate(one_rule("get", "/path1/{placeholder1}", "read", "resource"));
    expect_translate("path lengths differ", len, "domain", "get", "/path1", "", "get", "/path1");

    const auto nomatch = MappingRules::validate(one_rule("get", "/{placeholder1}/path3", "read", "resource"));
    expect_translate("literal segment differs", nomatch, "domain", "get", "/path1/path2", "", "get", "/path1/path2");

    const auto q2 = MappingRules::validate(one_rule("get", "/path1?param1=value1&param2={placeholder2}", "read", "resource"));
    expect_translate("query lengths differ", q2, "domain", "get", "/path1", "param1=value1", "get", "/path1");

    const auto q1 = MappingRules::validate(one_rule("get", "/path1?param1=value1", "read", "resource"));
    expect_translate("query multiple values", q1, "domain", "get", "/path1", "param1=value1&param1=value2", "get",
                     "/path1");
    expect_translate("query value differs", q1, "domain", "get", "/path1", "param1=value2", "get", "/path1");
    expect_translate("query key differs", q1, "domain", "get", "/path1", "param2=value1", "get", "/path1");
    expect_translate("request path empty", q1, "domain", "get", "", "param1=value1", "get", "");
    expect_translate("request path slash", q1, "domain", "get", "/", "param1=value1", "get", "/");
    expect_translate("query matches", q1, "domain", "get", "/path1", "param1=value1", "read", "resource");
    expect_translate("request query is decoded", q1, "domain", "get", "/path1", "param1=value%31", "read", "resource");

    const auto path_only = MappingRules::validate(one_rule("get", "/path1", "read", "resource"));
    expect_translate("extra request query blocks match", path_only, "domain", "get", "/path1", "x=1", "get", "/path1");
    expect_translate("repeated unnamed key is ignored", path_only, "domain", "get", "/path1", "x=1&x=2", "read",
                     "resource");
    expect_translate("repeated key beside a named key", q1, "domain", "get", "/path1", "param1=value1&x=1&x=2",
                     "read", "resource");

    {
        // first match wins, no scoring
        RawMappingRules raw;
        raw["domain"] = std::vector<RawRule>{
            RawRule{"get", "/items/{id}", "read", "generic.{id}"},
            RawRule{"get", "/items/special", "read", "special"},
        };
        const auto ordered = MappingRules::validate(raw);
        expect_translate("first match wins", ordered, "domain", "get", "/items/special", "", "read",
                         "generic.special");
    }
    {
        // a captured value that looks like a placeholder is not expanded again
        const auto mr = MappingRules::validate(one_rule("get", "/{a}/{b}", "read", "r.{a}.{b}"));
        expect_translate("captured text is not re-rendered", mr, "domain", "get", "/{b}/x", "", "read", "r.{b}.x");
    }
    {
        // unknown names in the template stay as written
        const auto mr = MappingRules::validate(one_rule("get", "/{a}", "read", "r.{a}.{zzz}"));
        expect_translate("unknown template name kept", mr, "domain", "get", "/v", "", "read", "r.v.{zzz}");
    }

    // idempotent
    {
        const Translation a = pq.translate("domain", "get", "/path1/path2", "param2=value2&param1=value1");
        const Translation b = pq.translate("domain", "get", "/path1/path2", "param2=value2&param1=value1");
        check(a.action == b.action && a.resource == b.resource, "translate is idempotent");
    }

    // malformed escape is the only error path
    {
        bool threw = false;
        try {
            q1.translate("domain", "get", "/path1", "param1=%zz");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check(threw, "malformed query escape throws invalid_argument");
    }
}

int main() {
    test_compile_shapes();
    test_compile_errors();
    test_translate();

    if (failures != 0) {
        std::cerr << "FAIL: " << failures << " mapping rule check(s) failed\n";
        return 1;
    }
    std::cout << "OK: mapping rules regression test passed\n";
    return 0;
}
