#include "request_translate.h"

#include <map>
#include <vector>

namespace authorizer {

Translation translate_request(const MappingRules& rules,
                              const std::string& domain,
                              const httplib::Request& req) {
    std::map<std::string, std::vector<std::string>> query;
    for (const auto& kv : req.params) {
        query[kv.first].push_back(kv.second);
    }
    return rules.translate_parsed(domain, req.method, req.path, query);
}

} // namespace authorizer
