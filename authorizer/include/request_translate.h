#pragma once

#include <string>

#include "httplib.h"

#include "mapping_rules.h"

namespace authorizer {

// Translate an inbound httplib request through the compiled rules.
//
// Uses req.method, req.path and req.params as httplib already decoded them,
// so the query is not re-serialized. A parameter present more than once is
// ambiguous and cannot satisfy a rule.
Translation translate_request(const MappingRules& rules,
                              const std::string& domain,
                              const httplib::Request& req);

} // namespace authorizer
