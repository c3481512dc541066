#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace gw::agent::infra::portal {

struct ScriptCall {
    std::string functionName;
    std::vector<std::string> arguments; // unquoted, unescaped, trimmed
};

struct ScriptCallParseResult {
    bool ok{false};
    ScriptCall call;
    std::string error;
};

// Parses a `javascript:` URL that invokes one function with string-literal arguments:
//
//   href     := ws "javascript:" ws ident ws "(" ws [ literal { ws "," ws literal } ] ws ")" rest
//   literal  := "'" { char | "\" char } "'"  |  '"' { char | "\" char } '"'
//
// Anything after the closing parenthesis is ignored.
ScriptCallParseResult parseScriptCall(std::string_view href);

} // namespace gw::agent::infra::portal
