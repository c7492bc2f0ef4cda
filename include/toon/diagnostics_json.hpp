// diagnostics_json.hpp - JSON rendering of parse diagnostics and env-gated stderr output
#pragma once
#include "toon/toon.hpp"
#include <string>

namespace toon {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// {"success":bool,"errors":[{code,message,hint,line,col,position,length}...],"tokens":N}
std::string diagnostics_to_json(const ParseResult& r);

// If TOON_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(const ParseResult& r);

// If TOON_TRACE_TOKENS=1 in the environment, print one line per token to stderr.
void maybe_trace_tokens(const token_list& tokens);

} // namespace toon
