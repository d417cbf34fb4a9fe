#pragma once

#include <string>

#include "syntax/ast.h"
#include "syntax/lexer.h"

namespace analysis_sandbox {

// Maximum expression nesting before the input is rejected
constexpr int kMaxNestingDepth = 200;

/**
 * Parse a module (sequence of statements) into a syntax tree.
 *
 * Accepts the Python 3 statement and expression grammar used by analysis
 * snippets, including f-string replacement fields, which are parsed as
 * ordinary expressions. Structural pattern matching is not supported.
 *
 * @return true on success; on failure error_out carries message and position
 */
bool ParseModule(const std::string& source, SyntaxNode& out, SyntaxErrorInfo* error_out = nullptr);

}  // namespace analysis_sandbox
