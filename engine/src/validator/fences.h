#pragma once

#include <string>
#include <vector>

namespace analysis_sandbox {

/**
 * Extract the contents of every ``` fenced block (optional language tag on
 * the opening line), each trimmed. Text with no complete fence pair is
 * returned whole, trimmed, as the single element.
 */
std::vector<std::string> ExtractCodeBlocks(const std::string& text);

/**
 * The code a run will execute: the first extracted block.
 */
std::string Sanitize(const std::string& code);

/**
 * Strip leading and trailing whitespace.
 */
std::string Trim(const std::string& s);

}  // namespace analysis_sandbox
