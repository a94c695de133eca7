#pragma once

#include "common_types.h"
#include <iosfwd>
#include <string>

namespace jsonedit {

// Parses one JSON document; comments are skipped only when options.lenient is set.
// Throws JsonParsingException.
json parse_document(std::istream& in, const ParseOptions& options = {});
json parse_document(const std::string& text, const ParseOptions& options = {});

// Compact unless options.pretty_printing is set. No trailing newline is written.
std::string serialize_document(const json& document, const OutputOptions& options = {});
void write_document(std::ostream& out, const json& document, const OutputOptions& options = {});

} // namespace jsonedit
