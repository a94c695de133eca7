#include "jsonedit++/document_io.h"
#include "jsonedit++/exceptions.h"
#include <istream>
#include <ostream>

namespace jsonedit {

json parse_document(std::istream& in, const ParseOptions& options) {
    try {
        return json::parse(in, nullptr, true, options.lenient /* ignore_comments */);
    } catch (const json::parse_error& e) { // Catch nlohmann::json specific exceptions
        throw JsonParsingException(e.what());
    }
}

json parse_document(const std::string& text, const ParseOptions& options) {
    try {
        return json::parse(text, nullptr, true, options.lenient);
    } catch (const json::parse_error& e) {
        throw JsonParsingException(e.what());
    }
}

std::string serialize_document(const json& document, const OutputOptions& options) {
    return document.dump(options.pretty_printing ? options.indent : -1);
}

void write_document(std::ostream& out, const json& document, const OutputOptions& options) {
    out << serialize_document(document, options);
}

} // namespace jsonedit
