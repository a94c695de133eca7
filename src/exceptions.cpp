#include "jsonedit++/exceptions.h"

namespace jsonedit {

static void append_causes(const std::exception& e, std::string& out) {
    out += e.what();
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& cause) {
        out += ": ";
        append_causes(cause, out);
    }
}

std::string describe_exception(const std::exception& e) {
    std::string description;
    append_causes(e, description);
    return description;
}

} // namespace jsonedit
