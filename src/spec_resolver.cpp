#include "jsonedit++/spec_resolver.h"
#include "jsonedit++/exceptions.h"
#include "jsonedit++/spec_scanner.h"
#include <exception> // For std::throw_with_nested

namespace jsonedit {

using PathStep = SpecScanner::PathStep;

static json& require_object(json& value) {
    if (!value.is_object()) {
        throw TypeMismatchException("object", value.type_name());
    }
    return value;
}

static json& require_array(json& value) {
    if (!value.is_array()) {
        throw TypeMismatchException("array", value.type_name());
    }
    return value;
}

// Negative indices count from the end of the array as it is now.
static long long normalize_index(int index, std::size_t size) {
    long long normalized = index;
    if (normalized < 0) {
        normalized += static_cast<long long>(size);
    }
    return normalized;
}

void SpecResolver::process(json& root, const std::string& spec, const SiteHandler& handler) const {
    SpecScanner scanner(spec);
    json* current = &root;
    json missing_member; // Stands in for absent intermediate members

    for (;;) {
        const std::size_t step_offset = scanner.offset();
        try {
            const PathStep step = scanner.next();

            switch (step.type) {
                case PathStep::Type::MEMBER: {
                    json& object = require_object(*current);
                    if (step.is_final) {
                        handler(ObjectMember{&object, step.member_name});
                        return;
                    }
                    auto it = object.find(step.member_name);
                    if (it == object.end()) {
                        missing_member = nullptr;
                        current = &missing_member;
                    } else {
                        current = &*it;
                    }
                    break;
                }
                case PathStep::Type::APPEND: {
                    json& array = require_array(*current);
                    handler(ArrayElement{&array, array.size()});
                    return;
                }
                case PathStep::Type::INDEX: {
                    json& array = require_array(*current);
                    const long long index = normalize_index(step.index, array.size());
                    if (step.is_final) {
                        if (index < 0) {
                            throw IndexOutOfBoundsException(step.index, array.size());
                        }
                        handler(ArrayElement{&array, static_cast<std::size_t>(index)});
                        return;
                    }
                    if (index < 0 || static_cast<std::size_t>(index) >= array.size()) {
                        throw IndexOutOfBoundsException(step.index, array.size());
                    }
                    current = &array[static_cast<std::size_t>(index)];
                    break;
                }
            }
        } catch (const JsonEditException& e) {
            std::throw_with_nested(SpecProcessingException(spec, step_offset, e.error_code()));
        }
    }
}

} // namespace jsonedit
