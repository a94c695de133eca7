#pragma once

#include "spec_resolver.h" // Uses MutationSite
#include "exceptions.h"    // For custom exceptions
#include "common_types.h"
#include <string>

namespace jsonedit {

class JSONEditor {
public:
    /**
     * Adds or changes one array element or object member.
     * An empty spec replaces the entire document with `value`.
     * ".name": EXISTING requires the member to exist, NON_EXISTING requires it to be absent
     * (PreconditionFailedException otherwise). Replacing keeps the member's position; new members are appended.
     * "[i]" / "[]": EXISTING requires i < size, NON_EXISTING requires i == size, ANY requires i <= size
     * (IndexOutOfBoundsException otherwise). i == size appends.
     * Failures during resolution arrive as SpecProcessingException with the cause nested.
     */
    void set(json& document, const std::string& spec, const json& value, SetMode mode = SetMode::ANY) const;

    /**
     * Removes one array element or object member.
     * ".name": an absent member is a no-op for ANY and a PreconditionFailedException for EXISTING.
     * "[i]": requires i < size regardless of mode; later elements shift down.
     * The whole document cannot be removed; an empty spec is a syntax error.
     */
    void remove(json& document, const std::string& spec, RemoveMode mode = RemoveMode::ANY) const;

    /**
     * Inserts an element into an array before position i ("[]" and "[size]" append).
     * Requires i <= size (IndexOutOfBoundsException); an object member spec is an UnsupportedOperationException.
     */
    void insert(json& document, const std::string& spec, const json& value) const;

private:
    SpecResolver resolver_;
};

} // namespace jsonedit
