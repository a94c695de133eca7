#pragma once

#include <nlohmann/json.hpp>

namespace jsonedit {

// Member order of edited documents is preserved, so the ordered variant is used throughout.
using json = nlohmann::ordered_json;

// Existence precondition for SET operations
enum class SetMode {
    ANY,          // Replace or create
    EXISTING,     // Target must exist (and is replaced)
    NON_EXISTING  // Target must not exist (and is created)
};

// Existence precondition for REMOVE operations. Only object members distinguish the two;
// array elements must always exist.
enum class RemoveMode {
    ANY,      // Removing an absent member is a no-op
    EXISTING  // Member must exist
};

// Parsing settings for input documents
struct ParseOptions {
    bool lenient = false; // Skip /* */ and // comments
};

// Serialization settings for transformed documents
struct OutputOptions {
    bool pretty_printing = false; // Wrap and indent objects and arrays
    int indent = 2;               // Spaces per level when pretty_printing is set
};

} // namespace jsonedit
