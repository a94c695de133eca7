#pragma once

#include "common_types.h"
#include <cstddef>
#include <functional>
#include <string>
#include <variant>

namespace jsonedit {

// A member of a live object; the member may or may not exist yet.
struct ObjectMember {
    json* object;
    std::string name;
};

// A position in a live array: 0 <= index, and index == size() denotes "one past the end".
// Upper bounds are checked by the operation that consumes the site.
struct ArrayElement {
    json* array;
    std::size_t index;
};

using MutationSite = std::variant<ObjectMember, ArrayElement>;

// Visitor helper for MutationSite and the pipeline's operation variant
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;


class SpecResolver {
public:
    using SiteHandler = std::function<void(const MutationSite& site)>;

    /**
     * Walks `root` along `spec` and calls `handler` with the site designated by the final step.
     * Intermediate steps navigate strictly: the container must have the expected type, array
     * elements must exist, and an absent member continues as null (so the following step reports
     * a type mismatch).
     *
     * Every JsonEditException raised while a step is handled, including those thrown by `handler`,
     * is rethrown nested inside a SpecProcessingException naming the spec and the step's offset.
     * An empty spec is a syntax error; callers that give it a meaning must handle it themselves.
     */
    void process(json& root, const std::string& spec, const SiteHandler& handler) const;
};

} // namespace jsonedit
