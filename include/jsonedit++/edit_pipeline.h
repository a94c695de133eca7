#pragma once

#include "common_types.h"
#include "json_editor.h"
#include <cstddef>
#include <iosfwd>
#include <string>
#include <variant>
#include <vector>

namespace jsonedit {

struct SetOperation {
    std::string spec;
    json value;
    SetMode mode = SetMode::ANY;
};

struct RemoveOperation {
    std::string spec;
    RemoveMode mode = RemoveMode::ANY;
};

struct InsertOperation {
    std::string spec;
    json value;
};

using EditOperation = std::variant<SetOperation, RemoveOperation, InsertOperation>;

// Human readable form of an operation, e.g. "set (existing) '.a[0]'"
std::string describe_operation(const EditOperation& operation);


/**
 * An ordered list of edit operations, configured once and then applied to any number of documents.
 * Values are copied into the pipeline at registration time; apply() never modifies the pipeline, so
 * one instance may be shared by concurrent transforms of distinct documents.
 */
class EditPipeline {
public:
    EditPipeline() = default;

    // --- Fluent API for registering operations ---
    EditPipeline& add_set(const std::string& spec, json value, SetMode mode = SetMode::ANY);
    EditPipeline& add_remove(const std::string& spec, RemoveMode mode = RemoveMode::ANY);
    EditPipeline& add_insert(const std::string& spec, json value);

    /**
     * Applies all operations, in registration order, and returns the resulting document.
     * The first failing operation aborts the transform; its exception is propagated unchanged.
     */
    json apply(json document) const;

    /**
     * Reads one JSON document from `in`, applies all operations and writes the result to `out`.
     * @throws JsonParsingException if `in` does not hold a JSON document.
     */
    void transform(std::istream& in, std::ostream& out, const OutputOptions& options = {},
                   const ParseOptions& input = {}) const;

    const std::vector<EditOperation>& operations() const { return operations_; }
    std::size_t size() const { return operations_.size(); }
    bool empty() const { return operations_.empty(); }

private:
    std::vector<EditOperation> operations_;
    JSONEditor editor_;
};

} // namespace jsonedit
