#include "jsonedit++/edit_pipeline.h"
#include "jsonedit++/document_io.h"
#include "jsonedit++/logging.h"
#include <utility>

namespace jsonedit {

std::string describe_operation(const EditOperation& operation) {
    return std::visit(overloaded{
        [](const SetOperation& op) {
            std::string mode;
            switch (op.mode) {
                case SetMode::ANY:          mode = ""; break;
                case SetMode::EXISTING:     mode = " (existing)"; break;
                case SetMode::NON_EXISTING: mode = " (non-existing)"; break;
            }
            return "set" + mode + " '" + op.spec + "'";
        },
        [](const RemoveOperation& op) {
            return std::string(op.mode == RemoveMode::EXISTING ? "remove (existing)" : "remove") +
                   " '" + op.spec + "'";
        },
        [](const InsertOperation& op) {
            return "insert '" + op.spec + "'";
        }
    }, operation);
}

EditPipeline& EditPipeline::add_set(const std::string& spec, json value, SetMode mode) {
    operations_.emplace_back(SetOperation{spec, std::move(value), mode});
    return *this;
}

EditPipeline& EditPipeline::add_remove(const std::string& spec, RemoveMode mode) {
    operations_.emplace_back(RemoveOperation{spec, mode});
    return *this;
}

EditPipeline& EditPipeline::add_insert(const std::string& spec, json value) {
    operations_.emplace_back(InsertOperation{spec, std::move(value)});
    return *this;
}

json EditPipeline::apply(json document) const {
    for (const auto& operation : operations_) {
        logger()->debug("Applying {}", describe_operation(operation));
        std::visit(overloaded{
            [&](const SetOperation& op) { editor_.set(document, op.spec, op.value, op.mode); },
            [&](const RemoveOperation& op) { editor_.remove(document, op.spec, op.mode); },
            [&](const InsertOperation& op) { editor_.insert(document, op.spec, op.value); }
        }, operation);
    }
    return document;
}

void EditPipeline::transform(std::istream& in, std::ostream& out, const OutputOptions& options,
                             const ParseOptions& input) const {
    json document = parse_document(in, input);
    write_document(out, apply(std::move(document)), options);
}

} // namespace jsonedit
