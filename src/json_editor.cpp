#include "jsonedit++/json_editor.h"
#include <cstddef>
#include <variant>

namespace jsonedit {

static std::string quoted(const std::string& member_name) {
    return "Member \"" + member_name + "\"";
}

void JSONEditor::set(json& document, const std::string& spec, const json& value, SetMode mode) const {
    if (spec.empty()) {
        document = value;
        return;
    }

    resolver_.process(document, spec, [&](const MutationSite& site) {
        std::visit(overloaded{
            [&](const ObjectMember& member) {
                switch (mode) {
                    case SetMode::ANY:
                        break;
                    case SetMode::EXISTING:
                        if (!member.object->contains(member.name)) {
                            throw PreconditionFailedException(quoted(member.name) + " does not exist");
                        }
                        break;
                    case SetMode::NON_EXISTING:
                        if (member.object->contains(member.name)) {
                            throw PreconditionFailedException(quoted(member.name) + " already exists");
                        }
                        break;
                }
                (*member.object)[member.name] = value;
            },
            [&](const ArrayElement& element) {
                json& array = *element.array;
                const std::size_t size = array.size();
                switch (mode) {
                    case SetMode::ANY:
                        if (element.index > size) {
                            throw IndexOutOfBoundsException(static_cast<long long>(element.index), size);
                        }
                        break;
                    case SetMode::EXISTING:
                        if (element.index >= size) {
                            throw IndexOutOfBoundsException("Array index " + std::to_string(element.index) +
                                                            " too large for array of size " + std::to_string(size));
                        }
                        break;
                    case SetMode::NON_EXISTING:
                        if (element.index != size) {
                            throw IndexOutOfBoundsException("Index " + std::to_string(element.index) +
                                                            " not equal to array size " + std::to_string(size));
                        }
                        break;
                }
                if (element.index == size) {
                    array.push_back(value);
                } else {
                    array[element.index] = value;
                }
            }
        }, site);
    });
}

void JSONEditor::remove(json& document, const std::string& spec, RemoveMode mode) const {
    resolver_.process(document, spec, [&](const MutationSite& site) {
        std::visit(overloaded{
            [&](const ObjectMember& member) {
                if (member.object->erase(member.name) == 0 && mode == RemoveMode::EXISTING) {
                    throw PreconditionFailedException(quoted(member.name) + " does not exist");
                }
            },
            [&](const ArrayElement& element) {
                json& array = *element.array;
                if (element.index >= array.size()) {
                    throw IndexOutOfBoundsException(static_cast<long long>(element.index), array.size());
                }
                array.erase(element.index);
            }
        }, site);
    });
}

void JSONEditor::insert(json& document, const std::string& spec, const json& value) const {
    resolver_.process(document, spec, [&](const MutationSite& site) {
        std::visit(overloaded{
            [&](const ObjectMember& member) {
                throw UnsupportedOperationException("Cannot insert into object member \"" + member.name +
                                                    "\"; use set instead");
            },
            [&](const ArrayElement& element) {
                json& array = *element.array;
                if (element.index > array.size()) {
                    throw IndexOutOfBoundsException(static_cast<long long>(element.index), array.size());
                }
                array.insert(array.begin() + static_cast<std::ptrdiff_t>(element.index), value);
            }
        }, site);
    });
}

} // namespace jsonedit
