#include "jsonedit++/edit_pipeline.h"
#include "jsonedit++/json_editor.h"
#include "jsonedit++/common_types.h"
#include "jsonedit++/exceptions.h"
#include <iostream>
#include <sstream>
#include <string>

using jsonedit::json;

void print_header(const std::string& header) {
    std::cout << "\n--- " << header << " ---\n" << std::endl;
}

void run_single_edits(const jsonedit::JSONEditor& editor) {
    print_header("Single Edits");
    json profile = {
        {"name", "John Doe"},
        {"age", 30},
        {"address", {
            {"street", "123 Main St"},
            {"city", "Anytown"}
        }},
        {"hobbies", {"reading", "cycling", "photography"}}
    };

    // 1. Change an existing member; its position is kept
    editor.set(profile, ".age", 31, jsonedit::SetMode::EXISTING);
    std::cout << "SUCCESS: SET .age -> " << profile.dump() << std::endl;

    // 2. Add a member below a nested object
    editor.set(profile, ".address.zip", "12345", jsonedit::SetMode::NON_EXISTING);
    std::cout << "SUCCESS: SET .address.zip -> " << profile["address"].dump() << std::endl;

    // 3. Append, insert and remove array elements
    editor.set(profile, ".hobbies[]", "chess");
    editor.insert(profile, ".hobbies[0]", "hiking");
    editor.remove(profile, ".hobbies[-2]");
    std::cout << "SUCCESS: array edits -> " << profile["hobbies"].dump() << std::endl;

    // 4. A failing precondition reports the spec and offset, with the cause nested
    try {
        editor.set(profile, ".address.country", "US", jsonedit::SetMode::EXISTING);
    } catch (const jsonedit::JsonEditException& e) {
        std::cerr << "EXPECTED ERROR: " << jsonedit::describe_exception(e) << std::endl;
    }
}

void run_pipeline() {
    print_header("Pipeline");
    jsonedit::EditPipeline pipeline;
    pipeline.add_set(".status", "active")
            .add_remove(".legacy")
            .add_insert(".tags[0]", "first");

    const char* documents[] = {
        R"({"id": 1, "legacy": true, "tags": ["a", "b"]})",
        R"({"id": 2, "tags": []})",
        R"({"id": 3, "tags": {}})" // .tags is not an array
    };

    for (const char* text : documents) {
        std::istringstream in(text);
        std::ostringstream out;
        try {
            pipeline.transform(in, out);
            std::cout << "SUCCESS: " << out.str() << std::endl;
        } catch (const jsonedit::JsonEditException& e) {
            std::cerr << "ERROR: " << jsonedit::describe_exception(e) << std::endl;
        }
    }
}

int main() {
    jsonedit::JSONEditor editor;
    run_single_edits(editor);
    run_pipeline();
    return 0;
}
