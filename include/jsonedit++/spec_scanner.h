#pragma once

#include <cstddef>
#include <string>

namespace jsonedit {

/**
 * Tokenizes a spec ("", ".a.b", "[3].name", "[-1]", ".list[]") one step at a time, left to right.
 * Steps are only recognized when the resolver asks for them, so a syntax error is reported at the
 * offset where resolution actually reached it.
 */
class SpecScanner {
public:
    struct PathStep {
        enum class Type { MEMBER, INDEX, APPEND };
        Type type;
        std::string member_name; // MEMBER only
        int index = 0;           // INDEX only, as written (may be negative)
        std::size_t offset = 0;  // Offset of the step within the spec
        bool is_final = false;   // Nothing follows this step
    };

    explicit SpecScanner(std::string spec);

    const std::string& spec() const { return spec_; }
    std::size_t offset() const { return position_; }
    bool at_end() const { return position_ == spec_.size(); }
    std::string remainder() const { return spec_.substr(position_); }

    /**
     * Consumes the next step.
     * Throws SpecSyntaxException (carrying the unmatched remainder and its offset) if no step starts
     * at the current position, including when the scanner is already at the end. The append marker
     * "[]" is only recognized as the final step.
     */
    PathStep next();

private:
    PathStep scan_member();
    PathStep scan_bracket();

    std::string spec_;
    std::size_t position_ = 0;
};

} // namespace jsonedit
