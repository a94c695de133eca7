#include "jsonedit++/spec_scanner.h"
#include "jsonedit++/exceptions.h"
#include <stdexcept> // For std::invalid_argument, std::out_of_range
#include <utility>

namespace jsonedit {

// ASCII only; member names must not depend on the current locale.
static bool is_name_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
}

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

SpecScanner::SpecScanner(std::string spec) : spec_(std::move(spec)) {}

SpecScanner::PathStep SpecScanner::next() {
    if (!at_end()) {
        if (spec_[position_] == '.') {
            return scan_member();
        }
        if (spec_[position_] == '[') {
            return scan_bracket();
        }
    }
    throw SpecSyntaxException(remainder(), position_);
}

// .name
SpecScanner::PathStep SpecScanner::scan_member() {
    size_t end = position_ + 1;
    while (end < spec_.size() && is_name_char(spec_[end])) {
        ++end;
    }
    if (end == position_ + 1) {
        throw SpecSyntaxException(remainder(), position_, "member name expected after '.'");
    }

    PathStep step;
    step.type = PathStep::Type::MEMBER;
    step.member_name = spec_.substr(position_ + 1, end - position_ - 1);
    step.offset = position_;
    step.is_final = (end == spec_.size());
    position_ = end;
    return step;
}

// [] or [N]
SpecScanner::PathStep SpecScanner::scan_bracket() {
    size_t end = position_ + 1;

    if (end < spec_.size() && spec_[end] == ']') {
        ++end;
        if (end != spec_.size()) {
            // The append marker designates a position one past the last element; nothing can
            // be navigated below it.
            throw SpecSyntaxException(remainder(), position_, "'[]' must be the last step");
        }
        PathStep step;
        step.type = PathStep::Type::APPEND;
        step.offset = position_;
        step.is_final = true;
        position_ = end;
        return step;
    }

    size_t digits_begin = end;
    if (end < spec_.size() && spec_[end] == '-') {
        ++end;
    }
    size_t digits_start = end;
    while (end < spec_.size() && is_digit(spec_[end])) {
        ++end;
    }
    if (end == digits_start || end >= spec_.size() || spec_[end] != ']') {
        throw SpecSyntaxException(remainder(), position_);
    }

    std::string index_text = spec_.substr(digits_begin, end - digits_begin);
    PathStep step;
    step.type = PathStep::Type::INDEX;
    try {
        step.index = std::stoi(index_text);
    } catch (const std::out_of_range&) {
        throw SpecSyntaxException(remainder(), position_, "array index " + index_text + " is out of range");
    } catch (const std::invalid_argument&) {
        throw SpecSyntaxException(remainder(), position_, "invalid array index " + index_text);
    }
    ++end; // ']'
    step.offset = position_;
    step.is_final = (end == spec_.size());
    position_ = end;
    return step;
}

} // namespace jsonedit
