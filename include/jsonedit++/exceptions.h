#pragma once

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>

namespace jsonedit {

enum class ErrorCode {
    SUCCESS = 0,
    SPEC_SYNTAX = 1001,
    TYPE_MISMATCH = 1003,
    INDEX_OUT_OF_BOUNDS = 1004,
    PRECONDITION_FAILED = 1005,
    UNSUPPORTED_OPERATION = 1006,
    JSON_PARSING_ERROR = 2001,
    FILE_ACCESS_ERROR = 3001,
    INVALID_ARGUMENT = 4001,
    UNKNOWN_ERROR = 9999
};

// Base exception for the library
class JsonEditException : public std::runtime_error {
public:
    JsonEditException(const std::string& message, ErrorCode code)
        : std::runtime_error(message), error_code_(code) {}

    ErrorCode error_code() const { return error_code_; }

private:
    ErrorCode error_code_;
};

// -- Spec Related Exceptions --
class SpecSyntaxException : public JsonEditException {
public:
    SpecSyntaxException(const std::string& remainder, std::size_t offset)
        : JsonEditException("Invalid spec \"" + remainder + "\" at offset " + std::to_string(offset),
                            ErrorCode::SPEC_SYNTAX),
          remainder_(remainder), offset_(offset) {}
    SpecSyntaxException(const std::string& remainder, std::size_t offset, const std::string& details)
        : JsonEditException("Invalid spec \"" + remainder + "\" at offset " + std::to_string(offset) + ": " + details,
                            ErrorCode::SPEC_SYNTAX),
          remainder_(remainder), offset_(offset) {}

    const std::string& remainder() const { return remainder_; }
    std::size_t offset() const { return offset_; }

private:
    std::string remainder_;
    std::size_t offset_;
};

/**
 * Context wrapper thrown (via std::throw_with_nested) around any failure that occurred while a spec
 * was being resolved. The original exception is the nested cause; error_code() is the cause's code.
 */
class SpecProcessingException : public JsonEditException {
public:
    SpecProcessingException(const std::string& spec, std::size_t offset, ErrorCode cause_code)
        : JsonEditException("Processing spec '" + spec + "' at offset " + std::to_string(offset), cause_code),
          spec_(spec), offset_(offset) {}

    const std::string& spec() const { return spec_; }
    std::size_t offset() const { return offset_; }

private:
    std::string spec_;
    std::size_t offset_;
};


// -- JSON Processing Exceptions --
class JsonParsingException : public JsonEditException {
public:
    explicit JsonParsingException(const std::string& message)
        : JsonEditException("JSON Parsing Error: " + message, ErrorCode::JSON_PARSING_ERROR) {}
};

class TypeMismatchException : public JsonEditException {
public:
    explicit TypeMismatchException(const std::string& message)
        : JsonEditException("JSON Type Mismatch: " + message, ErrorCode::TYPE_MISMATCH) {}
    TypeMismatchException(const std::string& expected_type, const std::string& actual_type)
        : JsonEditException("JSON Type Mismatch: expected " + expected_type + ", got " + actual_type,
                            ErrorCode::TYPE_MISMATCH) {}
};

class IndexOutOfBoundsException : public JsonEditException {
public:
    explicit IndexOutOfBoundsException(const std::string& message)
        : JsonEditException("Index Out of Bounds: " + message, ErrorCode::INDEX_OUT_OF_BOUNDS) {}
    IndexOutOfBoundsException(long long index, std::size_t array_size)
        : JsonEditException("Index Out of Bounds: index " + std::to_string(index) + " on array of size " +
                            std::to_string(array_size), ErrorCode::INDEX_OUT_OF_BOUNDS) {}
};


// -- Mutation Exceptions --
class PreconditionFailedException : public JsonEditException {
public:
    explicit PreconditionFailedException(const std::string& message)
        : JsonEditException("Precondition Failed: " + message, ErrorCode::PRECONDITION_FAILED) {}
};

class UnsupportedOperationException : public JsonEditException {
public:
    explicit UnsupportedOperationException(const std::string& message)
        : JsonEditException("Unsupported Operation: " + message, ErrorCode::UNSUPPORTED_OPERATION) {}
};


// -- Tool Exceptions --
class FileAccessException : public JsonEditException {
public:
    FileAccessException(const std::string& file_name, const std::string& details)
        : JsonEditException("File Access Error for '" + file_name + "': " + details, ErrorCode::FILE_ACCESS_ERROR) {}
};

class CommandLineException : public JsonEditException {
public:
    explicit CommandLineException(const std::string& message)
        : JsonEditException("Command Line Error: " + message, ErrorCode::INVALID_ARGUMENT) {}
};


/**
 * Renders an exception and all of its nested causes, outermost first, joined with ": ".
 */
std::string describe_exception(const std::exception& e);

} // namespace jsonedit
