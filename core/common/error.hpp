// ==============================================================================
// Error Handling
// ==============================================================================
// Exception types raised by the translator. Every translation error is
// fatal: the driver stops at the first one and reports it with the file
// and line of the offending VM command.
// ==============================================================================

#ifndef VMTRANSLATOR_COMMON_ERROR_HPP
#define VMTRANSLATOR_COMMON_ERROR_HPP

#include <exception>
#include <string>
#include <sstream>
#include "types.hpp"

namespace vmt {

// ==============================================================================
// Error Categories
// ==============================================================================

/**
 * @brief Different categories of errors that can occur
 *
 * - MALFORMED_COMMAND: known mnemonic, wrong operand count or type
 * - UNKNOWN_COMMAND: mnemonic outside the VM vocabulary
 * - INVALID_SEGMENT_OPERATION: e.g. pop constant, temp 8
 * - FILE_ERROR: couldn't read an input or write the output
 * - ASSEMBLY_ERROR: malformed assembly fed to the verification assembler
 * - RUNTIME_ERROR: the verification machine executed something invalid
 * - INTERNAL_ERROR: bug in the translator itself
 */
enum class ErrorCategory {
    MALFORMED_COMMAND,
    UNKNOWN_COMMAND,
    INVALID_SEGMENT_OPERATION,
    FILE_ERROR,
    ASSEMBLY_ERROR,
    RUNTIME_ERROR,
    INTERNAL_ERROR
};

/**
 * @brief Convert ErrorCategory to string for display
 */
inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::MALFORMED_COMMAND:         return "Malformed Command";
        case ErrorCategory::UNKNOWN_COMMAND:           return "Unknown Command";
        case ErrorCategory::INVALID_SEGMENT_OPERATION: return "Invalid Segment Operation";
        case ErrorCategory::FILE_ERROR:                return "File Error";
        case ErrorCategory::ASSEMBLY_ERROR:            return "Assembly Error";
        case ErrorCategory::RUNTIME_ERROR:             return "Runtime Error";
        case ErrorCategory::INTERNAL_ERROR:            return "Internal Error";
        default:                                       return "Unknown Error";
    }
}

// ==============================================================================
// Base Exception Class
// ==============================================================================

/**
 * @brief Base exception class for all translator errors
 *
 * Carries the category, the file and line where the problem was found,
 * and a description.
 *
 * Example usage:
 *   throw VMTError(ErrorCategory::UNKNOWN_COMMAND, "Main", 42,
 *                  "Unknown command: 'psh' (did you mean 'push'?)");
 *
 * This will produce:
 *   Unknown Command in Main:42 - Unknown command: 'psh' (did you mean 'push'?)
 */
class VMTError : public std::exception {
public:
    /**
     * @brief Construct an error with full context
     *
     * @param category What kind of error
     * @param file Which file the error is in
     * @param line Which line number (0 if unknown)
     * @param message Description of what went wrong
     */
    VMTError(ErrorCategory category,
             const std::string& file,
             LineNumber line,
             const std::string& message)
        : category_(category)
        , file_(file)
        , line_(line)
        , message_(message)
    {
        std::ostringstream oss;
        oss << error_category_to_string(category);

        if (!file.empty()) {
            oss << " in " << file;
            if (line > 0) {
                oss << ":" << line;
            }
        }

        oss << " - " << message;
        full_message_ = oss.str();
    }

    /**
     * @brief Construct a simple error without file context
     */
    VMTError(ErrorCategory category, const std::string& message)
        : VMTError(category, "", 0, message)
    {}

    const char* what() const noexcept override {
        return full_message_.c_str();
    }

    ErrorCategory category() const { return category_; }
    const std::string& file() const { return file_; }

    /**
     * @brief Line number where the error occurred (0 if unknown)
     */
    LineNumber line() const { return line_; }

    /**
     * @brief Just the message, without category/file/line
     */
    const std::string& message() const { return message_; }

private:
    ErrorCategory category_;
    std::string file_;
    LineNumber line_;
    std::string message_;
    std::string full_message_;  // Cached formatted message
};

// ==============================================================================
// Specific Exception Types
// ==============================================================================

/**
 * @brief A recognized mnemonic with the wrong shape
 *
 * Examples:
 * - "push local" (missing index)
 * - "call Foo.bar x" (count is not a number)
 * - "function 1abc 0" (invalid identifier)
 */
class MalformedCommandError : public VMTError {
public:
    MalformedCommandError(const std::string& file, LineNumber line, const std::string& message)
        : VMTError(ErrorCategory::MALFORMED_COMMAND, file, line, message)
    {}

    MalformedCommandError(const std::string& message)
        : VMTError(ErrorCategory::MALFORMED_COMMAND, message)
    {}
};

/**
 * @brief A mnemonic that is not part of the VM vocabulary
 */
class UnknownCommandError : public VMTError {
public:
    UnknownCommandError(const std::string& file, LineNumber line, const std::string& message)
        : VMTError(ErrorCategory::UNKNOWN_COMMAND, file, line, message)
    {}

    UnknownCommandError(const std::string& message)
        : VMTError(ErrorCategory::UNKNOWN_COMMAND, message)
    {}
};

/**
 * @brief A segment access the target cannot express
 *
 * Examples:
 * - pop constant 3
 * - push temp 8 (temp has 8 cells)
 * - pop pointer 2 (pointer has 2 cells)
 */
class InvalidSegmentOperationError : public VMTError {
public:
    InvalidSegmentOperationError(const std::string& file, LineNumber line, const std::string& message)
        : VMTError(ErrorCategory::INVALID_SEGMENT_OPERATION, file, line, message)
    {}

    InvalidSegmentOperationError(const std::string& message)
        : VMTError(ErrorCategory::INVALID_SEGMENT_OPERATION, message)
    {}
};

/**
 * @brief File error - couldn't read or write a file
 */
class FileError : public VMTError {
public:
    FileError(const std::string& file, const std::string& message)
        : VMTError(ErrorCategory::FILE_ERROR, file, 0, message)
    {}

    FileError(const std::string& message)
        : VMTError(ErrorCategory::FILE_ERROR, message)
    {}
};

/**
 * @brief Malformed assembly text given to the verification assembler
 */
class AssemblyError : public VMTError {
public:
    AssemblyError(LineNumber line, const std::string& message)
        : VMTError(ErrorCategory::ASSEMBLY_ERROR, "<asm>", line, message)
    {}
};

/**
 * @brief The verification machine executed something invalid
 */
class RuntimeError : public VMTError {
public:
    RuntimeError(const std::string& message)
        : VMTError(ErrorCategory::RUNTIME_ERROR, message)
    {}
};

/**
 * @brief Internal error - bug in the translator itself
 */
class InternalError : public VMTError {
public:
    InternalError(const std::string& message)
        : VMTError(ErrorCategory::INTERNAL_ERROR, message)
    {}
};

// ==============================================================================
// Error Reporting Helpers
// ==============================================================================

/**
 * @brief Concatenate any streamable values into one message
 *
 * Example:
 *   build_error_message("temp index ", 9, " out of range (0-7)")
 */
template<typename... Args>
std::string build_error_message(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << args);
    return oss.str();
}

/**
 * @brief Format a suggestion for a typo
 *
 * Example:
 *   format_suggestion("psh", "push")
 * Returns:
 *   "'psh' (did you mean 'push'?)"
 */
inline std::string format_suggestion(const std::string& wrong, const std::string& correct) {
    return "'" + wrong + "' (did you mean '" + correct + "'?)";
}

}  // namespace vmt

#endif  // VMTRANSLATOR_COMMON_ERROR_HPP
