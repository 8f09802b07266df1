// ==============================================================================
// VM Parser
// ==============================================================================
// Turns lines of .vm source text into VMCommand values.
// The parser handles:
// - Removing // comments and surrounding whitespace
// - Splitting a line into a mnemonic and up to two operands
// - Validating operand count, numbers and identifiers
// - Reporting errors with the file name and line number
//
// The parser knows nothing about translation state (current function,
// label counter); that belongs to the CodeWriter.
// ==============================================================================

#ifndef VMTRANSLATOR_VM_PARSER_HPP
#define VMTRANSLATOR_VM_PARSER_HPP

#include "vm_command.hpp"
#include "error.hpp"
#include <vector>
#include <string>
#include <optional>
#include <utility>

namespace vmt {

// ==============================================================================
// VM Parser Class
// ==============================================================================

/**
 * @brief Parses VM source code into commands
 *
 * Usage:
 *   VMParser parser("Main");
 *   std::vector<VMCommand> commands = parser.parse_source(text);
 *
 * or one line at a time:
 *   auto cmd = parser.parse_line("push constant 7", 1);
 *   if (cmd) { ... }
 *
 * The parser is lenient with whitespace and handles:
 * - Single-line comments: // comment
 * - Empty lines
 * - Leading/trailing whitespace, tabs, CRLF line endings
 * - Multiple spaces between tokens
 */
class VMParser {
public:
    /**
     * @param file_name Name used in error messages (usually the file stem)
     */
    explicit VMParser(std::string file_name = "<string>");

    /**
     * @brief Parse a single line of VM code
     *
     * @param line The raw line (may be empty or comment-only)
     * @param line_number Line number for error messages (0 if unknown)
     * @return The parsed command, or nullopt if the line holds no command
     * @throws UnknownCommandError if the mnemonic is not a VM command
     * @throws MalformedCommandError if the operands don't fit the mnemonic
     */
    std::optional<VMCommand> parse_line(const std::string& line,
                                        LineNumber line_number = 0);

    /**
     * @brief Parse a whole file body
     *
     * Lines are numbered from 1. Commands come back in source order.
     */
    std::vector<VMCommand> parse_source(const std::string& source);

    const std::string& file_name() const { return file_name_; }

private:
    std::string file_name_;     // For error messages
    LineNumber current_line_ = 0;

    // =========================================================================
    // Parsing Helpers
    // =========================================================================

    /**
     * @brief Split a line into whitespace-separated tokens
     *
     * Everything from "//" on is dropped first. A comment-only or blank
     * line yields no tokens.
     */
    std::vector<std::string> tokenize(const std::string& line) const;

    ArithmeticCommand parse_arithmetic(ArithmeticOp op,
                                       const std::vector<std::string>& tokens);
    MemoryAccessCommand parse_memory_access(MemoryDirection direction,
                                            const std::vector<std::string>& tokens);
    BranchCommand parse_branch(BranchKind kind,
                               const std::vector<std::string>& tokens);
    FunctionCommand parse_function(const std::vector<std::string>& tokens);
    CallCommand parse_call(const std::vector<std::string>& tokens);
    ReturnCommand parse_return(const std::vector<std::string>& tokens);

    /**
     * @brief Shared operand shape of function and call: name, count
     */
    std::pair<std::string, uint16_t> parse_name_and_count(
        const std::vector<std::string>& tokens, const char* count_name);

    /**
     * @brief Parse a segment name string to SegmentType
     *
     * @throws MalformedCommandError if segment name is invalid
     */
    SegmentType parse_segment(const std::string& segment_str);

    /**
     * @brief Parse an index or count operand
     *
     * Only decimal digits are accepted; the value must fit in 15 bits
     * since the target loads constants with an A-instruction.
     *
     * @throws MalformedCommandError if invalid or out of range
     */
    uint16_t parse_index(const std::string& index_str);

    /**
     * @brief Report an unknown mnemonic, with a suggestion for common typos
     */
    [[noreturn]] void unknown_command(const std::string& keyword);

    [[noreturn]] void error(const std::string& message);
    [[noreturn]] void error_with_suggestion(const std::string& message,
                                             const std::string& wrong,
                                             const std::string& correct);
};

// ==============================================================================
// Utility Functions
// ==============================================================================

/**
 * @brief Check if a string is a valid VM function name
 *
 * Valid names start with a letter, underscore or dot and contain only
 * letters, digits, underscores and dots.
 */
bool is_valid_identifier(const std::string& str);

/**
 * @brief Check if a string is a valid label name
 *
 * Same as identifiers, plus colons. Never contains '$'.
 */
bool is_valid_label(const std::string& str);

/**
 * @brief Get the base name of a file (without directory and extension)
 *
 * Example: "/path/to/Math.vm" -> "Math"
 */
std::string get_file_basename(const std::string& file_path);

}  // namespace vmt

#endif  // VMTRANSLATOR_VM_PARSER_HPP
