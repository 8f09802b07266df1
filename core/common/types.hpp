// ==============================================================================
// Common Type Definitions
// ==============================================================================
// Basic types shared by the VM parser, the code generator and the
// verification machine.
// ==============================================================================

#ifndef VMTRANSLATOR_COMMON_TYPES_HPP
#define VMTRANSLATOR_COMMON_TYPES_HPP

#include <cstddef>      // For size_t
#include <cstdint>      // For fixed-width integer types
#include <string>       // For std::string

namespace vmt {  // vmt = VM translator namespace

// ==============================================================================
// Target Machine Types
// ==============================================================================

/**
 * @brief A 16-bit word of the target machine
 *
 * Every register, RAM cell and instruction of the target is 16 bits wide.
 */
using Word = uint16_t;

/**
 * @brief A 15-bit memory address
 *
 * The target has 32K words of RAM and 32K words of ROM.
 * Valid range: 0 to 32,767
 */
using Address = uint16_t;

// ==============================================================================
// VM Types
// ==============================================================================

/**
 * @brief VM memory segment types
 *
 * - LOCAL, ARGUMENT, THIS, THAT: based segments, addressed through a
 *   base register (LCL, ARG, THIS, THAT)
 * - CONSTANT: the index itself, read-only
 * - STATIC: one cell per (file, index), allocated by the assembler
 * - TEMP: fixed block of 8 cells (temp 0-7)
 * - POINTER: the THIS/THAT base registers themselves (pointer 0/1)
 */
enum class SegmentType {
    LOCAL,
    ARGUMENT,
    THIS,
    THAT,
    CONSTANT,
    STATIC,
    TEMP,
    POINTER
};

/**
 * @brief Arithmetic/logical operations in the VM
 *
 * - Binary (ADD, SUB, AND, OR): pop two values, push result
 * - Unary (NEG, NOT): rewrite the top of the stack in place
 * - Comparison (EQ, GT, LT): pop two values, push -1 (true) or 0 (false)
 */
enum class ArithmeticOp {
    ADD,   // x + y
    SUB,   // x - y (x is the deeper operand)
    NEG,   // -y
    EQ,    // x == y
    GT,    // x > y
    LT,    // x < y
    AND,   // x & y
    OR,    // x | y
    NOT    // ~y
};

/**
 * @brief Direction of a memory access command
 */
enum class MemoryDirection {
    PUSH,
    POP
};

/**
 * @brief Program flow command kinds
 */
enum class BranchKind {
    LABEL,
    GOTO,
    IF_GOTO
};

// ==============================================================================
// Utility Type Aliases
// ==============================================================================

/**
 * @brief Source code line number (1-based, 0 when unknown)
 */
using LineNumber = size_t;

/**
 * @brief File path
 */
using FilePath = std::string;

// ==============================================================================
// Helper Functions
// ==============================================================================

/**
 * @brief Convert SegmentType to its VM keyword (e.g. "local")
 */
const char* segment_to_string(SegmentType segment);

/**
 * @brief Convert ArithmeticOp to its VM keyword (e.g. "add")
 */
const char* arithmetic_op_to_string(ArithmeticOp op);

/**
 * @brief Convert MemoryDirection to its VM keyword ("push" / "pop")
 */
const char* direction_to_string(MemoryDirection direction);

/**
 * @brief Convert BranchKind to its VM keyword ("label", "goto", "if-goto")
 */
const char* branch_kind_to_string(BranchKind kind);

/**
 * @brief True for the comparison operators (eq, gt, lt)
 */
inline bool is_comparison(ArithmeticOp op) {
    return op == ArithmeticOp::EQ || op == ArithmeticOp::GT || op == ArithmeticOp::LT;
}

/**
 * @brief True for the unary operators (neg, not)
 */
inline bool is_unary(ArithmeticOp op) {
    return op == ArithmeticOp::NEG || op == ArithmeticOp::NOT;
}

}  // namespace vmt

#endif  // VMTRANSLATOR_COMMON_TYPES_HPP
