// ==============================================================================
// VM Command Representation
// ==============================================================================
// Each line of a .vm file becomes one VMCommand value. Commands are plain
// values: the parser builds them, the code writer reads them, and nothing
// modifies them in between.
// ==============================================================================

#ifndef VMTRANSLATOR_VM_COMMAND_HPP
#define VMTRANSLATOR_VM_COMMAND_HPP

#include "types.hpp"
#include <string>
#include <variant>

namespace vmt {

// ==============================================================================
// Arithmetic Commands
// ==============================================================================

/**
 * @brief An arithmetic/logical VM command (no operands)
 *
 * Example VM code:
 *   push constant 7
 *   push constant 8
 *   add           // pops 8 and 7, pushes 15
 */
struct ArithmeticCommand {
    ArithmeticOp operation;

    LineNumber source_line;
};

// ==============================================================================
// Memory Access Commands
// ==============================================================================

/**
 * @brief push/pop segment index
 *
 * Example: "pop local 2" moves the top of the stack into local variable 2
 *
 * The parser accepts any segment in either direction; whether the pair is
 * expressible (pop constant is not) is decided by the code writer.
 */
struct MemoryAccessCommand {
    MemoryDirection direction;
    SegmentType segment;
    uint16_t index;

    LineNumber source_line;
};

// ==============================================================================
// Program Flow Commands
// ==============================================================================

/**
 * @brief label / goto / if-goto SYMBOL
 *
 * Symbols are scoped to the enclosing function by the code writer.
 * if-goto pops the top of the stack and jumps when it is non-zero.
 */
struct BranchCommand {
    BranchKind kind;
    std::string symbol;

    LineNumber source_line;
};

// ==============================================================================
// Function Commands
// ==============================================================================

/**
 * @brief function functionName nLocals
 *
 * Example: "function Math.multiply 2" declares Math.multiply with two
 * locals, both initialized to 0 on entry.
 */
struct FunctionCommand {
    std::string function_name;
    uint16_t num_locals;

    LineNumber source_line;
};

/**
 * @brief call functionName nArgs
 *
 * The caller has already pushed nArgs arguments. The call saves the
 * return address and LCL, ARG, THIS, THAT, repositions ARG and LCL for
 * the callee and jumps to it.
 */
struct CallCommand {
    std::string function_name;
    uint16_t num_args;

    LineNumber source_line;
};

/**
 * @brief return
 *
 * Places the callee's top-of-stack at ARG[0], sets SP to ARG + 1,
 * restores THAT, THIS, ARG, LCL from the frame and jumps back.
 */
struct ReturnCommand {
    LineNumber source_line;
};

// ==============================================================================
// VMCommand - Unified Command Type
// ==============================================================================

/**
 * @brief A single VM command (any type)
 *
 * Consumers dispatch with std::visit so that adding a command kind is a
 * compile error in every place that has to handle it.
 */
using VMCommand = std::variant<
    ArithmeticCommand,
    MemoryAccessCommand,
    BranchCommand,
    FunctionCommand,
    CallCommand,
    ReturnCommand
>;

// ==============================================================================
// Helper Functions
// ==============================================================================

/**
 * @brief Get the source line number from any command
 */
LineNumber get_source_line(const VMCommand& cmd);

/**
 * @brief Render a command as canonical VM text
 *
 * Example: MemoryAccessCommand{PUSH, LOCAL, 2} -> "push local 2"
 */
std::string command_to_string(const VMCommand& cmd);

}  // namespace vmt

#endif  // VMTRANSLATOR_VM_COMMAND_HPP
