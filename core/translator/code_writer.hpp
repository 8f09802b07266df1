// ==============================================================================
// Code Writer
// ==============================================================================
// Emits target assembly for a stream of VM commands.
//
// Translation state owned by one CodeWriter:
// - current file:     qualifies static symbols (File.i)
// - current function: qualifies labels (Function$label)
// - label counter:    makes comparison and return-address labels unique
//
// Register conventions on the target:
//   RAM[0]  SP     stack pointer (next free slot)
//   RAM[1]  LCL    local segment base
//   RAM[2]  ARG    argument segment base
//   RAM[3]  THIS   this segment base (pointer 0)
//   RAM[4]  THAT   that segment base (pointer 1)
//   RAM[5-12]      temp segment
//   RAM[13-14]     scratch registers used by pop and return
//   RAM[16-255]    static variables, allocated by the assembler
//   RAM[256...]    stack
// ==============================================================================

#ifndef VMTRANSLATOR_TRANSLATOR_CODE_WRITER_HPP
#define VMTRANSLATOR_TRANSLATOR_CODE_WRITER_HPP

#include "vm_command.hpp"
#include "error.hpp"
#include <ostream>
#include <string>

namespace vmt {

// ==============================================================================
// Target Addresses
// ==============================================================================

namespace TargetAddress {
    constexpr Address SP   = 0;
    constexpr Address LCL  = 1;
    constexpr Address ARG  = 2;
    constexpr Address THIS = 3;
    constexpr Address THAT = 4;

    constexpr Address TEMP_BASE = 5;
    constexpr Address TEMP_SIZE = 8;

    constexpr Address R13 = 13;
    constexpr Address R14 = 14;

    constexpr Address STATIC_BASE = 16;
    constexpr Address STACK_BASE = 256;
}

/**
 * @brief Number of words a call pushes: return address, LCL, ARG, THIS, THAT
 */
constexpr uint16_t CALL_FRAME_SIZE = 5;

// ==============================================================================
// Code Writer Class
// ==============================================================================

/**
 * @brief Translates VM commands into target assembly text
 *
 * Usage:
 *   std::ostringstream out;
 *   CodeWriter writer(out);
 *   writer.set_file_name("Main");
 *   for (const auto& cmd : commands) {
 *       writer.write_command(cmd);
 *   }
 *   writer.write_end_loop();
 *
 * One instance covers one whole program translation. Instances share
 * nothing, so independent translations never interfere.
 */
class CodeWriter {
public:
    /**
     * @param out Destination for the generated assembly (must outlive the writer)
     * @param annotate Precede each command's code with a "// command" line
     */
    explicit CodeWriter(std::ostream& out, bool annotate = true);

    // =========================================================================
    // Translation State
    // =========================================================================

    /**
     * @brief Announce the start of a new source file
     *
     * Affects static symbols from now on. The current function is kept.
     *
     * @param file_name File stem, e.g. "Main" for Main.vm
     */
    void set_file_name(const std::string& file_name);

    const std::string& current_file() const { return current_file_; }
    const std::string& current_function() const { return current_function_; }
    uint32_t label_counter() const { return label_counter_; }

    // =========================================================================
    // Command Translation
    // =========================================================================

    /**
     * @brief Translate any command (dispatches on its kind)
     *
     * @throws InvalidSegmentOperationError for inexpressible segment accesses
     */
    void write_command(const VMCommand& command);

    void write_arithmetic(const ArithmeticCommand& command);

    /**
     * @brief Translate push/pop
     *
     * @throws InvalidSegmentOperationError for pop constant, temp index
     *         above 7 or pointer index above 1
     */
    void write_push_pop(const MemoryAccessCommand& command);

    void write_label(const BranchCommand& command);
    void write_goto(const BranchCommand& command);
    void write_if(const BranchCommand& command);

    /**
     * @brief Function entry: label plus nLocals zero-initialized locals
     */
    void write_function(const FunctionCommand& command);

    /**
     * @brief Push the 5-word frame, reposition ARG and LCL, jump, land
     */
    void write_call(const CallCommand& command);

    /**
     * @brief Hand back the return value and restore the caller's frame
     */
    void write_return(const ReturnCommand& command);

    // =========================================================================
    // Program Framing
    // =========================================================================

    /**
     * @brief Set SP to the stack origin and call the entry function
     *
     * Emitted once, before any file's code, when linking a full program.
     */
    void write_bootstrap(const std::string& entry_function = "Sys.init",
                         Address stack_origin = TargetAddress::STACK_BASE);

    /**
     * @brief Park execution in an unconditional self-loop
     */
    void write_end_loop();

    // =========================================================================
    // Label Naming
    // =========================================================================

    /**
     * @brief The assembly label a VM label/goto/if-goto symbol refers to
     *
     * Function$symbol inside a function, File$symbol before the first
     * function declaration.
     */
    std::string scoped_label(const std::string& symbol) const;

private:
    std::ostream& out_;
    bool annotate_;

    std::string current_file_;
    std::string current_function_;
    uint32_t label_counter_ = 0;

    // Location of the command being translated, for error messages
    LineNumber current_line_ = 0;

    // =========================================================================
    // Emission Helpers
    // =========================================================================

    void emit(const std::string& instruction);
    void emit_label(const std::string& label);
    void emit_comment(const std::string& text);

    /**
     * @brief *SP = D; SP++
     */
    void emit_push_d();

    /**
     * @brief SP--; D = *SP
     */
    void emit_pop_to_d();

    /**
     * @brief D = RAM[register]; then push D
     */
    void emit_push_register(const std::string& register_name);

    /**
     * @brief R13 -= 1; D = RAM[R13]; RAM[register] = D
     */
    void emit_restore_from_frame(const std::string& register_name);

    /**
     * @brief Assembler symbol of a directly addressed cell
     *
     * Used for pointer, temp and static, whose address is known at
     * assembly time.
     */
    std::string direct_symbol(SegmentType segment, uint16_t index) const;

    /**
     * @brief Base register name for local/argument/this/that
     */
    static const char* base_register(SegmentType segment);

    void check_segment_access(const MemoryAccessCommand& command) const;

    /**
     * @brief Take the next value of the label counter
     */
    uint32_t next_label_id() { return label_counter_++; }

    [[noreturn]] void invalid_segment(const std::string& message) const;
};

}  // namespace vmt

#endif  // VMTRANSLATOR_TRANSLATOR_CODE_WRITER_HPP
