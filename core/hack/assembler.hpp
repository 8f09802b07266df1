// ==============================================================================
// Verification Assembler
// ==============================================================================
// Two-pass symbolic assembler for the target machine. It exists so the
// translator's output can be executed on HackMachine in tests; it is not
// part of the translation path.
//
// Pass 1 records the ROM address of every (LABEL).
// Pass 2 encodes instructions; unknown @symbols become variables,
// allocated from RAM[16] upward in order of first use.
// ==============================================================================

#ifndef VMTRANSLATOR_HACK_ASSEMBLER_HPP
#define VMTRANSLATOR_HACK_ASSEMBLER_HPP

#include "instruction.hpp"
#include "error.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace vmt {

/**
 * @brief Output of one assembly run
 */
struct AssembledProgram {
    std::vector<Word> instructions;

    // Label and variable addresses, for inspecting where things landed
    std::unordered_map<std::string, Address> symbols;
};

/**
 * @brief Assembles symbolic assembly text into machine words
 *
 * Usage:
 *   HackAssembler assembler;
 *   AssembledProgram program = assembler.assemble(asm_text);
 *   machine.load(program.instructions);
 */
class HackAssembler {
public:
    HackAssembler() = default;

    /**
     * @brief Assemble a whole program
     *
     * @throws AssemblyError for duplicate labels, unknown mnemonics,
     *         malformed lines or constants above 32767
     */
    AssembledProgram assemble(const std::string& source);

private:
    /**
     * @brief One instruction line after comment stripping
     */
    struct SourceLine {
        std::string text;
        LineNumber line;
    };

    std::unordered_map<std::string, Address> symbols_;
    Address next_variable_ = 16;

    void reset();
    void add_predefined_symbols();

    std::vector<SourceLine> collect_lines(const std::string& source) const;
    void record_labels(const std::vector<SourceLine>& lines);

    Word encode_a_instruction(const std::string& operand, LineNumber line);
    Word encode_c_instruction_text(const std::string& text, LineNumber line) const;
};

/**
 * @brief Check if a string is a valid assembler symbol
 *
 * Letters, digits, '_', '.', '$', ':' and not starting with a digit.
 */
bool is_valid_asm_symbol(const std::string& symbol);

}  // namespace vmt

#endif  // VMTRANSLATOR_HACK_ASSEMBLER_HPP
