// ==============================================================================
// Target Instruction Set
// ==============================================================================
// Encoding tables for the 16-bit target machine.
//
// Two instruction formats:
//   A-instruction: 0vvvvvvvvvvvvvvv  (sets A register to 15-bit value)
//   C-instruction: 111accccccdddjjj  (compute, store, jump)
//
// The assembler maps mnemonics to bit fields with the parse_* functions;
// the machine maps bit fields back with the enums below.
// ==============================================================================

#ifndef VMTRANSLATOR_HACK_INSTRUCTION_HPP
#define VMTRANSLATOR_HACK_INSTRUCTION_HPP

#include "types.hpp"
#include <optional>
#include <string>

namespace vmt {

// ==============================================================================
// ALU Computation Codes
// ==============================================================================

/**
 * @brief All 28 valid ALU computations.
 *
 * Values encode the 7-bit {a, c1-c6} field (bits [12:6] of a
 * C-instruction). a=0 selects the A register as ALU input, a=1 selects
 * M (RAM[A]).
 */
enum class Computation : uint8_t {
    ZERO        = 0b0101010,  // 0
    ONE         = 0b0111111,  // 1
    NEG_ONE     = 0b0111010,  // -1
    D           = 0b0001100,  // D
    A           = 0b0110000,  // A
    NOT_D       = 0b0001101,  // !D
    NOT_A       = 0b0110001,  // !A
    NEG_D       = 0b0001111,  // -D
    NEG_A       = 0b0110011,  // -A
    D_PLUS_1    = 0b0011111,  // D+1
    A_PLUS_1    = 0b0110111,  // A+1
    D_MINUS_1   = 0b0001110,  // D-1
    A_MINUS_1   = 0b0110010,  // A-1
    D_PLUS_A    = 0b0000010,  // D+A
    D_MINUS_A   = 0b0010011,  // D-A
    A_MINUS_D   = 0b0000111,  // A-D
    D_AND_A     = 0b0000000,  // D&A
    D_OR_A      = 0b0010101,  // D|A

    M           = 0b1110000,  // M
    NOT_M       = 0b1110001,  // !M
    NEG_M       = 0b1110011,  // -M
    M_PLUS_1    = 0b1110111,  // M+1
    M_MINUS_1   = 0b1110010,  // M-1
    D_PLUS_M    = 0b1000010,  // D+M
    D_MINUS_M   = 0b1010011,  // D-M
    M_MINUS_D   = 0b1000111,  // M-D
    D_AND_M     = 0b1000000,  // D&M
    D_OR_M      = 0b1010101,  // D|M
};

/**
 * @brief Jump condition (jjj bits), evaluated on the signed ALU output
 */
enum class JumpCondition : uint8_t {
    NO_JUMP = 0b000,
    JGT     = 0b001,
    JEQ     = 0b010,
    JGE     = 0b011,
    JLT     = 0b100,
    JNE     = 0b101,
    JLE     = 0b110,
    JMP     = 0b111,
};

// Destination bits (ddd)
constexpr uint8_t DEST_A = 0b100;
constexpr uint8_t DEST_D = 0b010;
constexpr uint8_t DEST_M = 0b001;

// ==============================================================================
// Mnemonic Parsing
// ==============================================================================

/**
 * @brief Map a comp mnemonic ("D+1", "M-D", "D&A") to its code
 *
 * Commutative forms the assembler commonly sees ("1+D", "M+D", "A&D")
 * are accepted as well.
 */
std::optional<Computation> parse_computation(const std::string& mnemonic);

/**
 * @brief Map a dest mnemonic ("", "M", "AM", "AMD", ...) to its ddd bits
 *
 * Letters may come in any order; each may appear once.
 */
std::optional<uint8_t> parse_destination(const std::string& mnemonic);

/**
 * @brief Map a jump mnemonic ("", "JGT", ..., "JMP") to its condition
 */
std::optional<JumpCondition> parse_jump(const std::string& mnemonic);

// ==============================================================================
// Encoding / Validation
// ==============================================================================

/**
 * @brief Assemble the fields of a C-instruction into a word
 */
Word encode_c_instruction(Computation comp, uint8_t dest, JumpCondition jump);

/**
 * @brief Check if a 7-bit computation code is valid
 */
bool is_valid_computation(uint8_t comp_bits);

}  // namespace vmt

#endif  // VMTRANSLATOR_HACK_INSTRUCTION_HPP
