// ==============================================================================
// Target Instruction Set Implementation
// ==============================================================================

#include "instruction.hpp"
#include <unordered_map>

namespace vmt {

// ==============================================================================
// Mnemonic Tables
// ==============================================================================

namespace {

const std::unordered_map<std::string, Computation>& computation_table() {
    static const std::unordered_map<std::string, Computation> table = {
        {"0",   Computation::ZERO},
        {"1",   Computation::ONE},
        {"-1",  Computation::NEG_ONE},
        {"D",   Computation::D},
        {"A",   Computation::A},
        {"!D",  Computation::NOT_D},
        {"!A",  Computation::NOT_A},
        {"-D",  Computation::NEG_D},
        {"-A",  Computation::NEG_A},
        {"D+1", Computation::D_PLUS_1},
        {"1+D", Computation::D_PLUS_1},
        {"A+1", Computation::A_PLUS_1},
        {"1+A", Computation::A_PLUS_1},
        {"D-1", Computation::D_MINUS_1},
        {"A-1", Computation::A_MINUS_1},
        {"D+A", Computation::D_PLUS_A},
        {"A+D", Computation::D_PLUS_A},
        {"D-A", Computation::D_MINUS_A},
        {"A-D", Computation::A_MINUS_D},
        {"D&A", Computation::D_AND_A},
        {"A&D", Computation::D_AND_A},
        {"D|A", Computation::D_OR_A},
        {"A|D", Computation::D_OR_A},
        {"M",   Computation::M},
        {"!M",  Computation::NOT_M},
        {"-M",  Computation::NEG_M},
        {"M+1", Computation::M_PLUS_1},
        {"1+M", Computation::M_PLUS_1},
        {"M-1", Computation::M_MINUS_1},
        {"D+M", Computation::D_PLUS_M},
        {"M+D", Computation::D_PLUS_M},
        {"D-M", Computation::D_MINUS_M},
        {"M-D", Computation::M_MINUS_D},
        {"D&M", Computation::D_AND_M},
        {"M&D", Computation::D_AND_M},
        {"D|M", Computation::D_OR_M},
        {"M|D", Computation::D_OR_M},
    };
    return table;
}

}  // namespace

std::optional<Computation> parse_computation(const std::string& mnemonic) {
    const auto& table = computation_table();
    auto it = table.find(mnemonic);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<uint8_t> parse_destination(const std::string& mnemonic) {
    uint8_t bits = 0;
    for (char c : mnemonic) {
        uint8_t bit = 0;
        switch (c) {
            case 'A': bit = DEST_A; break;
            case 'D': bit = DEST_D; break;
            case 'M': bit = DEST_M; break;
            default:  return std::nullopt;
        }
        if (bits & bit) {
            return std::nullopt;  // repeated letter
        }
        bits |= bit;
    }
    return bits;
}

std::optional<JumpCondition> parse_jump(const std::string& mnemonic) {
    if (mnemonic.empty()) return JumpCondition::NO_JUMP;
    if (mnemonic == "JGT") return JumpCondition::JGT;
    if (mnemonic == "JEQ") return JumpCondition::JEQ;
    if (mnemonic == "JGE") return JumpCondition::JGE;
    if (mnemonic == "JLT") return JumpCondition::JLT;
    if (mnemonic == "JNE") return JumpCondition::JNE;
    if (mnemonic == "JLE") return JumpCondition::JLE;
    if (mnemonic == "JMP") return JumpCondition::JMP;
    return std::nullopt;
}

// ==============================================================================
// Encoding / Validation
// ==============================================================================

Word encode_c_instruction(Computation comp, uint8_t dest, JumpCondition jump) {
    return static_cast<Word>(0xE000 |
                             (static_cast<Word>(comp) << 6) |
                             ((dest & 0x7) << 3) |
                             static_cast<Word>(jump));
}

bool is_valid_computation(uint8_t comp_bits) {
    if (comp_bits >= 128) return false;
    for (const auto& entry : computation_table()) {
        if (static_cast<uint8_t>(entry.second) == comp_bits) {
            return true;
        }
    }
    return false;
}

}  // namespace vmt
