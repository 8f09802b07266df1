// ==============================================================================
// Reference Machine Implementation
// ==============================================================================

#include "machine.hpp"
#include <algorithm>

namespace vmt {

HackMachine::HackMachine()
    : rom_(ROM_SIZE, 0)
    , ram_(RAM_SIZE, 0)
{}

// ==============================================================================
// Program Loading
// ==============================================================================

void HackMachine::load(const std::vector<Word>& instructions) {
    if (instructions.size() > ROM_SIZE) {
        throw RuntimeError(build_error_message(
            "Program too large: ", instructions.size(), " instructions, ROM holds ", ROM_SIZE));
    }

    std::fill(rom_.begin(), rom_.end(), 0);
    std::copy(instructions.begin(), instructions.end(), rom_.begin());
    program_size_ = instructions.size();

    a_register_ = 0;
    d_register_ = 0;
    pc_ = 0;
    cycles_ = 0;
    state_ = MachineState::READY;
    error_message_.clear();
}

void HackMachine::reset() {
    std::fill(ram_.begin(), ram_.end(), 0);
    a_register_ = 0;
    d_register_ = 0;
    pc_ = 0;
    cycles_ = 0;
    state_ = MachineState::READY;
    error_message_.clear();
}

// ==============================================================================
// Execution Control
// ==============================================================================

MachineState HackMachine::run(uint64_t max_cycles) {
    if (state_ == MachineState::HALTED || state_ == MachineState::ERROR) {
        return state_;
    }

    uint64_t count = 0;
    while (count < max_cycles) {
        if (!execute_instruction()) {
            return state_;
        }
        count++;
    }

    state_ = MachineState::PAUSED;
    return state_;
}

MachineState HackMachine::step() {
    if (state_ == MachineState::HALTED || state_ == MachineState::ERROR) {
        return state_;
    }

    if (execute_instruction()) {
        state_ = MachineState::PAUSED;
    }
    return state_;
}

// ==============================================================================
// Memory Access
// ==============================================================================

Word HackMachine::read_ram(Address address) const {
    if (address >= RAM_SIZE) {
        throw RuntimeError("RAM read out of bounds: " + std::to_string(address));
    }
    return ram_[address];
}

void HackMachine::write_ram(Address address, Word value) {
    if (address >= RAM_SIZE) {
        throw RuntimeError("RAM write out of bounds: " + std::to_string(address));
    }
    ram_[address] = value;
}

// ==============================================================================
// Execution Core
// ==============================================================================

bool HackMachine::execute_instruction() {
    if (pc_ >= program_size_) {
        state_ = MachineState::HALTED;
        return false;
    }

    try {
        Word raw = rom_[pc_];

        if (!(raw & 0x8000)) {
            // ---- A-instruction ----
            a_register_ = raw & 0x7FFF;
            pc_++;

        } else {
            // ---- C-instruction: 111accccccdddjjj ----
            uint8_t comp_bits = static_cast<uint8_t>((raw >> 6) & 0x7F);
            uint8_t dest_bits = static_cast<uint8_t>((raw >> 3) & 0x7);
            uint8_t jump_bits = static_cast<uint8_t>(raw & 0x7);

            if (!is_valid_computation(comp_bits)) {
                throw RuntimeError(build_error_message(
                    "Invalid ALU computation code at ROM[", pc_, "]"));
            }

            Word am_val = (comp_bits & 0x40) ? read_ram(a_register_) : a_register_;
            Word alu_output = compute_alu(static_cast<Computation>(comp_bits),
                                          d_register_, am_val);

            // M is written at the A value from before this instruction
            Address original_a = a_register_;

            if (dest_bits & DEST_A) a_register_ = alu_output;
            if (dest_bits & DEST_D) d_register_ = alu_output;
            if (dest_bits & DEST_M) write_ram(original_a, alu_output);

            if (should_jump(static_cast<JumpCondition>(jump_bits), alu_output)) {
                Address from = pc_;
                pc_ = a_register_;
                if (static_cast<JumpCondition>(jump_bits) == JumpCondition::JMP &&
                    pc_ + 1 == from && is_halt_target(pc_)) {
                    cycles_++;
                    state_ = MachineState::HALTED;
                    return false;
                }
            } else {
                pc_++;
            }
        }

        cycles_++;

    } catch (const VMTError& e) {
        error_message_ = e.what();
        state_ = MachineState::ERROR;
        return false;
    }

    return true;
}

bool HackMachine::is_halt_target(Address address) const {
    if (address >= program_size_) {
        return false;
    }
    Word raw = rom_[address];
    return !(raw & 0x8000) && (raw & 0x7FFF) == address;
}

// ==============================================================================
// ALU
// ==============================================================================

Word HackMachine::compute_alu(Computation comp, Word d_val, Word am_val) const {
    int16_t d = static_cast<int16_t>(d_val);
    int16_t am = static_cast<int16_t>(am_val);
    int16_t result;

    switch (comp) {
        case Computation::ZERO:      result = 0; break;
        case Computation::ONE:       result = 1; break;
        case Computation::NEG_ONE:   result = -1; break;
        case Computation::D:         result = d; break;
        case Computation::A:
        case Computation::M:         result = am; break;
        case Computation::NOT_D:     result = static_cast<int16_t>(~d); break;
        case Computation::NOT_A:
        case Computation::NOT_M:     result = static_cast<int16_t>(~am); break;
        case Computation::NEG_D:     result = static_cast<int16_t>(-d); break;
        case Computation::NEG_A:
        case Computation::NEG_M:     result = static_cast<int16_t>(-am); break;
        case Computation::D_PLUS_1:  result = static_cast<int16_t>(d + 1); break;
        case Computation::A_PLUS_1:
        case Computation::M_PLUS_1:  result = static_cast<int16_t>(am + 1); break;
        case Computation::D_MINUS_1: result = static_cast<int16_t>(d - 1); break;
        case Computation::A_MINUS_1:
        case Computation::M_MINUS_1: result = static_cast<int16_t>(am - 1); break;
        case Computation::D_PLUS_A:
        case Computation::D_PLUS_M:  result = static_cast<int16_t>(d + am); break;
        case Computation::D_MINUS_A:
        case Computation::D_MINUS_M: result = static_cast<int16_t>(d - am); break;
        case Computation::A_MINUS_D:
        case Computation::M_MINUS_D: result = static_cast<int16_t>(am - d); break;
        case Computation::D_AND_A:
        case Computation::D_AND_M:   result = static_cast<int16_t>(d & am); break;
        case Computation::D_OR_A:
        case Computation::D_OR_M:    result = static_cast<int16_t>(d | am); break;
        default:
            throw RuntimeError(build_error_message(
                "Invalid ALU computation code at ROM[", pc_, "]"));
    }

    return static_cast<Word>(result);
}

bool HackMachine::should_jump(JumpCondition jump, Word alu_output) const {
    if (jump == JumpCondition::NO_JUMP) return false;
    if (jump == JumpCondition::JMP) return true;

    int16_t val = static_cast<int16_t>(alu_output);
    uint8_t j = static_cast<uint8_t>(jump);

    // j1 (bit 2) = lt, j2 (bit 1) = eq, j3 (bit 0) = gt
    return (val < 0  && (j & 0x4)) ||
           (val == 0 && (j & 0x2)) ||
           (val > 0  && (j & 0x1));
}

}  // namespace vmt
