// ==============================================================================
// Reference Machine
// ==============================================================================
// Executes assembled programs for the 16-bit target so tests can check
// what translated VM code actually does: the A, D and PC registers, 32K
// words of ROM and 32K words of RAM.
//
// A program halts when:
// - the PC runs past the loaded program, or
// - it enters the canonical halt loop "(L) @L 0;JMP", i.e. an
//   unconditional jump back to its own A-instruction.
// ==============================================================================

#ifndef VMTRANSLATOR_HACK_MACHINE_HPP
#define VMTRANSLATOR_HACK_MACHINE_HPP

#include "instruction.hpp"
#include "error.hpp"
#include <array>
#include <string>
#include <vector>

namespace vmt {

// ==============================================================================
// Machine State
// ==============================================================================

enum class MachineState {
    READY,      // Program loaded, nothing executed yet
    PAUSED,     // Cycle budget used up
    HALTED,     // Reached the halt loop or ran off the program
    ERROR       // Invalid instruction executed
};

constexpr size_t RAM_SIZE = 32768;
constexpr size_t ROM_SIZE = 32768;

// ==============================================================================
// Machine Class
// ==============================================================================

/**
 * @brief Cycle-level emulator of the target machine
 *
 * Usage:
 *   HackMachine machine;
 *   machine.load(program.instructions);
 *   machine.write_ram(0, 256);          // SP
 *   MachineState state = machine.run(100000);
 *   Word top = machine.read_ram(machine.read_ram(0) - 1);
 */
class HackMachine {
public:
    HackMachine();

    // =========================================================================
    // Program Loading
    // =========================================================================

    /**
     * @brief Load instruction words into ROM and reset registers
     *
     * RAM is left untouched so callers can preset it before or after.
     *
     * @throws RuntimeError if the program doesn't fit in ROM
     */
    void load(const std::vector<Word>& instructions);

    /**
     * @brief Zero registers and RAM, keep ROM
     */
    void reset();

    // =========================================================================
    // Execution Control
    // =========================================================================

    /**
     * @brief Run until halt, error, or max_cycles instructions
     */
    MachineState run(uint64_t max_cycles);

    /**
     * @brief Execute a single instruction
     */
    MachineState step();

    MachineState state() const { return state_; }
    uint64_t cycles() const { return cycles_; }
    const std::string& error_message() const { return error_message_; }

    // =========================================================================
    // Inspection
    // =========================================================================

    Word get_a() const { return a_register_; }
    Word get_d() const { return d_register_; }
    Address get_pc() const { return pc_; }

    /**
     * @throws RuntimeError if address is out of bounds
     */
    Word read_ram(Address address) const;

    /**
     * @throws RuntimeError if address is out of bounds
     */
    void write_ram(Address address, Word value);

    size_t program_size() const { return program_size_; }

private:
    Word a_register_ = 0;
    Word d_register_ = 0;
    Address pc_ = 0;

    std::vector<Word> rom_;
    std::vector<Word> ram_;
    size_t program_size_ = 0;

    MachineState state_ = MachineState::READY;
    uint64_t cycles_ = 0;
    std::string error_message_;

    /**
     * @brief Execute the instruction at PC. Returns false to stop.
     */
    bool execute_instruction();

    Word compute_alu(Computation comp, Word d_val, Word am_val) const;
    bool should_jump(JumpCondition jump, Word alu_output) const;

    /**
     * @brief True if ROM[address] is "@address"
     */
    bool is_halt_target(Address address) const;
};

}  // namespace vmt

#endif  // VMTRANSLATOR_HACK_MACHINE_HPP
