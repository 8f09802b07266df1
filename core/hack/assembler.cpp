// ==============================================================================
// Verification Assembler Implementation
// ==============================================================================

#include "assembler.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace vmt {

// ==============================================================================
// Assembly
// ==============================================================================

AssembledProgram HackAssembler::assemble(const std::string& source) {
    reset();

    std::vector<SourceLine> lines = collect_lines(source);
    record_labels(lines);

    AssembledProgram program;
    for (const auto& line : lines) {
        if (line.text.front() == '(') {
            continue;
        }
        if (line.text.front() == '@') {
            program.instructions.push_back(
                encode_a_instruction(line.text.substr(1), line.line));
        } else {
            program.instructions.push_back(
                encode_c_instruction_text(line.text, line.line));
        }
    }

    if (program.instructions.size() > 32768) {
        throw AssemblyError(0, build_error_message(
            "Program has ", program.instructions.size(),
            " instructions; ROM holds 32768"));
    }

    program.symbols = symbols_;
    return program;
}

void HackAssembler::reset() {
    symbols_.clear();
    next_variable_ = 16;
    add_predefined_symbols();
}

void HackAssembler::add_predefined_symbols() {
    symbols_["SP"] = 0;
    symbols_["LCL"] = 1;
    symbols_["ARG"] = 2;
    symbols_["THIS"] = 3;
    symbols_["THAT"] = 4;
    for (Address i = 0; i < 16; i++) {
        symbols_["R" + std::to_string(i)] = i;
    }
    symbols_["SCREEN"] = 16384;
    symbols_["KBD"] = 24576;
}

// ==============================================================================
// Pass 1
// ==============================================================================

std::vector<HackAssembler::SourceLine>
HackAssembler::collect_lines(const std::string& source) const {
    std::vector<SourceLine> lines;

    std::istringstream stream(source);
    std::string raw;
    LineNumber line_number = 0;

    while (std::getline(stream, raw)) {
        line_number++;

        size_t comment_pos = raw.find("//");
        if (comment_pos != std::string::npos) {
            raw = raw.substr(0, comment_pos);
        }

        // Whitespace is insignificant anywhere in an instruction
        raw.erase(std::remove_if(raw.begin(), raw.end(),
                                 [](unsigned char c) { return std::isspace(c); }),
                  raw.end());

        if (!raw.empty()) {
            lines.push_back({raw, line_number});
        }
    }

    return lines;
}

void HackAssembler::record_labels(const std::vector<SourceLine>& lines) {
    Address rom_address = 0;

    for (const auto& line : lines) {
        if (line.text.front() != '(') {
            rom_address++;
            continue;
        }

        if (line.text.back() != ')' || line.text.size() < 3) {
            throw AssemblyError(line.line, "Malformed label declaration: " + line.text);
        }

        std::string label = line.text.substr(1, line.text.size() - 2);
        if (!is_valid_asm_symbol(label)) {
            throw AssemblyError(line.line, "Invalid label name: '" + label + "'");
        }
        if (symbols_.count(label) > 0) {
            throw AssemblyError(line.line, "Duplicate label: '" + label + "'");
        }
        symbols_[label] = rom_address;
    }
}

// ==============================================================================
// Pass 2
// ==============================================================================

Word HackAssembler::encode_a_instruction(const std::string& operand, LineNumber line) {
    if (operand.empty()) {
        throw AssemblyError(line, "Missing operand after '@'");
    }

    if (std::isdigit(static_cast<unsigned char>(operand[0]))) {
        bool digits_only = std::all_of(operand.begin(), operand.end(),
            [](unsigned char c) { return std::isdigit(c); });
        if (!digits_only || operand.size() > 5 || std::stoul(operand) > 32767) {
            throw AssemblyError(line, "Invalid constant: '" + operand + "' (0-32767)");
        }
        return static_cast<Word>(std::stoul(operand));
    }

    if (!is_valid_asm_symbol(operand)) {
        throw AssemblyError(line, "Invalid symbol: '" + operand + "'");
    }

    auto it = symbols_.find(operand);
    if (it != symbols_.end()) {
        return it->second;
    }

    Address address = next_variable_++;
    symbols_[operand] = address;
    return address;
}

Word HackAssembler::encode_c_instruction_text(const std::string& text, LineNumber line) const {
    // dest=comp;jump, with dest and jump optional
    std::string dest;
    std::string comp = text;
    std::string jump;

    size_t eq_pos = comp.find('=');
    if (eq_pos != std::string::npos) {
        dest = comp.substr(0, eq_pos);
        comp = comp.substr(eq_pos + 1);
    }

    size_t semi_pos = comp.find(';');
    if (semi_pos != std::string::npos) {
        jump = comp.substr(semi_pos + 1);
        comp = comp.substr(0, semi_pos);
    }

    auto comp_code = parse_computation(comp);
    if (!comp_code) {
        throw AssemblyError(line, "Unknown computation: '" + comp + "' in '" + text + "'");
    }
    auto dest_bits = parse_destination(dest);
    if (!dest_bits || (eq_pos != std::string::npos && dest.empty())) {
        throw AssemblyError(line, "Unknown destination: '" + dest + "' in '" + text + "'");
    }
    auto jump_code = parse_jump(jump);
    if (!jump_code || (semi_pos != std::string::npos && jump.empty())) {
        throw AssemblyError(line, "Unknown jump: '" + jump + "' in '" + text + "'");
    }

    return encode_c_instruction(*comp_code, *dest_bits, *jump_code);
}

// ==============================================================================
// Utility Functions
// ==============================================================================

bool is_valid_asm_symbol(const std::string& symbol) {
    if (symbol.empty() || std::isdigit(static_cast<unsigned char>(symbol[0]))) {
        return false;
    }
    return std::all_of(symbol.begin(), symbol.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '.' || c == '$' || c == ':';
    });
}

}  // namespace vmt
