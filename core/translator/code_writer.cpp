// ==============================================================================
// Code Writer Implementation
// ==============================================================================

#include "code_writer.hpp"
#include <type_traits>

namespace vmt {

namespace {

// Scope used for the return address of the bootstrap call, which is
// emitted before any file or function is known
const char* const BOOTSTRAP_SCOPE = "BOOTSTRAP";

}  // namespace

CodeWriter::CodeWriter(std::ostream& out, bool annotate)
    : out_(out)
    , annotate_(annotate)
{}

void CodeWriter::set_file_name(const std::string& file_name) {
    current_file_ = file_name;
}

// ==============================================================================
// Dispatch
// ==============================================================================

void CodeWriter::write_command(const VMCommand& command) {
    if (annotate_) {
        emit_comment(command_to_string(command));
    }

    std::visit([this](const auto& c) {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, ArithmeticCommand>) {
            write_arithmetic(c);
        } else if constexpr (std::is_same_v<T, MemoryAccessCommand>) {
            write_push_pop(c);
        } else if constexpr (std::is_same_v<T, BranchCommand>) {
            switch (c.kind) {
                case BranchKind::LABEL:   write_label(c); break;
                case BranchKind::GOTO:    write_goto(c); break;
                case BranchKind::IF_GOTO: write_if(c); break;
            }
        } else if constexpr (std::is_same_v<T, FunctionCommand>) {
            write_function(c);
        } else if constexpr (std::is_same_v<T, CallCommand>) {
            write_call(c);
        } else if constexpr (std::is_same_v<T, ReturnCommand>) {
            write_return(c);
        }
    }, command);
}

// ==============================================================================
// Arithmetic / Logical
// ==============================================================================

void CodeWriter::write_arithmetic(const ArithmeticCommand& command) {
    current_line_ = command.source_line;
    const ArithmeticOp op = command.operation;

    // Unary: rewrite the top of the stack in place
    if (is_unary(op)) {
        emit("@SP");
        emit("A=M-1");
        emit(op == ArithmeticOp::NEG ? "M=-M" : "M=!M");
        return;
    }

    // y = *--SP, then address x = *--SP
    emit("@SP");
    emit("AM=M-1");
    emit("D=M");
    emit("@SP");
    emit("AM=M-1");

    if (!is_comparison(op)) {
        switch (op) {
            case ArithmeticOp::ADD: emit("M=M+D"); break;
            case ArithmeticOp::SUB: emit("M=M-D"); break;
            case ArithmeticOp::AND: emit("M=D&M"); break;
            case ArithmeticOp::OR:  emit("M=D|M"); break;
            default:
                throw InternalError(build_error_message(
                    "no binary form for '", arithmetic_op_to_string(op), "'"));
        }
        emit("@SP");
        emit("M=M+1");
        return;
    }

    // Comparison: branch on the sign of x - y
    const uint32_t id = next_label_id();
    const std::string true_label = "COMPARE_TRUE$" + std::to_string(id);
    const std::string end_label = "COMPARE_END$" + std::to_string(id);

    const char* jump = "D;JEQ";
    if (op == ArithmeticOp::GT) jump = "D;JGT";
    if (op == ArithmeticOp::LT) jump = "D;JLT";

    emit("D=M-D");
    emit("@" + true_label);
    emit(jump);
    emit("@SP");
    emit("A=M");
    emit("M=0");
    emit("@" + end_label);
    emit("0;JMP");
    emit_label(true_label);
    emit("@SP");
    emit("A=M");
    emit("M=-1");
    emit_label(end_label);
    emit("@SP");
    emit("M=M+1");
}

// ==============================================================================
// Memory Access
// ==============================================================================

void CodeWriter::write_push_pop(const MemoryAccessCommand& command) {
    current_line_ = command.source_line;
    check_segment_access(command);

    const SegmentType segment = command.segment;
    const uint16_t index = command.index;

    if (command.direction == MemoryDirection::PUSH) {
        switch (segment) {
            case SegmentType::CONSTANT:
                emit("@" + std::to_string(index));
                emit("D=A");
                break;

            case SegmentType::LOCAL:
            case SegmentType::ARGUMENT:
            case SegmentType::THIS:
            case SegmentType::THAT:
                emit("@" + std::to_string(index));
                emit("D=A");
                emit(std::string("@") + base_register(segment));
                emit("A=D+M");
                emit("D=M");
                break;

            case SegmentType::POINTER:
            case SegmentType::TEMP:
            case SegmentType::STATIC:
                emit("@" + direct_symbol(segment, index));
                emit("D=M");
                break;
        }
        emit_push_d();
        return;
    }

    // pop
    switch (segment) {
        case SegmentType::LOCAL:
        case SegmentType::ARGUMENT:
        case SegmentType::THIS:
        case SegmentType::THAT:
            // R13 = base + index, then *R13 = *--SP
            emit("@" + std::to_string(index));
            emit("D=A");
            emit(std::string("@") + base_register(segment));
            emit("D=D+M");
            emit("@R13");
            emit("M=D");
            emit_pop_to_d();
            emit("@R13");
            emit("A=M");
            emit("M=D");
            break;

        case SegmentType::POINTER:
        case SegmentType::TEMP:
        case SegmentType::STATIC:
            emit_pop_to_d();
            emit("@" + direct_symbol(segment, index));
            emit("M=D");
            break;

        case SegmentType::CONSTANT:
            // Rejected by check_segment_access
            break;
    }
}

void CodeWriter::check_segment_access(const MemoryAccessCommand& command) const {
    if (command.direction == MemoryDirection::POP &&
        command.segment == SegmentType::CONSTANT) {
        invalid_segment("Cannot pop to constant segment (constants are read-only)");
    }
    if (command.segment == SegmentType::TEMP && command.index >= TargetAddress::TEMP_SIZE) {
        invalid_segment(build_error_message(
            "temp segment only has indices 0-7, got ", command.index));
    }
    if (command.segment == SegmentType::POINTER && command.index > 1) {
        invalid_segment(build_error_message(
            "pointer segment only has indices 0-1, got ", command.index));
    }
}

std::string CodeWriter::direct_symbol(SegmentType segment, uint16_t index) const {
    switch (segment) {
        case SegmentType::POINTER:
            return index == 0 ? "THIS" : "THAT";
        case SegmentType::TEMP:
            return std::to_string(TargetAddress::TEMP_BASE + index);
        case SegmentType::STATIC:
            return current_file_ + "." + std::to_string(index);
        default:
            throw InternalError(build_error_message(
                "segment '", segment_to_string(segment), "' is not directly addressed"));
    }
}

const char* CodeWriter::base_register(SegmentType segment) {
    switch (segment) {
        case SegmentType::LOCAL:    return "LCL";
        case SegmentType::ARGUMENT: return "ARG";
        case SegmentType::THIS:     return "THIS";
        case SegmentType::THAT:     return "THAT";
        default:
            throw InternalError(build_error_message(
                "segment '", segment_to_string(segment), "' has no base register"));
    }
}

// ==============================================================================
// Program Flow
// ==============================================================================

std::string CodeWriter::scoped_label(const std::string& symbol) const {
    if (!current_function_.empty()) {
        return current_function_ + "$" + symbol;
    }
    return current_file_ + "$" + symbol;
}

void CodeWriter::write_label(const BranchCommand& command) {
    current_line_ = command.source_line;
    emit_label(scoped_label(command.symbol));
}

void CodeWriter::write_goto(const BranchCommand& command) {
    current_line_ = command.source_line;
    emit("@" + scoped_label(command.symbol));
    emit("0;JMP");
}

void CodeWriter::write_if(const BranchCommand& command) {
    current_line_ = command.source_line;
    emit_pop_to_d();
    emit("@" + scoped_label(command.symbol));
    emit("D;JNE");
}

// ==============================================================================
// Function Calls
// ==============================================================================

void CodeWriter::write_function(const FunctionCommand& command) {
    current_line_ = command.source_line;
    current_function_ = command.function_name;

    emit_label(command.function_name);
    for (uint16_t i = 0; i < command.num_locals; i++) {
        emit("D=0");
        emit_push_d();
    }
}

void CodeWriter::write_call(const CallCommand& command) {
    current_line_ = command.source_line;

    std::string scope = current_function_;
    if (scope.empty()) scope = current_file_;
    if (scope.empty()) scope = BOOTSTRAP_SCOPE;
    const std::string return_label = scope + "$ret$" + std::to_string(next_label_id());

    // Saved frame: return address, LCL, ARG, THIS, THAT
    emit("@" + return_label);
    emit("D=A");
    emit_push_d();
    emit_push_register("LCL");
    emit_push_register("ARG");
    emit_push_register("THIS");
    emit_push_register("THAT");

    // ARG = SP - 5 - nArgs, subtracted separately so that each constant
    // fits an A-instruction for any nArgs up to 32767
    emit("@SP");
    emit("D=M");
    emit("@" + std::to_string(CALL_FRAME_SIZE));
    emit("D=D-A");
    emit("@" + std::to_string(command.num_args));
    emit("D=D-A");
    emit("@ARG");
    emit("M=D");

    // LCL = SP
    emit("@SP");
    emit("D=M");
    emit("@LCL");
    emit("M=D");

    emit("@" + command.function_name);
    emit("0;JMP");
    emit_label(return_label);
}

void CodeWriter::write_return(const ReturnCommand& command) {
    current_line_ = command.source_line;

    // R13 = frame = LCL
    emit("@LCL");
    emit("D=M");
    emit("@R13");
    emit("M=D");

    // R14 = *(frame - 5), read before ARG[0] may overwrite it (nArgs == 0)
    emit("@" + std::to_string(CALL_FRAME_SIZE));
    emit("A=D-A");
    emit("D=M");
    emit("@R14");
    emit("M=D");

    // *ARG = pop()
    emit_pop_to_d();
    emit("@ARG");
    emit("A=M");
    emit("M=D");

    // SP = ARG + 1
    emit("@ARG");
    emit("D=M+1");
    emit("@SP");
    emit("M=D");

    emit_restore_from_frame("THAT");
    emit_restore_from_frame("THIS");
    emit_restore_from_frame("ARG");
    emit_restore_from_frame("LCL");

    emit("@R14");
    emit("A=M");
    emit("0;JMP");
}

// ==============================================================================
// Program Framing
// ==============================================================================

void CodeWriter::write_bootstrap(const std::string& entry_function, Address stack_origin) {
    if (annotate_) {
        emit_comment("bootstrap: SP = " + std::to_string(stack_origin) +
                     ", call " + entry_function + " 0");
    }

    emit("@" + std::to_string(stack_origin));
    emit("D=A");
    emit("@SP");
    emit("M=D");

    CallCommand call;
    call.function_name = entry_function;
    call.num_args = 0;
    call.source_line = 0;
    write_call(call);
}

void CodeWriter::write_end_loop() {
    if (annotate_) {
        emit_comment("end of program");
    }

    const std::string label = "PROGRAM_END$" + std::to_string(next_label_id());
    emit_label(label);
    emit("@" + label);
    emit("0;JMP");
}

// ==============================================================================
// Emission Helpers
// ==============================================================================

void CodeWriter::emit(const std::string& instruction) {
    out_ << instruction << '\n';
}

void CodeWriter::emit_label(const std::string& label) {
    out_ << '(' << label << ")\n";
}

void CodeWriter::emit_comment(const std::string& text) {
    out_ << "// " << text << '\n';
}

void CodeWriter::emit_push_d() {
    emit("@SP");
    emit("A=M");
    emit("M=D");
    emit("@SP");
    emit("M=M+1");
}

void CodeWriter::emit_pop_to_d() {
    emit("@SP");
    emit("AM=M-1");
    emit("D=M");
}

void CodeWriter::emit_push_register(const std::string& register_name) {
    emit("@" + register_name);
    emit("D=M");
    emit_push_d();
}

void CodeWriter::emit_restore_from_frame(const std::string& register_name) {
    emit("@R13");
    emit("AM=M-1");
    emit("D=M");
    emit("@" + register_name);
    emit("M=D");
}

void CodeWriter::invalid_segment(const std::string& message) const {
    throw InvalidSegmentOperationError(current_file_, current_line_, message);
}

}  // namespace vmt
