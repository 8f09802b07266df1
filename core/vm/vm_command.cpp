// ==============================================================================
// VM Command Implementation
// ==============================================================================

#include "vm_command.hpp"
#include <type_traits>

namespace vmt {

LineNumber get_source_line(const VMCommand& cmd) {
    return std::visit([](const auto& c) -> LineNumber {
        return c.source_line;
    }, cmd);
}

std::string command_to_string(const VMCommand& cmd) {
    return std::visit([](const auto& c) -> std::string {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, ArithmeticCommand>) {
            return arithmetic_op_to_string(c.operation);
        } else if constexpr (std::is_same_v<T, MemoryAccessCommand>) {
            return std::string(direction_to_string(c.direction)) + " " +
                   segment_to_string(c.segment) + " " + std::to_string(c.index);
        } else if constexpr (std::is_same_v<T, BranchCommand>) {
            return std::string(branch_kind_to_string(c.kind)) + " " + c.symbol;
        } else if constexpr (std::is_same_v<T, FunctionCommand>) {
            return "function " + c.function_name + " " +
                   std::to_string(c.num_locals);
        } else if constexpr (std::is_same_v<T, CallCommand>) {
            return "call " + c.function_name + " " +
                   std::to_string(c.num_args);
        } else if constexpr (std::is_same_v<T, ReturnCommand>) {
            return "return";
        }
    }, cmd);
}

}  // namespace vmt
