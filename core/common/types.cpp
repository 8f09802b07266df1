// ==============================================================================
// Common Type Implementations
// ==============================================================================

#include "types.hpp"

namespace vmt {

const char* segment_to_string(SegmentType segment) {
    switch (segment) {
        case SegmentType::LOCAL:    return "local";
        case SegmentType::ARGUMENT: return "argument";
        case SegmentType::THIS:     return "this";
        case SegmentType::THAT:     return "that";
        case SegmentType::CONSTANT: return "constant";
        case SegmentType::STATIC:   return "static";
        case SegmentType::TEMP:     return "temp";
        case SegmentType::POINTER:  return "pointer";
        default:                    return "unknown";
    }
}

const char* arithmetic_op_to_string(ArithmeticOp op) {
    switch (op) {
        case ArithmeticOp::ADD: return "add";
        case ArithmeticOp::SUB: return "sub";
        case ArithmeticOp::NEG: return "neg";
        case ArithmeticOp::EQ:  return "eq";
        case ArithmeticOp::GT:  return "gt";
        case ArithmeticOp::LT:  return "lt";
        case ArithmeticOp::AND: return "and";
        case ArithmeticOp::OR:  return "or";
        case ArithmeticOp::NOT: return "not";
        default:                return "unknown";
    }
}

const char* direction_to_string(MemoryDirection direction) {
    return direction == MemoryDirection::PUSH ? "push" : "pop";
}

const char* branch_kind_to_string(BranchKind kind) {
    switch (kind) {
        case BranchKind::LABEL:   return "label";
        case BranchKind::GOTO:    return "goto";
        case BranchKind::IF_GOTO: return "if-goto";
        default:                  return "unknown";
    }
}

}  // namespace vmt
