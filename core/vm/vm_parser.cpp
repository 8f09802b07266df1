// ==============================================================================
// VM Parser Implementation
// ==============================================================================

#include "vm_parser.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <unordered_map>

namespace vmt {

namespace {

const std::unordered_map<std::string, ArithmeticOp>& arithmetic_mnemonics() {
    static const std::unordered_map<std::string, ArithmeticOp> table = {
        {"add", ArithmeticOp::ADD}, {"sub", ArithmeticOp::SUB},
        {"neg", ArithmeticOp::NEG}, {"eq",  ArithmeticOp::EQ},
        {"gt",  ArithmeticOp::GT},  {"lt",  ArithmeticOp::LT},
        {"and", ArithmeticOp::AND}, {"or",  ArithmeticOp::OR},
        {"not", ArithmeticOp::NOT},
    };
    return table;
}

const std::unordered_map<std::string, SegmentType>& segment_names() {
    static const std::unordered_map<std::string, SegmentType> table = {
        {"local",    SegmentType::LOCAL},
        {"argument", SegmentType::ARGUMENT},
        {"this",     SegmentType::THIS},
        {"that",     SegmentType::THAT},
        {"constant", SegmentType::CONSTANT},
        {"static",   SegmentType::STATIC},
        {"temp",     SegmentType::TEMP},
        {"pointer",  SegmentType::POINTER},
    };
    return table;
}

struct Typo {
    const char* wrong;
    const char* correct;
};

// Misspellings seen often enough to deserve a hint
constexpr Typo SEGMENT_TYPOS[] = {
    {"loc", "local"}, {"lcl", "local"},
    {"arg", "argument"}, {"args", "argument"},
    {"const", "constant"},
    {"tmp", "temp"},
    {"ptr", "pointer"},
};

constexpr Typo COMMAND_TYPOS[] = {
    {"psh", "push"}, {"pussh", "push"},
    {"po", "pop"}, {"popp", "pop"},
    {"ad", "add"}, {"addd", "add"},
    {"subtract", "sub"}, {"substract", "sub"},
    {"ifgoto", "if-goto"}, {"if_goto", "if-goto"},
    {"func", "function"},
    {"ret", "return"},
};

template<size_t N>
const char* find_correction(const Typo (&typos)[N], const std::string& word) {
    for (const auto& typo : typos) {
        if (word == typo.wrong) return typo.correct;
    }
    return nullptr;
}

// Letters, digits, '_', '.' plus any extra characters; first char not a digit
bool is_name(const std::string& str, const char* extra) {
    auto allowed = [extra](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '.' ||
               (c != '\0' && std::strchr(extra, c) != nullptr);
    };
    return !str.empty() &&
           !std::isdigit(static_cast<unsigned char>(str[0])) &&
           std::all_of(str.begin(), str.end(), allowed);
}

// Function names become assembly labels and must not shadow symbols the
// assembler predefines or the File.i symbols used for statics
bool is_reserved_symbol(const std::string& name) {
    static const char* const predefined[] = {
        "SP", "LCL", "ARG", "THIS", "THAT", "SCREEN", "KBD",
    };
    for (const char* symbol : predefined) {
        if (name == symbol) return true;
    }

    auto all_digits = [](const std::string& s) {
        return !s.empty() && std::all_of(s.begin(), s.end(),
                                         [](unsigned char c) { return std::isdigit(c); });
    };
    if (name.size() > 1 && name.size() <= 3 && name[0] == 'R' &&
        all_digits(name.substr(1)) && (name.size() == 2 || name[1] != '0')) {
        return std::stoul(name.substr(1)) <= 15;
    }

    size_t dot = name.rfind('.');
    return dot != std::string::npos && all_digits(name.substr(dot + 1));
}

}  // namespace

VMParser::VMParser(std::string file_name)
    : file_name_(std::move(file_name))
{}

// ==============================================================================
// Source Parsing
// ==============================================================================

std::vector<VMCommand> VMParser::parse_source(const std::string& source) {
    std::vector<VMCommand> commands;

    std::istringstream stream(source);
    std::string text;
    LineNumber line_number = 0;

    while (std::getline(stream, text)) {
        if (auto command = parse_line(text, ++line_number)) {
            commands.push_back(std::move(*command));
        }
    }

    return commands;
}

std::optional<VMCommand> VMParser::parse_line(const std::string& line,
                                              LineNumber line_number) {
    current_line_ = line_number;

    const std::vector<std::string> tokens = tokenize(line);
    if (tokens.empty()) {
        return std::nullopt;
    }

    const std::string& mnemonic = tokens.front();

    auto arithmetic = arithmetic_mnemonics().find(mnemonic);
    if (arithmetic != arithmetic_mnemonics().end()) {
        return parse_arithmetic(arithmetic->second, tokens);
    }

    if (mnemonic == "push")     return parse_memory_access(MemoryDirection::PUSH, tokens);
    if (mnemonic == "pop")      return parse_memory_access(MemoryDirection::POP, tokens);
    if (mnemonic == "label")    return parse_branch(BranchKind::LABEL, tokens);
    if (mnemonic == "goto")     return parse_branch(BranchKind::GOTO, tokens);
    if (mnemonic == "if-goto")  return parse_branch(BranchKind::IF_GOTO, tokens);
    if (mnemonic == "function") return parse_function(tokens);
    if (mnemonic == "call")     return parse_call(tokens);
    if (mnemonic == "return")   return parse_return(tokens);

    unknown_command(mnemonic);
}

std::vector<std::string> VMParser::tokenize(const std::string& line) const {
    // Whitespace splitting also takes care of tabs and a trailing '\r'
    std::istringstream stream(line.substr(0, line.find("//")));

    std::vector<std::string> tokens;
    for (std::string token; stream >> token; ) {
        tokens.push_back(token);
    }
    return tokens;
}

// ==============================================================================
// Command Parsing
// ==============================================================================

ArithmeticCommand VMParser::parse_arithmetic(ArithmeticOp op,
                                             const std::vector<std::string>& tokens) {
    if (tokens.size() > 1) {
        error(build_error_message("'", arithmetic_op_to_string(op),
                                  "' takes no operands, got '", tokens[1], "'"));
    }
    return ArithmeticCommand{op, current_line_};
}

MemoryAccessCommand VMParser::parse_memory_access(MemoryDirection direction,
                                                  const std::vector<std::string>& tokens) {
    if (tokens.size() != 3) {
        const char* name = direction_to_string(direction);
        error(build_error_message("expected '", name, " <segment> <index>', got ",
                                  tokens.size() - 1, " operand(s)"));
    }

    SegmentType segment = parse_segment(tokens[1]);
    uint16_t index = parse_index(tokens[2]);
    return MemoryAccessCommand{direction, segment, index, current_line_};
}

BranchCommand VMParser::parse_branch(BranchKind kind,
                                     const std::vector<std::string>& tokens) {
    const char* name = branch_kind_to_string(kind);
    if (tokens.size() != 2) {
        error(build_error_message("expected '", name, " <label>', got ",
                                  tokens.size() - 1, " operand(s)"));
    }

    const std::string& symbol = tokens[1];
    if (!is_valid_label(symbol)) {
        error("Invalid label '" + symbol + "': use letters, digits, '_', '.', ':' "
              "and don't start with a digit");
    }
    return BranchCommand{kind, symbol, current_line_};
}

FunctionCommand VMParser::parse_function(const std::vector<std::string>& tokens) {
    auto [name, num_locals] = parse_name_and_count(tokens, "nLocals");
    return FunctionCommand{name, num_locals, current_line_};
}

CallCommand VMParser::parse_call(const std::vector<std::string>& tokens) {
    auto [name, num_args] = parse_name_and_count(tokens, "nArgs");
    return CallCommand{name, num_args, current_line_};
}

ReturnCommand VMParser::parse_return(const std::vector<std::string>& tokens) {
    if (tokens.size() > 1) {
        error("'return' takes no operands, got '" + tokens[1] + "'");
    }
    return ReturnCommand{current_line_};
}

std::pair<std::string, uint16_t> VMParser::parse_name_and_count(
        const std::vector<std::string>& tokens, const char* count_name) {
    const std::string& mnemonic = tokens.front();
    if (tokens.size() != 3) {
        error(build_error_message("expected '", mnemonic, " <name> <", count_name,
                                  ">', got ", tokens.size() - 1, " operand(s)"));
    }

    const std::string& name = tokens[1];
    if (!is_valid_identifier(name)) {
        error("Invalid function name '" + name + "' in " + mnemonic);
    }
    if (is_reserved_symbol(name)) {
        error("Function name '" + name + "' clashes with a reserved assembler symbol "
              "(SP, LCL, ARG, THIS, THAT, R0-R15, SCREEN, KBD or File.<number>)");
    }
    return {name, parse_index(tokens[2])};
}

// ==============================================================================
// Operands
// ==============================================================================

SegmentType VMParser::parse_segment(const std::string& segment_str) {
    auto it = segment_names().find(segment_str);
    if (it != segment_names().end()) {
        return it->second;
    }

    if (const char* correct = find_correction(SEGMENT_TYPOS, segment_str)) {
        error_with_suggestion("Unknown segment", segment_str, correct);
    }
    error("Unknown segment '" + segment_str + "' (expected one of local, argument, "
          "this, that, constant, static, temp, pointer)");
}

uint16_t VMParser::parse_index(const std::string& index_str) {
    bool digits_only = !index_str.empty() &&
        std::all_of(index_str.begin(), index_str.end(),
                    [](unsigned char c) { return std::isdigit(c); });
    if (!digits_only) {
        error("Expected a non-negative decimal number, got '" + index_str + "'");
    }

    // Values must load through a 15-bit A-instruction. Checking the length
    // first keeps stoul away from inputs that would overflow it.
    if (index_str.size() > 5 || std::stoul(index_str) > 32767) {
        error("Number out of range (0-32767): " + index_str);
    }
    return static_cast<uint16_t>(std::stoul(index_str));
}

// ==============================================================================
// Error Reporting
// ==============================================================================

void VMParser::unknown_command(const std::string& keyword) {
    std::string message = "Unknown command: ";
    if (const char* correct = find_correction(COMMAND_TYPOS, keyword)) {
        message += format_suggestion(keyword, correct);
    } else {
        message += "'" + keyword + "'";
    }
    throw UnknownCommandError(file_name_, current_line_, message);
}

void VMParser::error(const std::string& message) {
    throw MalformedCommandError(file_name_, current_line_, message);
}

void VMParser::error_with_suggestion(const std::string& message,
                                     const std::string& wrong,
                                     const std::string& correct) {
    error(message + ": " + format_suggestion(wrong, correct));
}

// ==============================================================================
// Utility Functions
// ==============================================================================

bool is_valid_identifier(const std::string& str) {
    return is_name(str, "");
}

bool is_valid_label(const std::string& str) {
    return is_name(str, ":");
}

std::string get_file_basename(const std::string& file_path) {
    return std::filesystem::path(file_path).stem().string();
}

}  // namespace vmt
