// ==============================================================================
// Translator Tests
// ==============================================================================
// End-to-end: VM source -> assembly -> machine words -> execution. Each test
// inspects the machine's RAM after the translated program halts.
// ==============================================================================

#include "translator.hpp"
#include "assembler.hpp"
#include "machine.hpp"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace vmt;
namespace fs = std::filesystem;

static int test_count = 0;
static int pass_count = 0;

static void check(bool condition, const std::string& name) {
    test_count++;
    if (condition) {
        pass_count++;
        std::cout << "PASS: " << name << std::endl;
    } else {
        std::cout << "FAIL: " << name << std::endl;
        assert(false);
    }
}

// Segment bases preset for programs translated without bootstrap
constexpr Word STACK = 256;
constexpr Word LOCAL_BASE = 300;
constexpr Word ARG_BASE = 400;
constexpr Word THIS_BASE = 3000;
constexpr Word THAT_BASE = 3010;

static std::string translate_sources(const std::vector<SourceFile>& sources,
                                     bool whole_program,
                                     TranslatorOptions options = TranslatorOptions()) {
    Translator translator(options);
    std::ostringstream out;
    translator.translate_sources(sources, whole_program, out);
    return out.str();
}

static std::string translate_single(const std::string& vm_source) {
    return translate_sources({{"Test", vm_source}}, false);
}

// Assemble and run; segment registers are preset unless the program bootstraps
static HackMachine execute(const std::string& assembly, bool preset = true) {
    HackAssembler assembler;
    AssembledProgram program = assembler.assemble(assembly);

    HackMachine machine;
    machine.load(program.instructions);
    if (preset) {
        machine.write_ram(TargetAddress::SP, STACK);
        machine.write_ram(TargetAddress::LCL, LOCAL_BASE);
        machine.write_ram(TargetAddress::ARG, ARG_BASE);
        machine.write_ram(TargetAddress::THIS, THIS_BASE);
        machine.write_ram(TargetAddress::THAT, THAT_BASE);
    }
    machine.run(100000);
    return machine;
}

static Word stack_top(const HackMachine& machine) {
    return machine.read_ram(machine.read_ram(TargetAddress::SP) - 1);
}

static Word as_word(int value) {
    return static_cast<Word>(static_cast<int16_t>(value));
}

// ==============================================================================
// Arithmetic
// ==============================================================================

void test_add_scenario() {
    std::cout << "--- Arithmetic ---\n";

    auto m = execute(translate_single("push constant 7\npush constant 8\nadd\n"));
    check(m.state() == MachineState::HALTED, "program parks in the end loop");
    check(m.read_ram(STACK) == 15, "7 + 8 = 15 on top of the stack");
    check(m.read_ram(TargetAddress::SP) == STACK + 1, "SP = initial + 1");
}

void test_arithmetic_ops() {
    struct Case {
        const char* source;
        Word expected;
        const char* name;
    };
    const Case cases[] = {
        {"push constant 7\npush constant 2\nsub\n",   5,            "7 - 2"},
        {"push constant 2\npush constant 7\nsub\n",   as_word(-5),  "2 - 7"},
        {"push constant 5\nneg\n",                    as_word(-5),  "neg 5"},
        {"push constant 12\npush constant 10\nand\n", 8,            "12 and 10"},
        {"push constant 12\npush constant 10\nor\n",  14,           "12 or 10"},
        {"push constant 0\nnot\n",                    as_word(-1),  "not 0"},
        {"push constant 9\npush constant 9\neq\n",    as_word(-1),  "9 eq 9 is true"},
        {"push constant 9\npush constant 8\neq\n",    0,            "9 eq 8 is false"},
        {"push constant 9\npush constant 8\ngt\n",    as_word(-1),  "9 gt 8 is true"},
        {"push constant 8\npush constant 9\ngt\n",    0,            "8 gt 9 is false"},
        {"push constant 8\npush constant 9\nlt\n",    as_word(-1),  "8 lt 9 is true"},
        {"push constant 9\npush constant 9\nlt\n",    0,            "9 lt 9 is false"},
        {"push constant 3\nneg\npush constant 2\nlt\n", as_word(-1), "-3 lt 2 is true"},
    };

    for (const auto& c : cases) {
        auto m = execute(translate_single(c.source));
        check(m.read_ram(STACK) == c.expected && m.read_ram(TargetAddress::SP) == STACK + 1,
              c.name);
    }
}

void test_comparisons_in_sequence() {
    // Several comparisons in one program need distinct labels to assemble
    auto m = execute(translate_single(
        "push constant 1\npush constant 1\neq\n"
        "push constant 1\npush constant 2\neq\n"
        "and\n"));
    check(m.read_ram(STACK) == 0, "true and false is false");
    check(m.read_ram(TargetAddress::SP) == STACK + 1, "two comparisons and an and");
}

// ==============================================================================
// Memory Segments
// ==============================================================================

void test_segment_store_and_load() {
    std::cout << "\n--- Segments ---\n";

    struct Case {
        const char* segment;
        int index;
        Address cell;
    };
    const Case cases[] = {
        {"local",    3, LOCAL_BASE + 3},
        {"argument", 2, ARG_BASE + 2},
        {"this",     4, THIS_BASE + 4},
        {"that",     5, THAT_BASE + 5},
        {"temp",     0, 5},
        {"temp",     7, 12},
        {"static",   3, 16},
    };

    for (const auto& c : cases) {
        std::string access = std::string(c.segment) + " " + std::to_string(c.index);
        auto m = execute(translate_single(
            "push constant 42\npop " + access + "\npush " + access + "\n"));
        check(m.read_ram(c.cell) == 42 && stack_top(m) == 42 &&
              m.read_ram(TargetAddress::SP) == STACK + 1,
              "pop/push " + access);
    }
}

void test_push_pop_is_noop() {
    const char* accesses[] = {
        "local 1", "argument 0", "this 2", "that 3",
        "pointer 0", "pointer 1", "temp 4", "static 0",
    };

    for (const char* access : accesses) {
        std::string source = std::string("push constant 1234\npop ") + access + "\n"
                           + "push " + access + "\npop " + access + "\n";
        auto m = execute(translate_single(source));
        auto sp = m.read_ram(TargetAddress::SP);
        check(sp == STACK, std::string("push/pop ") + access + " leaves SP unchanged");
    }

    auto m = execute(translate_single("push pointer 0\npop pointer 0\n"));
    check(m.read_ram(TargetAddress::THIS) == THIS_BASE, "push/pop pointer 0 keeps THIS");
}

void test_pointer_rebases_this_that() {
    auto m = execute(translate_single(
        "push constant 5000\npop pointer 0\n"
        "push constant 6000\npop pointer 1\n"
        "push constant 17\npop this 2\n"
        "push constant 18\npop that 3\n"));
    check(m.read_ram(TargetAddress::THIS) == 5000, "pointer 0 sets THIS");
    check(m.read_ram(TargetAddress::THAT) == 6000, "pointer 1 sets THAT");
    check(m.read_ram(5002) == 17, "this 2 follows the new THIS");
    check(m.read_ram(6003) == 18, "that 3 follows the new THAT");
}

void test_static_scoping() {
    std::string assembly = translate_sources({
        {"A", "push constant 11\npop static 0\n"},
        {"B", "push constant 22\npop static 0\n"},
    }, false);
    auto m = execute(assembly);

    check(m.read_ram(16) == 11, "A.0 is its own cell");
    check(m.read_ram(17) == 22, "B.0 is a different cell");
    check(assembly.find("@A.0") != std::string::npos &&
          assembly.find("@B.0") != std::string::npos, "statics named after their file");
}

// ==============================================================================
// Program Flow
// ==============================================================================

void test_loop_with_labels() {
    std::cout << "\n--- Program Flow ---\n";

    // Sum 1..5 into local 0, counting down local 1
    auto m = execute(translate_single(
        "push constant 0\npop local 0\n"
        "push constant 5\npop local 1\n"
        "label LOOP\n"
        "push local 1\n"
        "push constant 0\n"
        "eq\n"
        "if-goto DONE\n"
        "push local 0\npush local 1\nadd\npop local 0\n"
        "push local 1\npush constant 1\nsub\npop local 1\n"
        "goto LOOP\n"
        "label DONE\n"
        "push local 0\n"));
    check(m.read_ram(LOCAL_BASE) == 15, "loop sums 1..5");
    check(stack_top(m) == 15, "result pushed after the loop");
    check(m.read_ram(TargetAddress::SP) == STACK + 1, "loop leaves the stack balanced");
}

// ==============================================================================
// Functions
// ==============================================================================

void test_call_return_round_trip() {
    std::cout << "\n--- Functions ---\n";

    std::string assembly = translate_single(
        "push constant 10\n"
        "push constant 20\n"
        "call F 2\n"
        "label HALT\n"
        "goto HALT\n"
        "function F 1\n"
        "push argument 0\n"
        "push argument 1\n"
        "sub\n"
        "pop local 0\n"
        "push constant 99\n"
        "pop pointer 0\n"
        "push local 0\n"
        "return\n");
    auto m = execute(assembly);

    check(m.state() == MachineState::HALTED, "caller reaches its halt loop");
    check(m.read_ram(TargetAddress::SP) == STACK + 2 - 2 + 1, "SP = before call - 2 + 1");
    check(m.read_ram(STACK) == as_word(-10), "return value replaces first argument");
    check(m.read_ram(TargetAddress::LCL) == LOCAL_BASE, "LCL restored");
    check(m.read_ram(TargetAddress::ARG) == ARG_BASE, "ARG restored");
    check(m.read_ram(TargetAddress::THIS) == THIS_BASE, "THIS restored after callee changed it");
    check(m.read_ram(TargetAddress::THAT) == THAT_BASE, "THAT restored");
}

void test_locals_zeroed_and_zero_args() {
    std::string assembly = translate_single(
        "push constant 7\n"
        "pop temp 0\n"
        "call G 0\n"
        "label HALT\n"
        "goto HALT\n"
        "function G 3\n"
        "push local 0\n"
        "push local 1\n"
        "add\n"
        "push local 2\n"
        "add\n"
        "push constant 4\n"
        "add\n"
        "return\n");

    // Dirty the memory where G's locals will live
    HackAssembler assembler;
    HackMachine m;
    m.load(assembler.assemble(assembly).instructions);
    m.write_ram(TargetAddress::SP, STACK);
    m.write_ram(TargetAddress::LCL, LOCAL_BASE);
    m.write_ram(TargetAddress::ARG, ARG_BASE);
    for (Address a = STACK; a < STACK + 10; a++) {
        m.write_ram(a, 777);
    }
    m.run(100000);

    check(m.read_ram(STACK) == 4, "locals start at zero");
    check(m.read_ram(TargetAddress::SP) == STACK + 1, "zero-arg call returns one value");
    check(m.read_ram(TargetAddress::LCL) == LOCAL_BASE, "LCL restored after zero-arg call");
}

void test_recursion() {
    // fact(5) through nested calls
    std::string assembly = translate_single(
        "push constant 5\n"
        "call Math.fact 1\n"
        "label HALT\n"
        "goto HALT\n"
        "function Math.fact 0\n"
        "push argument 0\n"
        "push constant 2\n"
        "lt\n"
        "if-goto BASE\n"
        "push argument 0\n"
        "push argument 0\n"
        "push constant 1\n"
        "sub\n"
        "call Math.fact 1\n"
        "call Math.mul 2\n"
        "return\n"
        "label BASE\n"
        "push constant 1\n"
        "return\n"
        "function Math.mul 1\n"
        "push constant 0\n"
        "pop local 0\n"
        "label LOOP\n"
        "push argument 1\n"
        "push constant 0\n"
        "eq\n"
        "if-goto END\n"
        "push local 0\n"
        "push argument 0\n"
        "add\n"
        "pop local 0\n"
        "push argument 1\n"
        "push constant 1\n"
        "sub\n"
        "pop argument 1\n"
        "goto LOOP\n"
        "label END\n"
        "push local 0\n"
        "return\n");
    auto m = execute(assembly);

    check(m.state() == MachineState::HALTED, "recursive program halts");
    check(m.read_ram(STACK) == 120, "fact(5) = 120");
    check(m.read_ram(TargetAddress::SP) == STACK + 1, "stack balanced after recursion");
}

// ==============================================================================
// Bootstrap
// ==============================================================================

static std::vector<SourceFile> two_file_program() {
    return {
        {"Main", "function Main.main 0\n"
                 "push constant 7\n"
                 "push constant 8\n"
                 "add\n"
                 "return\n"},
        {"Sys",  "function Sys.init 0\n"
                 "call Main.main 0\n"
                 "pop static 0\n"
                 "label END\n"
                 "goto END\n"},
    };
}

void test_bootstrap_prologue() {
    std::cout << "\n--- Bootstrap ---\n";

    TranslatorOptions options;
    options.annotate = false;
    std::string assembly = translate_sources(two_file_program(), true, options);

    check(assembly.rfind("@256\nD=A\n@SP\nM=D\n@BOOTSTRAP$ret$0\nD=A\n", 0) == 0,
          "SP initialized then call Sys.init begins");
    size_t jump = assembly.find("@Sys.init\n0;JMP\n");
    size_t main = assembly.find("(Main.main)");
    check(jump != std::string::npos && jump < main, "bootstrap call precedes all file code");
}

void test_bootstrap_runs_program() {
    auto m = execute(translate_sources(two_file_program(), true), false);

    check(m.state() == MachineState::HALTED, "bootstrapped program halts in Sys.init");
    check(m.read_ram(16) == 15, "Sys.init stored Main.main's result");
    check(m.read_ram(TargetAddress::SP) == STACK + CALL_FRAME_SIZE,
          "stack holds only the bootstrap frame");
    check(m.read_ram(TargetAddress::LCL) == STACK + CALL_FRAME_SIZE, "Sys.init's LCL restored");
    check(m.read_ram(TargetAddress::ARG) == STACK, "Sys.init's ARG restored");
}

void test_bootstrap_policy() {
    std::vector<SourceFile> single = {{"Solo", "push constant 1\n"}};

    Translator automatic;
    std::ostringstream out;
    check(!automatic.translate_sources(single, false, out).bootstrapped, "AUTO: single file raw");
    check(automatic.translate_sources(two_file_program(), true, out).bootstrapped,
          "AUTO: whole program bootstrapped");

    TranslatorOptions always;
    always.bootstrap = BootstrapMode::ALWAYS;
    check(Translator(always).translate_sources(single, false, out).bootstrapped, "ALWAYS");

    TranslatorOptions never;
    never.bootstrap = BootstrapMode::NEVER;
    check(!Translator(never).translate_sources(two_file_program(), true, out).bootstrapped,
          "NEVER");

    TranslatorOptions entry;
    entry.bootstrap = BootstrapMode::ALWAYS;
    entry.entry_function = "Main.main";
    entry.stack_origin = 512;
    entry.annotate = false;
    std::string text = translate_sources(single, false, entry);
    check(text.rfind("@512\n", 0) == 0 && text.find("@Main.main\n0;JMP\n") != std::string::npos,
          "custom entry function and stack origin");

    TranslatorOptions no_loop;
    no_loop.end_loop = false;
    check(translate_sources(single, false, no_loop).find("PROGRAM_END") == std::string::npos,
          "end loop can be disabled");
}

void test_translation_result() {
    Translator translator;
    std::ostringstream out;
    auto result = translator.translate_sources(two_file_program(), true, out);

    check(result.files.size() == 2 && result.files[0] == "Main" && result.files[1] == "Sys",
          "files reported in translation order");
    check(result.command_count == 10, "command count");
}

// ==============================================================================
// Errors
// ==============================================================================

void test_error_location_and_no_output() {
    std::cout << "\n--- Errors ---\n";

    Translator translator;
    std::ostringstream out;
    try {
        translator.translate_sources({
            {"Good", "push constant 1\n"},
            {"Bad",  "push constant 1\n// fine\nmul\n"},
        }, true, out);
        check(false, "unknown command aborts translation");
    } catch (const UnknownCommandError& e) {
        check(e.file() == "Bad" && e.line() == 3, "error names file and line");
    }
    check(out.str().empty(), "nothing written on error");

    try {
        translator.translate_sources({{"Seg", "push constant 1\npop constant 0\n"}}, false, out);
        check(false, "pop constant aborts translation");
    } catch (const InvalidSegmentOperationError& e) {
        check(e.file() == "Seg" && e.line() == 2, "segment error names file and line");
    }
    check(out.str().empty(), "still nothing written");
}

void test_unusable_file_names() {
    Translator translator;
    std::ostringstream out;
    for (const char* name : {"my-prog", "1abc", "two words"}) {
        bool named = false;
        try {
            translator.translate_sources({{name, "push static 0\n"}}, false, out);
        } catch (const FileError& e) {
            named = e.file() == name;
        }
        check(named, std::string("file name '") + name + "' rejected");
    }
    check(out.str().empty(), "nothing written for a bad file name");
}

void test_invalid_entry_function() {
    TranslatorOptions options;
    options.bootstrap = BootstrapMode::ALWAYS;
    std::ostringstream out;

    for (const char* entry : {"1bad", "Sys$init", ""}) {
        options.entry_function = entry;
        bool threw = false;
        try {
            Translator(options).translate_sources({{"Solo", "push constant 1\n"}}, false, out);
        } catch (const MalformedCommandError&) {
            threw = true;
        }
        check(threw, std::string("entry '") + entry + "' rejected");
    }
    check(out.str().empty(), "nothing written for a bad entry");

    // Without a bootstrap the entry name is never used
    options.bootstrap = BootstrapMode::NEVER;
    options.entry_function = "1bad";
    Translator(options).translate_sources({{"Solo", "push constant 1\n"}}, false, out);
    check(!out.str().empty(), "entry ignored without bootstrap");
}

// ==============================================================================
// Files & Directories
// ==============================================================================

static void write_file(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    file << text;
}

void test_directory_translation() {
    std::cout << "\n--- Files ---\n";

    fs::path root = fs::temp_directory_path() / "vmtranslator_translator_test";
    fs::remove_all(root);
    fs::path prog = root / "Prog";
    fs::create_directories(prog);

    for (const auto& source : two_file_program()) {
        write_file(prog / (source.name + ".vm"), source.text);
    }
    write_file(prog / "notes.txt", "not vm code\n");
    write_file(prog / "Main.asm", "// stale output\n");

    fs::create_directories(prog / "Sub.vm");
    std::error_code link_ec;
    fs::create_symlink(root / "nowhere.vm", prog / "Broken.vm", link_ec);

    auto files = list_vm_files(prog.string());
    check(files.size() == 2, "only regular .vm files listed");
    if (!link_ec) {
        check(fs::is_symlink(fs::symlink_status(prog / "Broken.vm")),
              "dangling link present but skipped");
    }
    check(files.size() == 2 && get_file_basename(files[0]) == "Main" &&
          get_file_basename(files[1]) == "Sys", "files in name order");

    check(default_output_path(prog.string()) == (prog / "Prog.asm").string(),
          "directory output goes inside it");
    check(default_output_path(prog.string() + "/") == (prog / "Prog.asm").string(),
          "trailing slash handled");
    check(default_output_path((prog / "Main.vm").string()) == (prog / "Main.asm").string(),
          "file output beside it");

    Translator translator;
    std::ostringstream out;
    auto result = translator.translate_path(prog.string(), out);
    check(result.bootstrapped, "directory bootstraps");

    auto m = execute(out.str(), false);
    check(m.read_ram(16) == 15, "directory program runs");

    std::ostringstream single;
    auto file_result = translator.translate_path((prog / "Main.vm").string(), single);
    check(!file_result.bootstrapped && file_result.files.size() == 1, "single file is raw");

    fs::path empty = root / "Empty";
    fs::create_directories(empty);
    bool threw = false;
    try {
        std::ostringstream sink;
        translator.translate_directory(empty.string(), sink);
    } catch (const FileError&) {
        threw = true;
    }
    check(threw, "directory without .vm files is a file error");

    threw = false;
    try {
        std::ostringstream sink;
        translator.translate_path((root / "missing.vm").string(), sink);
    } catch (const FileError&) {
        threw = true;
    }
    check(threw, "missing input is a file error");

    fs::path dashed = root / "Dashed";
    fs::create_directories(dashed);
    write_file(dashed / "my-prog.vm", "push static 0\n");
    threw = false;
    std::ostringstream dashed_out;
    try {
        translator.translate_path(dashed.string(), dashed_out);
    } catch (const FileError& e) {
        threw = e.file() == "my-prog";
    }
    check(threw && dashed_out.str().empty(), "directory with unusable file name rejected");

    fs::remove_all(root);
}

// ==============================================================================
// Main
// ==============================================================================

int main() {
    std::cout << "=== Translator Tests ===\n\n";

    test_add_scenario();
    test_arithmetic_ops();
    test_comparisons_in_sequence();
    test_segment_store_and_load();
    test_push_pop_is_noop();
    test_pointer_rebases_this_that();
    test_static_scoping();
    test_loop_with_labels();
    test_call_return_round_trip();
    test_locals_zeroed_and_zero_args();
    test_recursion();
    test_bootstrap_prologue();
    test_bootstrap_runs_program();
    test_bootstrap_policy();
    test_translation_result();
    test_error_location_and_no_output();
    test_unusable_file_names();
    test_invalid_entry_function();
    test_directory_translation();

    std::cout << "\n=== " << pass_count << "/" << test_count << " tests passed! ===\n";
    return pass_count == test_count ? 0 : 1;
}
