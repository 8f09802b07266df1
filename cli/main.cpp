// ==============================================================================
// vm_translator - command line front end
// ==============================================================================
// Usage: vm_translator [options] <file.vm | directory>
//
// Translates a single .vm file to Foo.asm beside it, or every .vm file of a
// directory Prog/ to Prog/Prog.asm. The output file is only created once
// the whole translation succeeded.
// ==============================================================================

#include "translator.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace vmt;

namespace {

constexpr int EXIT_TRANSLATION_ERROR = 1;
constexpr int EXIT_USAGE = 2;

struct CommandLine {
    TranslatorOptions options;
    std::string input;
    std::string output;
    bool quiet = false;
    bool help = false;
};

void print_usage(std::ostream& os) {
    os << "usage: vm_translator [options] <file.vm | directory>\n"
       << "\n"
       << "options:\n"
       << "  -o, --output <path>  write assembly to <path>\n"
       << "                       (default: Foo.asm beside Foo.vm, Prog/Prog.asm for Prog/)\n"
       << "  --bootstrap          always emit bootstrap code\n"
       << "  --no-bootstrap       never emit bootstrap code\n"
       << "  --entry <name>       function the bootstrap calls (default: Sys.init)\n"
       << "  --no-comments        don't annotate the output with VM commands\n"
       << "  -q, --quiet          don't print the output path\n"
       << "  -h, --help           show this message\n";
}

// Returns false and reports on stderr if the arguments are unusable
bool parse_arguments(int argc, char** argv, CommandLine& cmd) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto value = [&](std::string& target) {
            if (i + 1 >= argc) {
                std::cerr << "vm_translator: " << arg << " requires a value\n";
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            cmd.help = true;
        } else if (arg == "-o" || arg == "--output") {
            if (!value(cmd.output)) return false;
        } else if (arg == "--bootstrap") {
            cmd.options.bootstrap = BootstrapMode::ALWAYS;
        } else if (arg == "--no-bootstrap") {
            cmd.options.bootstrap = BootstrapMode::NEVER;
        } else if (arg == "--entry") {
            if (!value(cmd.options.entry_function)) return false;
            if (!is_valid_identifier(cmd.options.entry_function)) {
                std::cerr << "vm_translator: invalid entry function name '"
                          << cmd.options.entry_function << "'\n";
                return false;
            }
        } else if (arg == "--no-comments") {
            cmd.options.annotate = false;
        } else if (arg == "-q" || arg == "--quiet") {
            cmd.quiet = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "vm_translator: unknown option '" << arg << "'\n";
            return false;
        } else if (cmd.input.empty()) {
            cmd.input = arg;
        } else {
            std::cerr << "vm_translator: more than one input given\n";
            return false;
        }
    }

    if (!cmd.help && cmd.input.empty()) {
        std::cerr << "vm_translator: no input file or directory\n";
        return false;
    }
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    CommandLine cmd;
    if (!parse_arguments(argc, argv, cmd)) {
        print_usage(std::cerr);
        return EXIT_USAGE;
    }
    if (cmd.help) {
        print_usage(std::cout);
        return 0;
    }

    try {
        std::string output_path = cmd.output.empty()
            ? default_output_path(cmd.input)
            : cmd.output;

        Translator translator(cmd.options);
        std::ostringstream assembly;
        translator.translate_path(cmd.input, assembly);

        std::ofstream file(output_path);
        if (!file.is_open()) {
            throw FileError(output_path, "Could not open file for writing");
        }
        file << assembly.str();
        if (!file) {
            throw FileError(output_path, "Failed to write assembly output");
        }

        if (!cmd.quiet) {
            std::cout << "Translated: " << output_path << std::endl;
        }

    } catch (const VMTError& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_TRANSLATION_ERROR;
    }

    return 0;
}
