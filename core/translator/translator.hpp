// ==============================================================================
// Translator (Driver)
// ==============================================================================
// Links one or more .vm files into a single assembly program:
// - enumerates the input files in a stable order
// - feeds each file through the VMParser into one shared CodeWriter
// - prepends bootstrap code when translating a whole program (directory)
//
// Output is generated into a buffer and only handed to the destination
// stream once the whole program translated without error, so a failed
// translation never leaves partial assembly behind.
// ==============================================================================

#ifndef VMTRANSLATOR_TRANSLATOR_TRANSLATOR_HPP
#define VMTRANSLATOR_TRANSLATOR_TRANSLATOR_HPP

#include "code_writer.hpp"
#include "vm_parser.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace vmt {

// ==============================================================================
// Configuration
// ==============================================================================

/**
 * @brief When to emit the bootstrap prologue
 *
 * AUTO follows the input shape: a single file is translated raw,
 * a directory is linked as a complete program.
 */
enum class BootstrapMode {
    AUTO,
    ALWAYS,
    NEVER
};

/**
 * @brief Translator settings
 */
struct TranslatorOptions {
    BootstrapMode bootstrap = BootstrapMode::AUTO;
    std::string entry_function = "Sys.init";
    Address stack_origin = TargetAddress::STACK_BASE;
    bool annotate = true;   // "// command" line before each command's code
    bool end_loop = true;   // Park execution after the last file's code
};

/**
 * @brief One VM source held in memory
 */
struct SourceFile {
    std::string name;   // File stem; qualifies static symbols
    std::string text;   // File contents
};

/**
 * @brief Summary of a finished translation
 */
struct TranslationResult {
    std::vector<std::string> files;     // Stems, in translation order
    size_t command_count = 0;
    bool bootstrapped = false;
};

// ==============================================================================
// Translator Class
// ==============================================================================

/**
 * @brief Drives a whole-program translation
 *
 * Usage:
 *   Translator translator;
 *   std::ofstream out("Prog/Prog.asm");
 *   translator.translate_path("Prog", out);
 */
class Translator {
public:
    Translator() = default;
    explicit Translator(TranslatorOptions options);

    const TranslatorOptions& options() const { return options_; }

    /**
     * @brief Translate a file or a directory, whichever the path names
     *
     * @throws FileError if the path doesn't exist or can't be read
     * @throws VMTError subclasses for any error in the VM code
     */
    TranslationResult translate_path(const FilePath& path, std::ostream& out);

    /**
     * @brief Translate a single .vm file (no bootstrap under AUTO)
     */
    TranslationResult translate_file(const FilePath& file_path, std::ostream& out);

    /**
     * @brief Translate every .vm file of a directory (bootstrap under AUTO)
     *
     * Files are taken in name order.
     *
     * @throws FileError if the directory holds no .vm file
     */
    TranslationResult translate_directory(const FilePath& directory_path, std::ostream& out);

    /**
     * @brief Translate in-memory sources
     *
     * @param sources Files in translation order
     * @param whole_program What AUTO resolves to: true behaves like a
     *        directory (bootstrap), false like a single file
     */
    TranslationResult translate_sources(const std::vector<SourceFile>& sources,
                                        bool whole_program,
                                        std::ostream& out);

private:
    TranslatorOptions options_;

    bool wants_bootstrap(bool whole_program) const;
};

// ==============================================================================
// Utility Functions
// ==============================================================================

/**
 * @brief Where the assembly for an input path goes by default
 *
 * Examples:
 *   "dir/Foo.vm" -> "dir/Foo.asm"
 *   "dir/Prog"   -> "dir/Prog/Prog.asm"
 */
FilePath default_output_path(const FilePath& input_path);

/**
 * @brief List the .vm files of a directory in name order
 *
 * @throws FileError if the directory doesn't exist
 */
std::vector<FilePath> list_vm_files(const FilePath& directory_path);

/**
 * @brief Read a whole file into memory
 *
 * @throws FileError if the file can't be opened
 */
std::string read_source_file(const FilePath& file_path);

}  // namespace vmt

#endif  // VMTRANSLATOR_TRANSLATOR_TRANSLATOR_HPP
