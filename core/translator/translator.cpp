// ==============================================================================
// Translator Implementation
// ==============================================================================

#include "translator.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace vmt {

namespace fs = std::filesystem;

Translator::Translator(TranslatorOptions options)
    : options_(std::move(options))
{}

// ==============================================================================
// Entry Points
// ==============================================================================

TranslationResult Translator::translate_path(const FilePath& path, std::ostream& out) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return translate_directory(path, out);
    }
    if (!fs::exists(path, ec)) {
        throw FileError(path, "No such file or directory");
    }
    return translate_file(path, out);
}

TranslationResult Translator::translate_file(const FilePath& file_path, std::ostream& out) {
    std::vector<SourceFile> sources;
    sources.push_back({get_file_basename(file_path), read_source_file(file_path)});
    return translate_sources(sources, false, out);
}

TranslationResult Translator::translate_directory(const FilePath& directory_path,
                                                  std::ostream& out) {
    std::vector<FilePath> files = list_vm_files(directory_path);
    if (files.empty()) {
        throw FileError(directory_path, "Directory contains no .vm files");
    }

    std::vector<SourceFile> sources;
    sources.reserve(files.size());
    for (const auto& file : files) {
        sources.push_back({get_file_basename(file), read_source_file(file)});
    }

    return translate_sources(sources, true, out);
}

TranslationResult Translator::translate_sources(const std::vector<SourceFile>& sources,
                                                bool whole_program,
                                                std::ostream& out) {
    TranslationResult result;

    std::ostringstream buffer;
    CodeWriter writer(buffer, options_.annotate);

    if (wants_bootstrap(whole_program)) {
        if (!is_valid_identifier(options_.entry_function)) {
            throw MalformedCommandError(
                "Invalid entry function name '" + options_.entry_function + "'");
        }
        writer.write_bootstrap(options_.entry_function, options_.stack_origin);
        result.bootstrapped = true;
    }

    for (const auto& source : sources) {
        // The stem names statics and file-scoped labels in the output
        if (!is_valid_identifier(source.name)) {
            throw FileError(source.name,
                "File name is not a valid symbol: use letters, digits, '_', '.' "
                "and don't start with a digit");
        }

        // Parse the whole file first so syntax errors surface before
        // any of its code is generated
        VMParser parser(source.name);
        std::vector<VMCommand> commands = parser.parse_source(source.text);

        writer.set_file_name(source.name);
        for (const auto& command : commands) {
            writer.write_command(command);
        }

        result.files.push_back(source.name);
        result.command_count += commands.size();
    }

    if (options_.end_loop) {
        writer.write_end_loop();
    }

    out << buffer.str();
    if (!out) {
        throw FileError("Failed to write assembly output");
    }

    return result;
}

bool Translator::wants_bootstrap(bool whole_program) const {
    switch (options_.bootstrap) {
        case BootstrapMode::ALWAYS: return true;
        case BootstrapMode::NEVER:  return false;
        case BootstrapMode::AUTO:
        default:                    return whole_program;
    }
}

// ==============================================================================
// Utility Functions
// ==============================================================================

FilePath default_output_path(const FilePath& input_path) {
    fs::path path(input_path);

    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        // "Prog/" has an empty filename; normalize to "Prog"
        if (!path.has_filename()) {
            path = path.parent_path();
        }
        return (path / (path.filename().string() + ".asm")).string();
    }

    path.replace_extension(".asm");
    return path.string();
}

std::vector<FilePath> list_vm_files(const FilePath& directory_path) {
    std::error_code ec;
    if (!fs::is_directory(directory_path, ec)) {
        throw FileError(directory_path, "Directory does not exist");
    }

    // Non-throwing iteration: filesystem failures become FileError
    std::vector<FilePath> vm_files;
    fs::directory_iterator it(directory_path, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code status_ec;
        if (it->is_regular_file(status_ec) && it->path().extension() == ".vm") {
            vm_files.push_back(it->path().string());
        }
    }
    if (ec) {
        throw FileError(directory_path, "Could not list directory: " + ec.message());
    }

    // Name order, independent of the filesystem's own listing order
    std::sort(vm_files.begin(), vm_files.end());
    return vm_files;
}

std::string read_source_file(const FilePath& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw FileError(file_path, "Could not open file for reading");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // namespace vmt
