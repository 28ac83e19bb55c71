/**
 * minipas - command-line interpreter
 *
 * Integrates all components:
 * - PascalLexer: Tokenization
 * - PascalParser: AST construction and symbol entry
 * - Executor: Interpretation
 *
 * Exit status: 0 success, 1 parse errors or usage problems,
 * 2 runtime error.
 */

#include "parser/lexer.hpp"
#include "parser/parser.hpp"
#include "parser/ast_printer.hpp"
#include "executor/executor.hpp"
#include "symtab/symtab.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace minipas;

namespace {

const char* const kVersion = "0.1.0";

struct Options {
    std::string path;
    bool dumpAst = false;
    bool dumpSymtab = false;
    bool parseOnly = false;
    bool trace = false;
};

void printUsage(std::ostream& out) {
    out << "Usage: minipas [options] <file.pas | ->\n";
    out << "\n";
    out << "Options:\n";
    out << "  --ast          Print the parse tree before running\n";
    out << "  --symtab       Print variable values after the run\n";
    out << "  --parse-only   Stop after parsing\n";
    out << "  --trace        Trace each executed statement on stderr\n";
    out << "  --help         Show this help message\n";
    out << "  --version      Show the version\n";
    out << "\n";
    out << "A path of '-' reads the program from standard input.\n";
}

// Returns false on a usage error; sets 'done' when nothing is left to run
bool parseArguments(int argc, char* argv[], Options& options, bool& done) {
    done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--ast") options.dumpAst = true;
        else if (arg == "--symtab") options.dumpSymtab = true;
        else if (arg == "--parse-only") options.parseOnly = true;
        else if (arg == "--trace") options.trace = true;
        else if (arg == "--help" || arg == "-h") {
            printUsage(std::cout);
            done = true;
            return true;
        }
        else if (arg == "--version") {
            std::cout << "minipas " << kVersion << "\n";
            done = true;
            return true;
        }
        else if (arg.size() > 1 && arg[0] == '-' && arg != "-") {
            std::cerr << "minipas: unknown option '" << arg << "'\n";
            return false;
        }
        else if (options.path.empty()) {
            options.path = arg;
        }
        else {
            std::cerr << "minipas: more than one source file given\n";
            return false;
        }
    }

    if (options.path.empty()) {
        std::cerr << "minipas: no source file given\n";
        return false;
    }
    return true;
}

bool readSource(const std::string& path, std::string& source) {
    std::ostringstream buffer;

    if (path == "-") {
        buffer << std::cin.rdbuf();
    } else {
        std::ifstream file(path);
        if (!file) {
            std::cerr << "minipas: cannot open '" << path << "'\n";
            return false;
        }
        buffer << file.rdbuf();
    }

    source = buffer.str();
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;
    bool done = false;

    if (!parseArguments(argc, argv, options, done)) {
        printUsage(std::cerr);
        return 1;
    }
    if (done) {
        return 0;
    }

    std::string source;
    if (!readSource(options.path, source)) {
        return 1;
    }

    symtab::Symtab symtab;

    try {
        // Parse
        parser::PascalLexer lexer(source);
        parser::PascalParser parser(lexer, symtab, std::cerr);
        auto program = parser.parseProgram();

        if (options.dumpAst) {
            parser::printTree(*program, std::cout);
        }

        if (parser.errorCount() > 0) {
            std::cerr << "\n" << parser.errorCount() << " syntax/semantic error"
                      << (parser.errorCount() == 1 ? "" : "s")
                      << "; not executed\n";
            return 1;
        }

        if (options.parseOnly) {
            return 0;
        }

        // Execute
        executor::Executor exec(symtab, std::cout, std::cerr);
        exec.setTrace(options.trace);
        exec.execute(*program);

    } catch (const executor::RuntimeError& e) {
        // Diagnostic already written by the executor
        std::cout.flush();
        return e.exitStatus();
    } catch (const std::exception& e) {
        std::cerr << "minipas: internal error: " << e.what() << "\n";
        return 1;
    }

    if (options.dumpSymtab) {
        symtab.dump(std::cout);
    }

    return 0;
}
