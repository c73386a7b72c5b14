#include "driver/project.h"

#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static void printUsage() {
    std::cout << "Usage: prism <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  init <name>     Create a new prism project\n"
              << "  build           Compile every unit of the current project\n"
              << "  check           Report diagnostics without writing output\n"
              << "  watch           Rebuild whenever a unit changes\n"
              << "  clean           Remove the output directory\n"
              << "  version         Print the prism version\n"
              << "  help            Show this help message\n"
              << "\n"
              << "Options:\n"
              << "  --strict        Treat unknown directives as errors\n"
              << "  --jobs <n>      Number of worker threads\n"
              << "  --no-cache      Recompile every unit\n"
              << "  --quiet         Only print diagnostics\n";
}

static void printVersion() {
    std::cout << "prism 0.1.0\n";
}

// Returns false and prints an error on an unknown or malformed option.
static bool parseFlags(int argc, char* argv[], int first, prism::BuildFlags& flags) {
    for (int i = first; i < argc; i++) {
        if (std::strcmp(argv[i], "--strict") == 0) {
            flags.strict = true;
        } else if (std::strcmp(argv[i], "--no-cache") == 0) {
            flags.no_cache = true;
        } else if (std::strcmp(argv[i], "--quiet") == 0 || std::strcmp(argv[i], "-q") == 0) {
            flags.quiet = true;
        } else if (std::strcmp(argv[i], "--jobs") == 0 || std::strcmp(argv[i], "-j") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "error: '" << argv[i] << "' requires a number\n";
                return false;
            }
            std::string value = argv[++i];
            if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
                std::cerr << "error: invalid job count '" << value << "'\n";
                return false;
            }
            try {
                flags.jobs = static_cast<unsigned>(std::stoul(value));
            } catch (const std::out_of_range&) {
                std::cerr << "error: invalid job count '" << value << "'\n";
                return false;
            }
        } else {
            std::cerr << "error: unknown option '" << argv[i] << "'\n";
            return false;
        }
    }
    return true;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        printUsage();
        return 0;
    }

    if (cmd == "version" || cmd == "--version" || cmd == "-v") {
        printVersion();
        return 0;
    }

    std::string dir = fs::current_path().string();

    if (cmd == "init") {
        if (argc < 3) {
            std::cerr << "error: 'prism init' requires a project name\n";
            return 1;
        }
        return prism::Project::init(dir, argv[2]) ? 0 : 1;
    }

    if (cmd == "clean") {
        return prism::Project::clean(dir);
    }

    prism::BuildFlags flags;
    if (cmd == "build" || cmd == "check" || cmd == "watch") {
        if (!parseFlags(argc, argv, 2, flags)) return 1;
    }

    if (cmd == "build") {
        return prism::Project::build(dir, flags);
    }

    if (cmd == "check") {
        return prism::Project::check(dir, flags);
    }

    if (cmd == "watch") {
        return prism::Project::watch(dir, flags);
    }

    std::cerr << "error: unknown command '" << cmd << "'\n";
    printUsage();
    return 1;
}
