#include <cstdlib>
#include <cstring>
#include <iostream>

#include "CodeSigner.h"
#include "DescriptorReader.h"
#include "Errors.h"
#include "LinkRewriter.h"
#include "Relocator.h"
#include "Settings.h"

using namespace dylibembed;

const std::string VERSION = "1.0.0";

void showHelp()
{
    std::cout << "dylibembed " << VERSION << std::endl;
    std::cout << "dylibembed copies the source-built libraries of a macOS "
                 "executable next to it and makes every reference to them "
                 "relative to the executable.\n"
              << std::endl;

    std::cout << "-x, --fix-file <executable inside the app bundle>"
              << std::endl;
    std::cout << "-p, --source-prefix <libraries under this prefix are "
                 "embedded, all others are left alone>"
              << std::endl;
    std::cout << "-e, --extra-lib <library to embed even if nothing links "
                 "against it (repeatable)>"
              << std::endl;
    std::cout << "-d, --dest-dir <name of the embedding directory next to the "
                 "executable, by default 'lib-<arch>-<os version>'>"
              << std::endl;
    std::cout << "-t, --loader-token <token the rewritten references start "
                 "with, by default '@executable_path'>"
              << std::endl;
    std::cout << "-ns, --no-codesign (disables ad-hoc codesigning)"
              << std::endl;
    std::cout << "-nl, --no-lock (do not take the bundle lock)" << std::endl;
    std::cout << "-h, --help" << std::endl;
}

// returns the value following flag `i`, or exits if there is none
const char* flagValue(int argc, char* const argv[], int i)
{
    if (i + 1 >= argc) {
        std::cerr << "Missing value for " << argv[i] << std::endl << std::endl;
        showHelp();
        exit(1);
    }
    return argv[i + 1];
}

int main(int argc, char* const argv[])
{
    EmbedConfig config;

    // parse arguments
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-x") == 0 or strcmp(argv[i], "--fix-file") == 0) {
            config.executable = flagValue(argc, argv, i++);
        } else if (strcmp(argv[i], "-p") == 0
                   or strcmp(argv[i], "--source-prefix") == 0) {
            config.source_prefix = flagValue(argc, argv, i++);
        } else if (strcmp(argv[i], "-e") == 0
                   or strcmp(argv[i], "--extra-lib") == 0) {
            config.extra_libraries.push_back(flagValue(argc, argv, i++));
        } else if (strcmp(argv[i], "-d") == 0
                   or strcmp(argv[i], "--dest-dir") == 0) {
            config.embedding_dir_name = flagValue(argc, argv, i++);
        } else if (strcmp(argv[i], "-t") == 0
                   or strcmp(argv[i], "--loader-token") == 0) {
            config.loader_token = flagValue(argc, argv, i++);
        } else if (strcmp(argv[i], "-ns") == 0
                   or strcmp(argv[i], "--no-codesign") == 0) {
            config.codesign = false;
        } else if (strcmp(argv[i], "-nl") == 0
                   or strcmp(argv[i], "--no-lock") == 0) {
            config.lock = false;
        } else if (strcmp(argv[i], "-h") == 0
                   or strcmp(argv[i], "--help") == 0) {
            showHelp();
            exit(0);
        } else {
            std::cerr << "Unknown flag " << argv[i] << std::endl << std::endl;
            showHelp();
            exit(1);
        }
    }

    if (config.executable.empty() or config.source_prefix.empty()) {
        showHelp();
        exit(1);
    }

    OtoolDescriptorReader reader;
    InstallNameToolRewriter rewriter(reader);
    AdhocCodeSigner signer;

    Relocator relocator(reader, rewriter, config.codesign ? &signer : NULL);
    try {
        relocator.embed(config);
    } catch (const EmbedError& e) {
        std::cerr << "\n\nError : " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\n* Done" << std::endl;
    return 0;
}
