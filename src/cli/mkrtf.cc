#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>

#include "srtf.hpp"

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

void print_usage() {
    std::cerr << "usage: mkrtf [-t template.xml] [-v] [-q] input [output]\n\n"
              << "Builds an RTF document from an XML authoring script.\n\n"
              << "Input can be '-' to use stdin, and output can be '-' to use "
                 "stdout.\n"
              << "Without an output argument the RTF is written to stdout.\n\n"
              << "Options:\n"
              << "  -t template.xml  Fonts, colors and styles to use instead of "
                 "the built-in set\n"
              << "  -v               Print the authoring trace to stderr\n"
              << "  -q               Do not print warnings\n";
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool quiet = false;
    std::string template_path;
    std::string input_path;
    std::string output_path;

    int arg_idx = 1;
    while (arg_idx < argc) {
        if (strcmp(argv[arg_idx], "-t") == 0) {
            if (arg_idx + 1 >= argc) {
                std::cerr << "Error: -t requires a template file\n\n";
                print_usage();
                return 1;
            }
            template_path = argv[arg_idx + 1];
            arg_idx += 2;
        } else if (strcmp(argv[arg_idx], "-v") == 0) {
            verbose = true;
            arg_idx++;
        } else if (strcmp(argv[arg_idx], "-q") == 0) {
            quiet = true;
            arg_idx++;
        } else if (strcmp(argv[arg_idx], "-h") == 0 || strcmp(argv[arg_idx], "--help") == 0) {
            print_usage();
            return 0;
        } else {
            break;
        }
    }

    if (arg_idx >= argc) {
        if (!isatty(fileno(stdin))) {
            input_path = "-";
            output_path = "-";
        } else {
            std::cerr << "Error: Missing input file\n\n";
            print_usage();
            return 1;
        }
    } else {
        input_path = argv[arg_idx++];
        output_path = arg_idx < argc ? argv[arg_idx++] : "-";
    }

    if (arg_idx < argc) {
        std::cerr << "Error: Unexpected argument: " << argv[arg_idx] << "\n\n";
        print_usage();
        return 1;
    }

    try {
        libsrtf::DocumentOptions options;

        if (!quiet) {
            options.warning_callback = [](const std::string& category, const std::string& message) {
                std::cerr << "Warning [" << category << "]: " << message << "\n";
            };
        }
        if (verbose) {
            options.log_callback = [](const std::string& message) { std::cerr << message << "\n"; };
        }

        std::shared_ptr<const libsrtf::DocumentTemplate> document_template =
            template_path.empty() ? libsrtf::DocumentTemplate::builtin()
                                  : libsrtf::loadTemplateFile(template_path);

        libsrtf::Document document(document_template, options);

        if (input_path == "-") {
            std::ostringstream buffer;
            buffer << std::cin.rdbuf();
            libsrtf::buildDocumentFromString(buffer.str(), document);
        } else {
            libsrtf::buildDocumentFromFile(input_path, document);
        }

        if (output_path == "-") {
            document.serialize(std::cout);
        } else {
            std::ofstream output_file(output_path, std::ios::binary);
            if (!output_file) {
                std::cerr << "Error: Cannot open output file: " << output_path << "\n";
                return 1;
            }
            document.serialize(output_file);
            output_file.close();
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
