// roff2tex.cpp - RUNOFF to LaTeX translator command line

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <string>
#include <vector>

#include "command_table.h"
#include "flag_table.h"
#include "interpreter.h"
#include "line_reader.h"
#include "options.h"
#include "texts.h"

static int f_body_only    = 0;
static int f_carry_latch  = 0;
static int f_drop_unknown = 0;
static int f_keep_header  = 0;
static int f_quiet        = 0;

static struct option long_options[] = {
    {"help", no_argument, nullptr, 'h'},
    {"version", no_argument, nullptr, 'v'},
    {"legend", no_argument, nullptr, 'l'},
    {"body-only", no_argument, &f_body_only, 'b'},
    {"carry-latch", no_argument, &f_carry_latch, 'c'},
    {"drop-unknown", no_argument, &f_drop_unknown, 'd'},
    {"keep-header", no_argument, &f_keep_header, 'k'},
    {"quiet", no_argument, &f_quiet, 'q'},
    {"demo", no_argument, nullptr, 0},
    {nullptr, 0, nullptr, 0},
};

int main(int argc, char* argv[]) {
    int opt;
    int opt_idx;
    bool demo = false;

    while ((opt = getopt_long(argc, argv, "?hvlbcdkq", long_options, &opt_idx)) != -1) {
        switch (opt) {
        case 0:
            if (std::strcmp(long_options[opt_idx].name, "demo") == 0) {
                demo = true;
            }
            break;

        case '?':
            std::fprintf(stderr, texts::USAGE + 1, argv[0]);
            std::fprintf(stderr, "(try using -h or --help for more info)\n");
            return EXIT_FAILURE;

        case 'h':
            std::printf(texts::USAGE + 1, argv[0]);
            std::printf("\n%s", texts::HELP + 1);
            return EXIT_SUCCESS;

        case 'v':
            std::puts(texts::VERSION);
            return EXIT_SUCCESS;

        case 'l':
            std::printf("%s", texts::LEGEND + 1);
            return EXIT_SUCCESS;

        case 'b':
            f_body_only = 1;
            break;
        case 'c':
            f_carry_latch = 1;
            break;
        case 'd':
            f_drop_unknown = 1;
            break;
        case 'k':
            f_keep_header = 1;
            break;
        case 'q':
            f_quiet = 1;
            break;
        }
    }

    Options options;
    options.preamble    = !f_body_only;
    options.carry_latch = f_carry_latch;
    options.skip_header = !f_keep_header;
    options.warnings    = !f_quiet;
    options.unknown     = f_drop_unknown ? UnknownPolicy::DROP : UnknownPolicy::MARK;

    const CommandTable commands = CommandTable::standard();
    const FlagTable flags       = FlagTable::standard();
    Interpreter interpreter(commands, flags, options, stdout);

    // Collect inputs before emitting anything so a bad path leaves no partial output
    struct Input {
        std::FILE* stream;
        std::string name;
    };
    std::vector<Input> inputs;

    if (demo) {
        std::FILE* stream = fmemopen(const_cast<char*>(texts::DEMO), std::strlen(texts::DEMO), "r");
        if (!stream) {
            std::fprintf(stderr, "roff2tex: cannot open demo text: %s\n", std::strerror(errno));
            return EXIT_FAILURE;
        }
        inputs.push_back({stream, "<demo>"});
    } else if (optind >= argc) {
        inputs.push_back({stdin, "<stdin>"});
    }
    for (; optind < argc; ++optind) {
        const char* path = argv[optind];
        if (std::strcmp(path, "-") == 0) {
            inputs.push_back({stdin, "<stdin>"});
            continue;
        }
        std::FILE* stream = std::fopen(path, "r");
        if (!stream) {
            std::fprintf(stderr, "roff2tex: cannot open '%s': %s\n", path, std::strerror(errno));
            for (Input& input : inputs) {
                if (input.stream != stdin) std::fclose(input.stream);
            }
            return EXIT_FAILURE;
        }
        inputs.push_back({stream, path});
    }

    int status = EXIT_SUCCESS;
    interpreter.begin();
    for (Input& input : inputs) {
        if (status == EXIT_SUCCESS) {
            try {
                LineReader reader(input.stream, input.name);
                interpreter.translate(reader);
            } catch (const InputError& e) {
                std::fprintf(stderr, "roff2tex: %s\n", e.what());
                status = EXIT_FAILURE;
            }
        }
        if (input.stream != stdin) std::fclose(input.stream);
    }

    if (status == EXIT_SUCCESS) {
        interpreter.finish();
    }

    if (std::ferror(stdout)) {
        std::fprintf(stderr, "roff2tex: write error: %s\n", std::strerror(errno));
        return EXIT_FAILURE;
    }
    return status;
}
