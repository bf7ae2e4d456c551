#include "../include/Runner.hpp"
#include <getopt.h>
#include <clocale>
#include <iostream>
#include <string>

#ifndef PACKAGER_VERSION
#define PACKAGER_VERSION "0.0.0"
#endif
#ifndef PACKAGER_LOCALEDIR
#define PACKAGER_LOCALEDIR "/usr/share/locale"
#endif

using namespace packager;

static void print_usage(std::ostream &os, const char *prog) {
    os << _("Usage: ") << prog << " --config <path> [--workdir <path>] [--dry-run]\n"
       << "\n"
       << "  -c, --config <path>    " << _("task script to execute (required)") << "\n"
       << "  -w, --workdir <path>   " << _("base directory for relative paths (default: the script's directory)") << "\n"
       << "  -n, --dry-run          " << _("print the task plan without executing it") << "\n"
       << "  -h, --help             " << _("show this help") << "\n"
       << "  -V, --version          " << _("show version") << "\n";
}

int main(const int argc, char **argv) {
    std::setlocale(LC_ALL, "");
    bindtextdomain("packager", PACKAGER_LOCALEDIR);
    textdomain("packager");

    static struct option long_options[] = {{"config", required_argument, nullptr, 'c'},
                                           {"workdir", required_argument, nullptr, 'w'},
                                           {"dry-run", no_argument, nullptr, 'n'},
                                           {"help", no_argument, nullptr, 'h'},
                                           {"version", no_argument, nullptr, 'V'},
                                           {nullptr, 0, nullptr, 0}};

    RunOptions options;
    bool have_config = false;
    int opt;
    while ((opt = getopt_long(argc, argv, "c:w:nhV", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'c':
                options.config_path = optarg;
                have_config = true;
                break;
            case 'w':
                options.workdir = std::string(optarg);
                break;
            case 'n':
                options.dry_run = true;
                break;
            case 'h':
                print_usage(std::cout, argv[0]);
                return EXIT_OK;
            case 'V':
                std::cout << "packager " << PACKAGER_VERSION << std::endl;
                return EXIT_OK;
            default:
                print_usage(std::cerr, argv[0]);
                return EXIT_USAGE;
        }
    }
    if (optind < argc) {
        std::cerr << _("Unexpected argument: ") << argv[optind] << "\n";
        print_usage(std::cerr, argv[0]);
        return EXIT_USAGE;
    }
    if (!have_config || options.config_path.empty()) {
        std::cerr << _("Missing required option --config") << "\n";
        print_usage(std::cerr, argv[0]);
        return EXIT_USAGE;
    }

    return Runner::run(options);
}
