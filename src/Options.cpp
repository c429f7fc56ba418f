#include "Options.hpp"
#include <getopt.h>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace {
    bool parseUnsigned(const char* s, unsigned long long& out) {
        if (s == nullptr || !std::isdigit((unsigned char)*s)) return false;
        errno = 0;
        char* end = nullptr;
        unsigned long long v = strtoull(s, &end, 10);
        if (errno == ERANGE || *end != '\0') return false;
        out = v;
        return true;
    }
}

void usage(std::ostream& os, const char* prog) {
    os << "usage: " << prog << " [options]\n"
       << "  -w, --words PATH    word list for random seeding (default assets/words.txt)\n"
       << "  -l, --locale NAME   collate with this locale instead of primary strength;\n"
       << "                      locale order is case/accent sensitive\n"
       << "  -s, --sample N      default random count (5, 10, 20, 50, 100, 200, 500)\n"
       << "  -L, --live          start with live search on\n"
       << "      --seed N        fixed seed for random words\n"
       << "  -h, --help          show this help\n";
}

ParseResult parseOptions(int argc, char** argv, AppConfig& cfg, std::ostream& out, std::ostream& err) {
    const struct option longopts[] = {
        {"words", required_argument, nullptr, 'w'},
        {"locale", required_argument, nullptr, 'l'},
        {"sample", required_argument, nullptr, 's'},
        {"live", no_argument, nullptr, 'L'},
        {"seed", required_argument, nullptr, 'S'},
        {"help", no_argument, nullptr, 'h'},
        {0,0,0,0}
    };

    optind = 0; // full rescan, so repeated calls start over
    int opt;
    unsigned long long n = 0;
    while ((opt = getopt_long(argc, argv, "w:l:s:Lh", longopts, nullptr)) != -1) {
        switch (opt) {
            case 'w': cfg.wordListPath = optarg; break;
            case 'l': cfg.localeName = optarg; break;
            case 's':
                if (!parseUnsigned(optarg, n) || n > INT_MAX) {
                    err << "bad sample size '" << optarg << "'\n";
                    usage(err, argv[0]);
                    return ParseResult::Error;
                }
                cfg.sampleSize = (int)n;
                break;
            case 'L': cfg.liveSearch = true; break;
            case 'S':
                if (!parseUnsigned(optarg, n)) {
                    err << "bad seed '" << optarg << "'\n";
                    usage(err, argv[0]);
                    return ParseResult::Error;
                }
                cfg.seeded = true;
                cfg.seed = n;
                break;
            case 'h': usage(out, argv[0]); return ParseResult::Help;
            default: usage(err, argv[0]); return ParseResult::Error;
        }
    }
    return ParseResult::Run;
}
