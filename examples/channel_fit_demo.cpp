#include <exception>
#include <iostream>
#include <string>

#include "linreg/linreg.hpp"

using namespace linreg;

struct CliOptions {
    std::string ref;
    std::string dist;
    ChannelSpace space = ChannelSpace::Lab;
};

static bool parse_args(int argc, char** argv, CliOptions& opts)
{
    if (argc < 3) {
        std::cerr << "Usage:\n";
        std::cerr << "  channel_fit_demo <ref_image> <dist_image> [--bgr]\n";
        std::cerr << "Fits each channel of dist against ref in Lab space,\n"
                  << "or in BGR with --bgr.\n";
        return false;
    }

    opts.ref  = argv[1];
    opts.dist = argv[2];

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--bgr") {
            opts.space = ChannelSpace::Bgr;
        } else {
            std::cerr << "ERROR: unknown argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

int main(int argc, char** argv)
{
    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        return 1;
    }

    ChannelFits fits;
    try {
        fits = fit_channels_from_files(opts.ref, opts.dist, opts.space);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    static const char* const kBgrNames[] = {"B", "G", "R"};
    static const char* const kLabNames[] = {"L*", "a*", "b*"};
    const bool lab = opts.space == ChannelSpace::Lab;
    const char* const* names = lab ? kLabNames : kBgrNames;

    std::cout << "Per-channel linear fit in " << (lab ? "Lab" : "BGR")
              << " (dist = slope * ref + intercept):\n";
    for (std::size_t c = 0; c < fits.size() && c < 3; ++c) {
        std::cout << " " << names[c] << ": ";
        if (fits[c]) {
            std::cout << "slope=" << fits[c]->slope
                      << "   intercept=" << fits[c]->intercept << "\n";
        } else {
            std::cout << "no fit (flat reference channel)\n";
        }
    }

    return 0;
}
