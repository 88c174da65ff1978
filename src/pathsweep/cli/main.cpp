#include "modes.hpp"

#include <iostream>
#include <string>

#ifndef PATHSWEEP_VERSION
#define PATHSWEEP_VERSION "dev"
#endif

/*
  CLI entry point.

  Modes:
    - correlate : build the correlation video of a sweep.
    - classify  : decide triangle vs square for a sweep.
    - batch     : run the fixed tree-cover inputs.
    - simulate  : write a synthetic sweep.
*/
static void print_usage() {
    std::cout
        << "pathsweep-cli " << PATHSWEEP_VERSION << "\n"
        << "Usage:\n"
        << "  pathsweep-cli correlate --in=FILE [--out=FILE] [--method=direct|fast] [--margin=25]\n"
        << "                          [--degenerate=zero|mid|throw] [--skip-bad] [--threads=1] [--view]\n"
        << "  pathsweep-cli classify  --in=FILE [--method=direct|fast] [--threshold=20] [--stride=4]\n"
        << "                          [--region=50] [--turns=2] [--threads=1] [--verbose]\n"
        << "  pathsweep-cli batch     [--assets=assets] [--outputs=outputs] [--ext=gif] [--threads=1]\n"
        << "  pathsweep-cli simulate  --out=FILE [--shape=triangle|square] [--side=48] [--per-edge=3]\n"
        << "                          [--loops=1] [--close] [--jitter=0] [--seed=1] [--master=img.png]\n"
        << "     FILE ending in .sst uses the native lossless container;\n"
        << "     anything else goes through OpenCV multi-image codecs (gif, tif).\n";
}

int main(int argc, char** argv)
{
    if (argc < 2) { print_usage(); return 0; }
    const std::string mode = argv[1];

    if      (mode == "correlate") return run_correlate(argc, argv);
    else if (mode == "classify")  return run_classify (argc, argv);
    else if (mode == "batch")     return run_batch    (argc, argv);
    else if (mode == "simulate")  return run_simulate (argc, argv);

    std::cout << "Unknown mode: " << mode << "\n";
    print_usage();
    return 2;
}
