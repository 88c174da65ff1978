#pragma once
#include "pathsweep/classify/PathClassifier.hpp"
#include "pathsweep/core/Config.hpp"

#include <opencv2/core.hpp>
#include <string>

/*
  Helpers shared by the CLI modes.
*/

/* Build a pipeline Config from the common options:
   --margin --method --degenerate --skip-bad --threads
   --region --stride --block --threshold --turns
   Unknown enum values throw std::invalid_argument. */
pathsweep::Config configFromArgs(int argc, char** argv);

/* Prepare an image for on-screen display.
   - If input is 8-bit grayscale, stretch contrast to [0..255].
   - For other types, return a clone without changes. */
cv::Mat displayize(const cv::Mat& src8u);

/* Show a sequence frame by frame in a window (Esc/q stops).
   Frames are upscaled by 'zoom' with nearest-neighbour. */
void view_sequence(const pathsweep::Sequence& seq, const std::string& title,
                   int delayMs, int zoom);

/* Print the per-frame peaks, jumps and the verdict of a PathAnalysis. */
void print_analysis(const std::string& tag, const pathsweep::PathAnalysis& a,
                    const pathsweep::Config& cfg, bool verbose);
