#pragma once
#include <opencv2/core.hpp>
#include <vector>
#include "options.hpp"
#include "random_source.hpp"

// Ordered list of RGB colors. Slot 0 is the background, slots 1.. are cluster centroids
// in the order the clusterer found them
using Palette = std::vector<cv::Vec3b>;

// Build a palette of exactly options.num_colors colors from a sample set.
//   1) estimate the background color (slot 0)
//   2) keep the samples that differ from it (foreground)
//   3) cluster the foreground into num_colors - 1 centroids (slots 1..)
//   4) optional post-processing: saturatePalette, then forceWhiteBackground
// With no foreground samples the clustering is skipped and slots 1.. are mid-gray (128, 128, 128).
//
// Throws:
//   InsufficientSamplesError when there are fewer foreground samples than centroids to find
Palette buildPalette(const cv::Mat& samples, const ShrinkOptions& options, RandomSource& rng);

// Linear contrast stretch using the global min and max over every byte of the palette.
// A flat palette (max == min) is returned unchanged
Palette saturatePalette(const Palette& palette);

// Replace slot 0 with (255, 255, 255)
Palette forceWhiteBackground(const Palette& palette);

// Turn an index buffer (CV_8UC1) back into an RGB image (CV_8UC3) by palette lookup
cv::Mat expandIndices(const cv::Mat& indices, const Palette& palette);
