#pragma once
#include <opencv2/core.hpp>
#include <vector>
#include "random_source.hpp"

// A sample set is an N x 1 CV_8UC3 matrix of RGB pixels. Positions carry no meaning,
// only the colors and how often they occur.

// Flatten an image (rows x cols, CV_8UC3) into a sample set holding every pixel in row-major order
cv::Mat toSampleSet(const cv::Mat& image);

// Draw a uniform random subset of pixels from the image, without replacement.
//
// Args:
//   image: input image (cv::Mat, CV_8UC3, RGB) or sample set
//   sample_fraction: fraction of pixels to keep, in (0, 1]
//   rng: random source used for the partial Fisher-Yates shuffle
//
// Returns:
//   A sample set with max(1, floor(numPixels * sample_fraction)) pixels,
//   or an empty (0 x 1) sample set when the image has no pixels.
cv::Mat samplePixels(const cv::Mat& image, double sample_fraction, RandomSource& rng);

// Merge per-image sample sets into one set where every image weighs roughly the same.
// Each set is strided down to at most round(totalPixels / numSets) pixels.
//
// Args:
//   sets: sample sets, one per image (empty sets are skipped)
//
// Returns:
//   The merged sample set, in input order
cv::Mat rebalanceSamples(const std::vector<cv::Mat>& sets);
