#pragma once
#include <opencv2/core.hpp>
#include "palette.hpp"

// Backend options for palette application
// Sequential (CPU), Threaded (one thread per core), Thread Pool (persistent workers reused across calls)
enum Backend { BACKEND_SEQ = 0, BACKEND_THR = 1, BACKEND_THRPOOL = 2 };

// Result of applying a palette to an image
// - `indices`: CV_8UC1, one palette index per pixel
// - `foreground`: CV_8UC1 mask (0/1) of the pixels classified against palette slot 0
struct QuantizedImage {
	cv::Mat indices;
	cv::Mat foreground;
};

// Map every pixel of an image to its nearest palette entry.
//
// The foreground mask is recomputed against palette[0], which is the forced white when the
// palette was built with white_bg. Every pixel, foreground or not, gets the palette entry
// nearest by Euclidean RGB distance (lowest index on ties).
//
// Args:
//   image: input image (cv::Mat, CV_8UC3, RGB)
//   palette: non-empty palette with at most 256 colors, read-only for the whole call
//   value_threshold, sat_threshold: same thresholds used to build the palette
//   backend: which backend assigns the indices (all backends give identical results)
QuantizedImage applyPalette(
	const cv::Mat& image,
	const Palette& palette,
	float value_threshold = 0.25f,
	float sat_threshold = 0.20f,
	Backend backend = BACKEND_SEQ
);

// Nearest palette index of a single color
int nearestPaletteIndex(const cv::Vec3b& rgb, const Palette& palette);
