#pragma once
#include <opencv2/core.hpp>
#include <atomic>
#include <functional>
#include <string>
#include <vector>
#include "options.hpp"
#include "palette.hpp"
#include "quantizer.hpp"
#include "random_source.hpp"

// Output for one image: the index buffer and the palette it refers to
struct ShrinkResult {
	cv::Mat indices;
	Palette palette;
};

// Outcome of one image in a batch. When `ok` is false, `error` holds the reason and `result` is empty
struct PageOutcome {
	bool ok = false;
	std::string error;
	ShrinkResult result;
};

// Called with (current, total, message) at image granularity, in processing order
using ProgressCallback = std::function<void(int, int, const std::string&)>;

// Sample, build a palette and apply it to a single image
ShrinkResult shrinkImage(
	const cv::Mat& image,
	const ShrinkOptions& options,
	RandomSource& rng,
	Backend backend = BACKEND_SEQ
);

// Apply an already built (frozen) palette to a single image
ShrinkResult shrinkImageWithPalette(
	const cv::Mat& image,
	const Palette& palette,
	const ShrinkOptions& options,
	Backend backend = BACKEND_SEQ
);

// Build one palette shared by all images: sample each image, rebalance the samples so every image
// weighs the same, then run the palette builder once. Any failure aborts the whole construction.
Palette buildGlobalPalette(
	const std::vector<cv::Mat>& images,
	const ShrinkOptions& options,
	RandomSource& rng,
	const ProgressCallback& progress = nullptr
);

// Process a batch of images.
//
// Options are validated first (InvalidConfigurationError). Without global_palette every image gets
// its own palette and a failing image is reported in its PageOutcome while the rest continue.
// With global_palette a failure while building the shared palette is thrown to the caller.
// `cancel` is checked between images; once set, no further image is scheduled and the returned
// vector only holds the images processed so far.
std::vector<PageOutcome> shrinkBatch(
	const std::vector<cv::Mat>& images,
	const ShrinkOptions& options,
	RandomSource& rng,
	Backend backend = BACKEND_SEQ,
	const ProgressCallback& progress = nullptr,
	const std::atomic<bool>* cancel = nullptr
);
