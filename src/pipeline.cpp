#include "pipeline.hpp"
#include "errors.hpp"
#include "sampler.hpp"
#include <opencv2/core/utils/logger.hpp>

ShrinkResult shrinkImageWithPalette(
	const cv::Mat& image,
	const Palette& palette,
	const ShrinkOptions& options,
	Backend backend)
{
	ShrinkResult result;
	result.palette = palette;
	result.indices = applyPalette(image, palette, options.value_threshold, options.sat_threshold, backend).indices;
	return result;
}

ShrinkResult shrinkImage(
	const cv::Mat& image,
	const ShrinkOptions& options,
	RandomSource& rng,
	Backend backend)
{
	validateOptions(options);
	if (image.empty())
		throw std::invalid_argument("shrinkImage: empty image");

	cv::Mat samples = samplePixels(image, options.sample_fraction, rng);
	Palette palette = buildPalette(samples, options, rng);
	return shrinkImageWithPalette(image, palette, options, backend);
}

Palette buildGlobalPalette(
	const std::vector<cv::Mat>& images,
	const ShrinkOptions& options,
	RandomSource& rng,
	const ProgressCallback& progress)
{
	validateOptions(options);
	if (images.empty())
		throw std::invalid_argument("buildGlobalPalette: no images");

	const int total = (int)images.size();
	std::vector<cv::Mat> perImage;
	perImage.reserve(images.size());

	for (int i = 0; i < total; ++i) {
		if (images[i].empty())
			throw std::invalid_argument("buildGlobalPalette: image " + std::to_string(i + 1) + " is empty");

		perImage.push_back(samplePixels(images[i], options.sample_fraction, rng));

		if (progress)
			progress(i + 1, total, "building global palette: " + std::to_string(i + 1) + "/" + std::to_string(total));
	}

	cv::Mat balanced = rebalanceSamples(perImage);
	CV_LOG_INFO(NULL, "global palette: " << balanced.rows << " balanced samples from " << total << " images");

	return buildPalette(balanced, options, rng);
}

std::vector<PageOutcome> shrinkBatch(
	const std::vector<cv::Mat>& images,
	const ShrinkOptions& options,
	RandomSource& rng,
	Backend backend,
	const ProgressCallback& progress,
	const std::atomic<bool>* cancel)
{
	validateOptions(options);

	std::vector<PageOutcome> outcomes;
	if (images.empty())
		return outcomes;

	// Built once and only read afterwards; a failure here aborts the batch
	Palette globalPalette;
	if (options.global_palette)
		globalPalette = buildGlobalPalette(images, options, rng, progress);

	const int total = (int)images.size();
	outcomes.reserve(images.size());

	for (int i = 0; i < total; ++i) {
		if (cancel && cancel->load()) {
			CV_LOG_INFO(NULL, "batch cancelled after " << i << " of " << total << " images");
			break;
		}

		PageOutcome outcome;
		try {
			outcome.result = options.global_palette
				? shrinkImageWithPalette(images[i], globalPalette, options, backend)
				: shrinkImage(images[i], options, rng, backend);
			outcome.ok = true;
		}
		catch (const std::exception& e) {
			// Reported per image, the remaining images still run
			outcome.error = e.what();
			CV_LOG_WARNING(NULL, "image " << (i + 1) << "/" << total << " failed: " << e.what());
		}
		outcomes.push_back(std::move(outcome));

		if (progress)
			progress(i + 1, total, "processing image " + std::to_string(i + 1) + "/" + std::to_string(total));
	}

	return outcomes;
}
