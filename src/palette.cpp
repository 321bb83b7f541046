#include "palette.hpp"
#include "background.hpp"
#include "foreground.hpp"
#include "kmeans.hpp"
#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

Palette buildPalette(const cv::Mat& samples, const ShrinkOptions& options, RandomSource& rng)
{
	validateOptions(options);
	const int numColors = options.num_colors;

	cv::Vec3b bgColor = estimateBackgroundColor(samples, 6);
	cv::Mat fgMask = computeForegroundMask(bgColor, samples, options.value_threshold, options.sat_threshold);
	cv::Mat fgSamples = extractForeground(samples, fgMask);

	CV_LOG_INFO(NULL, "palette: background (" << (int)bgColor[0] << ", " << (int)bgColor[1] << ", "
		<< (int)bgColor[2] << "), " << fgSamples.rows << "/" << samples.total() << " foreground samples");

	// Slot 0 is the background, the rest default to mid-gray
	Palette palette(numColors, cv::Vec3b(128, 128, 128));
	palette[0] = bgColor;

	// A single-color palette only has room for the background
	const int k = numColors - 1;
	if (fgSamples.rows == 0) {
		CV_LOG_INFO(NULL, "palette: no foreground samples, using a gray palette");
	}
	else if (k > 0) {
		ClusterResult clusters = kmeansPlusPlus(fgSamples, k, options.kmeans_iter, rng);
		CV_LOG_INFO(NULL, "palette: k-means converged after " << clusters.iterations << " iterations");
		std::copy(clusters.centers.begin(), clusters.centers.end(), palette.begin() + 1);
	}

	if (options.saturate)
		palette = saturatePalette(palette);
	if (options.white_bg)
		palette = forceWhiteBackground(palette);

	return palette;
}

Palette saturatePalette(const Palette& palette)
{
	int pmin = 255;
	int pmax = 0;
	for (const cv::Vec3b& c : palette) {
		for (int d = 0; d < 3; ++d) {
			pmin = std::min(pmin, (int)c[d]);
			pmax = std::max(pmax, (int)c[d]);
		}
	}

	if (pmax <= pmin)
		return palette; // Flat palette, nothing to stretch

	Palette out(palette.size());
	const double range = pmax - pmin;
	for (size_t i = 0; i < palette.size(); ++i)
		for (int d = 0; d < 3; ++d)
			out[i][d] = cv::saturate_cast<uchar>(std::lround(255.0 * (palette[i][d] - pmin) / range));
	return out;
}

Palette forceWhiteBackground(const Palette& palette)
{
	Palette out = palette;
	if (!out.empty())
		out[0] = cv::Vec3b(255, 255, 255);
	return out;
}

cv::Mat expandIndices(const cv::Mat& indices, const Palette& palette)
{
	if (indices.empty())
		return cv::Mat(indices.size(), CV_8UC3);
	if (indices.type() != CV_8UC1)
		throw std::invalid_argument("expandIndices: expected a CV_8UC1 index buffer");

	cv::Mat out(indices.size(), CV_8UC3);
	for (int r = 0; r < indices.rows; ++r) {
		const uchar* in = indices.ptr<uchar>(r);
		cv::Vec3b* o = out.ptr<cv::Vec3b>(r);
		for (int c = 0; c < indices.cols; ++c) {
			if (static_cast<size_t>(in[c]) >= palette.size())
				throw std::invalid_argument("expandIndices: index outside the palette");
			o[c] = palette[in[c]];
		}
	}
	return out;
}
