#include "quantizer.hpp"
#include "quantizer_backends.hpp"
#include "foreground.hpp"
#include <limits>
#include <stdexcept>

int nearestPaletteIndex(const cv::Vec3b& rgb, const Palette& palette)
{
	int bestIdx = 0;
	int bestDist2 = std::numeric_limits<int>::max();
	// Integer distances: exact, so every backend breaks ties the same way
	for (int pi = 0; pi < (int)palette.size(); ++pi) {
		int d2 = 0;
		for (int d = 0; d < 3; ++d) {
			int diff = (int)rgb[d] - (int)palette[pi][d];
			d2 += diff * diff;
		}
		if (d2 < bestDist2) { bestDist2 = d2; bestIdx = pi; }
	}
	return bestIdx;
}

// Entry point to apply a palette to an image with different backends
QuantizedImage applyPalette(
	const cv::Mat& image,
	const Palette& palette,
	float value_threshold,
	float sat_threshold,
	Backend backend)
{
	if (palette.empty() || (int)palette.size() > kMaxPaletteColors)
		throw std::invalid_argument("applyPalette: palette must hold between 1 and 256 colors");
	if (!image.empty() && image.type() != CV_8UC3)
		throw std::invalid_argument("applyPalette: expected a CV_8UC3 image");

	QuantizedImage result;
	// Classified against slot 0 as it is now, which may be the forced white rather than the estimate
	result.foreground = computeForegroundMask(palette[0], image, value_threshold, sat_threshold);

	if (image.empty()) {
		result.indices = cv::Mat(image.size(), CV_8UC1);
		return result;
	}

	// Dispatch to the appropriate backend implementation
	switch (backend) {
	case BACKEND_SEQ:
		result.indices = assignIndices_seq(image, palette);
		break;
	case BACKEND_THR:
		result.indices = assignIndices_thr(image, palette);
		break;
	case BACKEND_THRPOOL:
		result.indices = assignIndices_thrpool(image, palette);
		break;
	default:
		throw std::invalid_argument("Unknown backend type in applyPalette");
	}

	return result;
}
