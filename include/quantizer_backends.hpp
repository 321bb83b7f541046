#pragma once
#include <opencv2/core.hpp>
#include <vector>
#include "palette.hpp"

// Index assignment backends (see src/quantize/quantizer_seq.cpp, quantizer_thr.cpp, quantizer_thrpool.cpp).
// Each takes an RGB image (CV_8UC3) and a palette and returns a CV_8UC1 index buffer.

cv::Mat assignIndices_seq(const cv::Mat& image, const Palette& palette);

cv::Mat assignIndices_thr(const cv::Mat& image, const Palette& palette);

cv::Mat assignIndices_thrpool(const cv::Mat& image, const Palette& palette);

// Half-open range of image rows handled by one worker
struct RowRange {
	int start;
	int end;
};

// Split `rows` into at most `parts` contiguous, non-empty ranges. The last range takes the remainder
std::vector<RowRange> splitRows(int rows, unsigned int parts);

// Worker function assigning indices for rows [rStart, rEnd). Shared by the threaded backends
void processRows(
	const cv::Mat& image,
	cv::Mat& indices,
	const Palette& palette,
	int rStart,
	int rEnd
);
