#include "quantizer_backends.hpp"
#include "quantizer.hpp"

// Assign palette indices (sequential implementation)
cv::Mat assignIndices_seq(const cv::Mat& image, const Palette& palette)
{
	cv::Mat indices(image.size(), CV_8UC1);
	processRows(image, indices, palette, 0, image.rows);
	return indices;
}

std::vector<RowRange> splitRows(int rows, unsigned int parts)
{
	std::vector<RowRange> ranges;
	if (rows <= 0) return ranges;
	if (parts == 0) parts = 1;
	if ((int)parts > rows) parts = rows; // No empty chunks on short images

	int chunkSize = rows / (int)parts;
	for (unsigned int t = 0; t < parts; ++t) {
		int rStart = (int)t * chunkSize;
		int rEnd = (t == parts - 1) ? rows : rStart + chunkSize; // Last worker takes the extra rows
		ranges.push_back({ rStart, rEnd });
	}
	return ranges;
}

// Worker function assigning indices for a range of rows (used by every backend)
void processRows(
	const cv::Mat& image,
	cv::Mat& indices,
	const Palette& palette,
	int rStart,
	int rEnd)
{
	const int cols = image.cols;

	for (int r = rStart; r < rEnd; ++r) {
		const cv::Vec3b* inRow = image.ptr<cv::Vec3b>(r);
		uchar* outRow = indices.ptr<uchar>(r);

		for (int c = 0; c < cols; ++c)
			outRow[c] = static_cast<uchar>(nearestPaletteIndex(inRow[c], palette));
	}
}
