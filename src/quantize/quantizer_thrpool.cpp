#include "quantizer_backends.hpp"
#include "threadpool.hpp"

// Assign palette indices (threaded implementation, with pooling)
cv::Mat assignIndices_thrpool(const cv::Mat& image, const Palette& palette)
{
	cv::Mat indices(image.size(), CV_8UC1);

	ThreadPool& pool = getThreadPool();
	for (const RowRange& range : splitRows(image.rows, (unsigned int)pool.size())) {
		pool.enqueue([&image, &indices, &palette, range]() {
			processRows(image, indices, palette, range.start, range.end);
		});
	}

	pool.waitUntilEmpty();

	return indices;
}
