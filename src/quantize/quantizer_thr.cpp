#include "quantizer_backends.hpp"
#include "threadpool.hpp"
#include <thread>

// Assign palette indices (threaded implementation)
cv::Mat assignIndices_thr(const cv::Mat& image, const Palette& palette)
{
	cv::Mat indices(image.size(), CV_8UC1);

	std::vector<std::thread> workers;
	for (const RowRange& range : splitRows(image.rows, workerCount())) {
		// image and palette are shared read-only, each thread writes its own rows of 'indices'
		workers.emplace_back(processRows,
			std::cref(image), std::ref(indices),
			std::cref(palette),
			range.start, range.end);
	}

	for (auto& th : workers) th.join();

	return indices;
}
