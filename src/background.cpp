#include "background.hpp"
#include <stdexcept>
#include <unordered_map>
#include <vector>

uchar quantizeChannel(uchar value, int bits_per_channel)
{
	const int shift = 8 - bits_per_channel;
	const int halfbin = (1 << shift) >> 1;
	return static_cast<uchar>(((value >> shift) << shift) + halfbin);
}

static void checkBits(int bits_per_channel)
{
	if (bits_per_channel < 1 || bits_per_channel > 8)
		throw std::invalid_argument("bits per channel must be in [1, 8]");
}

cv::Mat quantizeColors(const cv::Mat& pixels, int bits_per_channel)
{
	checkBits(bits_per_channel);
	CV_Assert(pixels.depth() == CV_8U);

	cv::Mat out(pixels.size(), pixels.type());
	const int cols = pixels.cols * pixels.channels();
	for (int r = 0; r < pixels.rows; ++r) {
		const uchar* in = pixels.ptr<uchar>(r);
		uchar* o = out.ptr<uchar>(r);
		for (int c = 0; c < cols; ++c)
			o[c] = quantizeChannel(in[c], bits_per_channel);
	}
	return out;
}

uint32_t packRgb(const cv::Vec3b& rgb)
{
	return (static_cast<uint32_t>(rgb[0]) << 16) | (static_cast<uint32_t>(rgb[1]) << 8) | rgb[2];
}

cv::Vec3b unpackRgb(uint32_t packed)
{
	return cv::Vec3b(
		static_cast<uchar>((packed >> 16) & 0xff),
		static_cast<uchar>((packed >> 8) & 0xff),
		static_cast<uchar>(packed & 0xff));
}

// Find the modal color after reducing every channel to a few significant bits.
// Neighbouring shades of the same paper fall in the same bin, so the mode is the background.
cv::Vec3b estimateBackgroundColor(const cv::Mat& pixels, int bits_per_channel)
{
	checkBits(bits_per_channel);
	if (pixels.empty())
		throw std::invalid_argument("estimateBackgroundColor: empty input");
	if (pixels.type() != CV_8UC3)
		throw std::invalid_argument("estimateBackgroundColor: expected CV_8UC3 pixels");

	std::unordered_map<uint32_t, int> histogram;
	std::vector<uint32_t> order; // Keys in first-seen order, for a stable tie-break

	for (int r = 0; r < pixels.rows; ++r) {
		const cv::Vec3b* row = pixels.ptr<cv::Vec3b>(r);
		for (int c = 0; c < pixels.cols; ++c) {
			cv::Vec3b q(
				quantizeChannel(row[c][0], bits_per_channel),
				quantizeChannel(row[c][1], bits_per_channel),
				quantizeChannel(row[c][2], bits_per_channel));
			uint32_t key = packRgb(q);

			auto it = histogram.find(key);
			if (it == histogram.end()) {
				histogram.emplace(key, 1);
				order.push_back(key);
			}
			else {
				++it->second;
			}
		}
	}

	uint32_t best = order.front();
	int bestCount = 0;
	for (uint32_t key : order) {
		int count = histogram[key];
		if (count > bestCount) { bestCount = count; best = key; }
	}

	return unpackRgb(best);
}
