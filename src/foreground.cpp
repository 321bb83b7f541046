#include "foreground.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

SatVal rgbToSatVal(const cv::Vec3b& rgb)
{
	const int cmax = std::max({ rgb[0], rgb[1], rgb[2] });
	const int cmin = std::min({ rgb[0], rgb[1], rgb[2] });

	SatVal sv;
	sv.value = cmax / 255.0f;
	sv.saturation = cmax == 0 ? 0.0f : (cmax - cmin) / 255.0f / sv.value;
	return sv;
}

cv::Mat computeForegroundMask(
	const cv::Vec3b& bg_color,
	const cv::Mat& pixels,
	float value_threshold,
	float sat_threshold)
{
	if (pixels.empty())
		return cv::Mat(pixels.size(), CV_8UC1);
	if (pixels.type() != CV_8UC3)
		throw std::invalid_argument("computeForegroundMask: expected CV_8UC3 pixels");

	const SatVal bg = rgbToSatVal(bg_color);
	cv::Mat mask(pixels.size(), CV_8UC1);

	for (int r = 0; r < pixels.rows; ++r) {
		const cv::Vec3b* in = pixels.ptr<cv::Vec3b>(r);
		uchar* out = mask.ptr<uchar>(r);
		for (int c = 0; c < pixels.cols; ++c) {
			SatVal sv = rgbToSatVal(in[c]);
			float valDiff = std::fabs(bg.value - sv.value);
			float satDiff = std::fabs(bg.saturation - sv.saturation);
			// Diverging in either channel is enough
			out[c] = (valDiff >= value_threshold || satDiff >= sat_threshold) ? 1 : 0;
		}
	}

	return mask;
}

cv::Mat extractForeground(const cv::Mat& pixels, const cv::Mat& mask)
{
	if (pixels.empty() && mask.empty())
		return cv::Mat(0, 1, CV_8UC3);
	if (pixels.type() != CV_8UC3 || mask.type() != CV_8UC1 || pixels.size() != mask.size())
		throw std::invalid_argument("extractForeground: mask must be CV_8UC1 with the shape of the pixels");

	cv::Mat fg(cv::countNonZero(mask), 1, CV_8UC3);
	int idx = 0;
	for (int r = 0; r < pixels.rows; ++r) {
		const cv::Vec3b* in = pixels.ptr<cv::Vec3b>(r);
		const uchar* m = mask.ptr<uchar>(r);
		for (int c = 0; c < pixels.cols; ++c)
			if (m[c]) fg.at<cv::Vec3b>(idx++) = in[c];
	}
	return fg;
}
