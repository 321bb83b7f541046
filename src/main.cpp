#include "pipeline.hpp"
#include "errors.hpp"
#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

static const char* keys =
	"{help h usage ?   |           | print this message }"
	"{@input           |           | input image or glob pattern (e.g. \"pages/*.png\") }"
	"{n num_colors     | 8         | number of output colors, background included }"
	"{v value_threshold| 0.25      | background value threshold (0-1) }"
	"{s sat_threshold  | 0.20      | background saturation threshold (0-1) }"
	"{p sample_fraction| 0.05      | fraction of pixels sampled for the palette }"
	"{k kmeans_iter    | 40        | maximum number of k-means iterations }"
	"{no_saturate      |           | do not stretch the palette to the full range }"
	"{w white_bg       |           | make the background white }"
	"{g global_palette |           | use one palette for all images }"
	"{o output_dir     | .         | directory for the output images }"
	"{b basename       | processed_| output file name prefix }"
	"{seed             | -1        | random seed (-1 for a random run) }"
	"{backend          | seq       | index assignment backend: seq, thr or thrpool }"
	"{q quiet          |           | only print errors }"
	"{verbose          |           | print per-stage details }";

static Backend parseBackend(const std::string& name)
{
	if (name == "seq") return BACKEND_SEQ;
	if (name == "thr") return BACKEND_THR;
	if (name == "thrpool") return BACKEND_THRPOOL;
	throw InvalidConfigurationError("unknown backend '" + name + "' (expected seq, thr or thrpool)");
}

// Load an image as RGB. OpenCV decodes to BGR
static cv::Mat loadRgb(const std::string& path)
{
	cv::Mat bgr = cv::imread(path, cv::IMREAD_COLOR);
	if (bgr.empty())
		return bgr;

	cv::Mat rgb;
	cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
	return rgb;
}

static bool saveResult(const std::string& path, const ShrinkResult& result)
{
	cv::Mat bgr;
	cv::cvtColor(expandIndices(result.indices, result.palette), bgr, cv::COLOR_RGB2BGR);
	return cv::imwrite(path, bgr);
}

static std::string outputName(const std::string& dir, const std::string& basename, int idx)
{
	char number[16];
	std::snprintf(number, sizeof(number), "%04d", idx);
	return dir + "/" + basename + number + ".png";
}

int main(int argc, char** argv)
{
	cv::CommandLineParser parser(argc, argv, keys);
	parser.about("scanshrink: reduce scanned pages to a small color palette");

	const std::string input = parser.get<std::string>("@input");
	if (parser.has("help") || input.empty()) {
		parser.printMessage();
		return parser.has("help") ? 0 : 1;
	}

	ShrinkOptions options;
	options.num_colors = parser.get<int>("num_colors");
	options.value_threshold = parser.get<float>("value_threshold");
	options.sat_threshold = parser.get<float>("sat_threshold");
	options.sample_fraction = parser.get<double>("sample_fraction");
	options.kmeans_iter = parser.get<int>("kmeans_iter");
	options.saturate = !parser.has("no_saturate");
	options.white_bg = parser.has("white_bg");
	options.global_palette = parser.has("global_palette");

	const std::string outputDir = parser.get<std::string>("output_dir");
	const std::string basename = parser.get<std::string>("basename");
	const int seed = parser.get<int>("seed");
	const std::string backendName = parser.get<std::string>("backend");
	const bool quiet = parser.has("quiet");

	if (!parser.check()) {
		parser.printErrors();
		return 1;
	}

	// Keep OpenCV's own messages out of the console unless asked for
	cv::utils::logging::setLogLevel(quiet ? cv::utils::logging::LOG_LEVEL_SILENT
		: parser.has("verbose") ? cv::utils::logging::LOG_LEVEL_INFO
		: cv::utils::logging::LOG_LEVEL_WARNING);

	try {
		validateOptions(options);
		Backend backend = parseBackend(backendName);

		std::vector<cv::String> files;
		cv::glob(input, files, false);
		if (files.empty()) {
			std::cerr << "Error: no input matches '" << input << "'." << std::endl;
			return 1;
		}

		std::vector<cv::Mat> images;
		std::vector<std::string> loaded;
		for (const cv::String& f : files) {
			cv::Mat img = loadRgb(f);
			if (img.empty()) {
				std::cerr << "Warning: could not read " << f << ", skipped." << std::endl;
				continue;
			}
			images.push_back(img);
			loaded.push_back(f);
		}
		if (images.empty()) {
			std::cerr << "Error: none of the inputs could be read." << std::endl;
			return 1;
		}

		if (!quiet) {
			std::cout << "Shrinking " << images.size() << " image(s)" << std::endl;
			std::cout << "  colors: " << options.num_colors
				<< "  saturate: " << (options.saturate ? "yes" : "no")
				<< "  global palette: " << (options.global_palette ? "yes" : "no") << std::endl;
		}

		MersenneRandomSource rng = seed >= 0 ? MersenneRandomSource(static_cast<uint32_t>(seed))
			: MersenneRandomSource();

		ProgressCallback progress;
		if (!quiet) {
			progress = [](int current, int total, const std::string& message) {
				std::cout << "  [" << current << "/" << total << "] " << message << std::endl;
			};
		}

		std::vector<PageOutcome> outcomes = shrinkBatch(images, options, rng, backend, progress);

		int failures = 0;
		for (size_t i = 0; i < outcomes.size(); ++i) {
			if (!outcomes[i].ok) {
				std::cerr << "Error: " << loaded[i] << ": " << outcomes[i].error << std::endl;
				++failures;
				continue;
			}

			std::string out = outputName(outputDir, basename, (int)i);
			if (!saveResult(out, outcomes[i].result)) {
				std::cerr << "Error: could not write " << out << std::endl;
				++failures;
				continue;
			}
			if (!quiet)
				std::cout << "  " << loaded[i] << " -> " << out << std::endl;
		}

		return failures == 0 ? 0 : 1;
	}
	catch (const std::exception& e) {
		std::cerr << "Error: " << e.what() << std::endl;
		return 1;
	}
}
