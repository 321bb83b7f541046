#include <gtest/gtest.h>
#include "../include/quantizer.hpp"
#include "../include/quantizer_backends.hpp"
#include <opencv2/opencv.hpp>

class QuantizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Odd-sized gradient, so row chunks do not divide evenly
        gradient_image = cv::Mat(37, 53, CV_8UC3);
        for (int r = 0; r < 37; ++r) {
            for (int c = 0; c < 53; ++c) {
                gradient_image.at<cv::Vec3b>(r, c) = cv::Vec3b(
                    static_cast<uchar>(r * 255 / 37),
                    static_cast<uchar>(c * 255 / 53),
                    static_cast<uchar>((r + c) * 255 / 90));
            }
        }

        page = cv::Mat(30, 30, CV_8UC3, cv::Scalar(255, 255, 255));
        cv::rectangle(page, cv::Point(0, 0), cv::Point(9, 9), cv::Scalar(0, 0, 0), -1);
        cv::rectangle(page, cv::Point(20, 20), cv::Point(29, 29), cv::Scalar(210, 20, 20), -1);

        palette = { cv::Vec3b(255, 255, 255), cv::Vec3b(0, 0, 0), cv::Vec3b(200, 0, 0), cv::Vec3b(0, 0, 200) };
    }

    cv::Mat gradient_image;
    cv::Mat page;
    Palette palette;
};

TEST_F(QuantizerTest, NearestPaletteIndex) {
    EXPECT_EQ(nearestPaletteIndex(cv::Vec3b(250, 250, 250), palette), 0);
    EXPECT_EQ(nearestPaletteIndex(cv::Vec3b(10, 5, 5), palette), 1);
    EXPECT_EQ(nearestPaletteIndex(cv::Vec3b(190, 20, 20), palette), 2);
}

TEST_F(QuantizerTest, TieGoesToLowestIndex) {
    Palette two = { cv::Vec3b(0, 0, 0), cv::Vec3b(20, 0, 0) };

    EXPECT_EQ(nearestPaletteIndex(cv::Vec3b(10, 0, 0), two), 0);
}

TEST_F(QuantizerTest, IndicesAndMaskShape) {
    QuantizedImage q = applyPalette(page, palette);

    EXPECT_EQ(q.indices.size(), page.size());
    EXPECT_EQ(q.indices.type(), CV_8UC1);
    EXPECT_EQ(q.foreground.size(), page.size());
    EXPECT_EQ(q.foreground.type(), CV_8UC1);

    EXPECT_EQ(q.indices.at<uchar>(5, 5), 1);
    EXPECT_EQ(q.indices.at<uchar>(25, 25), 2);
    EXPECT_EQ(q.indices.at<uchar>(15, 15), 0);

    EXPECT_EQ(q.foreground.at<uchar>(5, 5), 1);
    EXPECT_EQ(q.foreground.at<uchar>(15, 15), 0);
}

TEST_F(QuantizerTest, BackgroundPixelsAreNotForcedToSlotZero) {
    // Classified as background against slot 0, but closer to slot 1
    Palette near_white = { cv::Vec3b(255, 255, 255), cv::Vec3b(248, 248, 248) };
    cv::Mat image(2, 2, CV_8UC3, cv::Scalar(250, 250, 250));

    QuantizedImage q = applyPalette(image, near_white);

    EXPECT_EQ(q.foreground.at<uchar>(0, 0), 0);
    EXPECT_EQ(q.indices.at<uchar>(0, 0), 1);
}

TEST_F(QuantizerTest, MaskFollowsCurrentSlotZero) {
    // The same image classified against a dark slot 0 flips the mask
    Palette dark_first = { cv::Vec3b(0, 0, 0), cv::Vec3b(255, 255, 255) };
    QuantizedImage q = applyPalette(page, dark_first);

    EXPECT_EQ(q.foreground.at<uchar>(5, 5), 0);
    EXPECT_EQ(q.foreground.at<uchar>(15, 15), 1);
}

TEST_F(QuantizerTest, Idempotent) {
    QuantizedImage a = applyPalette(gradient_image, palette);
    QuantizedImage b = applyPalette(gradient_image, palette);

    EXPECT_EQ(cv::countNonZero(a.indices != b.indices), 0);
}

TEST_F(QuantizerTest, BackendsAgree) {
    QuantizedImage seq = applyPalette(gradient_image, palette, 0.25f, 0.20f, BACKEND_SEQ);
    QuantizedImage thr = applyPalette(gradient_image, palette, 0.25f, 0.20f, BACKEND_THR);
    QuantizedImage pool = applyPalette(gradient_image, palette, 0.25f, 0.20f, BACKEND_THRPOOL);

    EXPECT_EQ(cv::countNonZero(seq.indices != thr.indices), 0);
    EXPECT_EQ(cv::countNonZero(seq.indices != pool.indices), 0);
}

TEST_F(QuantizerTest, SingleRowImage) {
    cv::Mat row = gradient_image.row(3).clone();

    for (Backend backend : { BACKEND_SEQ, BACKEND_THR, BACKEND_THRPOOL }) {
        QuantizedImage q = applyPalette(row, palette, 0.25f, 0.20f, backend);
        EXPECT_EQ(q.indices.size(), row.size()) << "Backend failed: " << static_cast<int>(backend);
    }
}

TEST_F(QuantizerTest, SplitRowsCoversAllRows) {
    std::vector<RowRange> ranges = splitRows(10, 4);

    ASSERT_EQ(ranges.size(), 4u);
    EXPECT_EQ(ranges.front().start, 0);
    EXPECT_EQ(ranges.back().end, 10);
    for (size_t i = 1; i < ranges.size(); ++i)
        EXPECT_EQ(ranges[i].start, ranges[i - 1].end);

    // Never more ranges than rows
    EXPECT_EQ(splitRows(2, 8).size(), 2u);
    EXPECT_TRUE(splitRows(0, 8).empty());
}

TEST_F(QuantizerTest, InvalidArguments) {
    EXPECT_THROW(applyPalette(page, Palette()), std::invalid_argument);
    EXPECT_THROW(applyPalette(page, Palette(257, cv::Vec3b(0, 0, 0))), std::invalid_argument);
    EXPECT_THROW(applyPalette(cv::Mat::zeros(4, 4, CV_8UC1), palette), std::invalid_argument);
    EXPECT_THROW(applyPalette(page, palette, 0.25f, 0.20f, static_cast<Backend>(7)), std::invalid_argument);
}
