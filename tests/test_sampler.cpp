#include <gtest/gtest.h>
#include "../include/sampler.hpp"
#include "../include/errors.hpp"
#include "scripted_random.hpp"
#include <opencv2/opencv.hpp>
#include <set>

class SamplerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Every pixel has a distinct color encoding its row-major index
        indexed_image = cv::Mat(30, 40, CV_8UC3);
        for (int r = 0; r < 30; ++r) {
            for (int c = 0; c < 40; ++c) {
                int i = r * 40 + c;
                indexed_image.at<cv::Vec3b>(r, c) = cv::Vec3b(static_cast<uchar>(i % 256), static_cast<uchar>(i / 256), 7);
            }
        }

        // Five pixels in a row: (0,0,0), (10,0,0), ..., (40,0,0)
        row_image = cv::Mat(1, 5, CV_8UC3);
        for (int c = 0; c < 5; ++c)
            row_image.at<cv::Vec3b>(0, c) = cv::Vec3b(static_cast<uchar>(c * 10), 0, 0);
    }

    static int decode(const cv::Vec3b& p) { return p[0] + 256 * p[1]; }

    static cv::Mat makeSet(int n, int offset) {
        cv::Mat s(n, 1, CV_8UC3);
        for (int i = 0; i < n; ++i) {
            int v = i + offset;
            s.at<cv::Vec3b>(i) = cv::Vec3b(static_cast<uchar>(v % 256), static_cast<uchar>(v / 256), 0);
        }
        return s;
    }

    cv::Mat indexed_image;
    cv::Mat row_image;
};

TEST_F(SamplerTest, ToSampleSetFlattensRowMajor) {
    cv::Mat set = toSampleSet(indexed_image);

    EXPECT_EQ(set.rows, 1200);
    EXPECT_EQ(set.cols, 1);
    EXPECT_EQ(set.type(), CV_8UC3);
    EXPECT_EQ(decode(set.at<cv::Vec3b>(0)), 0);
    EXPECT_EQ(decode(set.at<cv::Vec3b>(41)), 41);
    EXPECT_EQ(decode(set.at<cv::Vec3b>(1199)), 1199);
}

TEST_F(SamplerTest, SampleCountFollowsFraction) {
    MersenneRandomSource rng(1);

    EXPECT_EQ(samplePixels(indexed_image, 0.05, rng).rows, 60);
    EXPECT_EQ(samplePixels(indexed_image, 0.5, rng).rows, 600);
    EXPECT_EQ(samplePixels(indexed_image, 1.0, rng).rows, 1200);
}

TEST_F(SamplerTest, SampleCountUsesDecimalFraction) {
    MersenneRandomSource rng(4);
    cv::Mat ten(1, 10, CV_8UC3, cv::Scalar(1, 2, 3));
    cv::Mat thousand(1, 1000, CV_8UC3, cv::Scalar(1, 2, 3));

    // 0.7 and 0.9 are not representable in single precision
    EXPECT_EQ(samplePixels(ten, 0.7, rng).rows, 7);
    EXPECT_EQ(samplePixels(thousand, 0.9, rng).rows, 900);
    EXPECT_EQ(samplePixels(indexed_image, 0.7, rng).rows, 840);
}

TEST_F(SamplerTest, SeededSourceIsReproducible) {
    MersenneRandomSource first = MersenneRandomSource(42);
    MersenneRandomSource second(42);

    cv::Mat a = samplePixels(indexed_image, 0.1, first);
    cv::Mat b = samplePixels(indexed_image, 0.1, second);
    ASSERT_EQ(a.rows, 120);
    EXPECT_EQ(cv::norm(a, b, cv::NORM_INF), 0.0);
}

TEST_F(SamplerTest, AtLeastOneSample) {
    MersenneRandomSource rng(2);

    cv::Mat samples = samplePixels(row_image, 0.01, rng);
    EXPECT_EQ(samples.rows, 1);
}

TEST_F(SamplerTest, SamplesWithoutReplacement) {
    MersenneRandomSource rng(3);
    cv::Mat samples = samplePixels(indexed_image, 1.0, rng);

    std::set<int> seen;
    for (int i = 0; i < samples.rows; ++i)
        seen.insert(decode(samples.at<cv::Vec3b>(i)));

    EXPECT_EQ(seen.size(), 1200u);
}

TEST_F(SamplerTest, PartialShuffleWithScriptedSource) {
    ScriptedRandomSource rng;
    // Always swap with the last remaining position
    rng.indices = { 4, 3 };

    cv::Mat samples = samplePixels(row_image, 0.4, rng);

    ASSERT_EQ(samples.rows, 2);
    EXPECT_EQ(samples.at<cv::Vec3b>(0), cv::Vec3b(40, 0, 0));
    EXPECT_EQ(samples.at<cv::Vec3b>(1), cv::Vec3b(0, 0, 0));
}

TEST_F(SamplerTest, IdentityDrawTakesPrefix) {
    ScriptedRandomSource rng; // Always 0: every position swaps with itself

    cv::Mat samples = samplePixels(row_image, 0.6, rng);

    ASSERT_EQ(samples.rows, 3);
    EXPECT_EQ(samples.at<cv::Vec3b>(0), cv::Vec3b(0, 0, 0));
    EXPECT_EQ(samples.at<cv::Vec3b>(1), cv::Vec3b(10, 0, 0));
    EXPECT_EQ(samples.at<cv::Vec3b>(2), cv::Vec3b(20, 0, 0));
}

TEST_F(SamplerTest, EmptyImageGivesEmptySet) {
    MersenneRandomSource rng(4);
    cv::Mat samples = samplePixels(cv::Mat(), 0.5, rng);

    EXPECT_EQ(samples.rows, 0);
}

TEST_F(SamplerTest, RejectsInvalidFraction) {
    MersenneRandomSource rng(5);

    EXPECT_THROW(samplePixels(indexed_image, 0.0, rng), InvalidConfigurationError);
    EXPECT_THROW(samplePixels(indexed_image, -0.1, rng), InvalidConfigurationError);
    EXPECT_THROW(samplePixels(indexed_image, 1.5, rng), InvalidConfigurationError);
}

TEST_F(SamplerTest, RebalanceCapsEachSet) {
    std::vector<cv::Mat> sets = { makeSet(100, 0), makeSet(20, 1000) };

    // 120 pixels over 2 sets: at most 60 per set
    cv::Mat merged = rebalanceSamples(sets);

    ASSERT_EQ(merged.rows, 80);
    EXPECT_EQ(decode(merged.at<cv::Vec3b>(0)), 0);
    EXPECT_EQ(decode(merged.at<cv::Vec3b>(59)), 59);
    EXPECT_EQ(decode(merged.at<cv::Vec3b>(60)), 1000);
    EXPECT_EQ(decode(merged.at<cv::Vec3b>(79)), 1019);
}

TEST_F(SamplerTest, RebalanceStridesLargeSets) {
    std::vector<cv::Mat> sets = { makeSet(900, 0), makeSet(50, 2000), makeSet(50, 3000) };

    // Target is 333 per set; the large set is strided by 2
    cv::Mat merged = rebalanceSamples(sets);

    ASSERT_EQ(merged.rows, 333 + 50 + 50);
    EXPECT_EQ(decode(merged.at<cv::Vec3b>(1)), 2);
    EXPECT_EQ(decode(merged.at<cv::Vec3b>(332)), 664);
    EXPECT_EQ(decode(merged.at<cv::Vec3b>(333)), 2000);
}

TEST_F(SamplerTest, RebalanceEmptyInputs) {
    EXPECT_EQ(rebalanceSamples({}).rows, 0);
    EXPECT_EQ(rebalanceSamples({ cv::Mat(), cv::Mat(0, 1, CV_8UC3) }).rows, 0);
}
