#include <doctest/doctest.h>

#include "domain/format_detector.hpp"

static const domain::FrameDimensions imx662 = { 1936, 1100 };

TEST_CASE("DOMAIN_FORMAT_DETECTOR-Exact_Sizes") {
    const domain::FormatDetector detector;
    REQUIRE_EQ(detector.GetToleranceBytes(), 1000);

    REQUIRE_EQ(detector.Detect(6388800, imx662), domain::FrameFormat::RGB888);
    REQUIRE_EQ(detector.Detect(2129600, imx662), domain::FrameFormat::RAW8);
    REQUIRE_EQ(detector.Detect(2662000, imx662), domain::FrameFormat::RAW10_PACKED_5_PER_4);
    REQUIRE_EQ(detector.Detect(3194400, imx662), domain::FrameFormat::RAW_PACKED_12_MSB_FIRST);
}

TEST_CASE("DOMAIN_FORMAT_DETECTOR-Tolerance") {
    const domain::FormatDetector detector;

    // a multipart part carries a trailing \r\n
    REQUIRE_EQ(detector.Detect(2662002, imx662), domain::FrameFormat::RAW10_PACKED_5_PER_4);
    REQUIRE_EQ(detector.Detect(2662000 + 999, imx662), domain::FrameFormat::RAW10_PACKED_5_PER_4);
    REQUIRE_EQ(detector.Detect(2662000 - 999, imx662), domain::FrameFormat::RAW10_PACKED_5_PER_4);
    // exactly the slack away is already out
    REQUIRE_FALSE(detector.Detect(2662000 + 1000, imx662).has_value());
    REQUIRE_FALSE(detector.Detect(2662000 - 1000, imx662).has_value());
    REQUIRE_FALSE(detector.Detect(2662000 + 1001, imx662).has_value());
    REQUIRE_FALSE(detector.Detect(0, imx662).has_value());

    const domain::FormatDetector strict(0);
    REQUIRE_EQ(strict.Detect(2662000, imx662), domain::FrameFormat::RAW10_PACKED_5_PER_4);
    REQUIRE_FALSE(strict.Detect(2662002, imx662).has_value());
}

TEST_CASE("DOMAIN_FORMAT_DETECTOR-Earlier_Candidate_Wins_A_Tie") {
    const domain::FormatDetector detector;

    // rgb565, raw10 in 16 bits and both unpacked raw12 layouts are all two bytes per pixel
    REQUIRE_EQ(detector.Detect(4259200, imx662), domain::FrameFormat::RGB565);
    // the two packed raw12 layouts share a size too
    REQUIRE_EQ(detector.Detect(3194400, imx662), domain::FrameFormat::RAW_PACKED_12_MSB_FIRST);

    const domain::FormatDetector raw_only(
        1000, { domain::FrameFormat::RAW_UNPACKED_12_MSB, domain::FrameFormat::RAW_PACKED_10 }
    );
    REQUIRE_EQ(raw_only.GetCandidates().size(), 2);
    REQUIRE_EQ(raw_only.GetCandidates().front(), domain::FrameFormat::RAW_PACKED_10);
    REQUIRE_EQ(raw_only.Detect(4259200, imx662), domain::FrameFormat::RAW_PACKED_10);
    REQUIRE_FALSE(raw_only.Detect(6388800, imx662).has_value());
}

TEST_CASE("DOMAIN_FORMAT_DETECTOR-Fallback") {
    const domain::FormatDetector detector;
    REQUIRE_EQ(
        detector.DetectOr(12345, imx662, domain::FrameFormat::RGB888), domain::FrameFormat::RGB888
    );
    REQUIRE_EQ(
        detector.DetectOr(2129600, imx662, domain::FrameFormat::RGB888), domain::FrameFormat::RAW8
    );
}

TEST_CASE("DOMAIN_FORMAT_DETECTOR-Skips_Formats_The_Width_Does_Not_Fit") {
    const domain::FormatDetector detector(0);
    // 6 pixels wide: a whole number of raw12 groups but not of raw10 groups
    const domain::FrameDimensions narrow = { 6, 2 };
    REQUIRE_FALSE(detector.Matches(domain::FrameFormat::RAW10_PACKED_5_PER_4, 15, narrow));
    REQUIRE(detector.Matches(domain::FrameFormat::RAW_PACKED_12_MSB_FIRST, 18, narrow));
    REQUIRE_EQ(detector.Detect(18, narrow), domain::FrameFormat::RAW_PACKED_12_MSB_FIRST);
    REQUIRE_FALSE(detector.Detect(18, { 0, 0 }).has_value());
}
