#include "core/progress_parser.h"

#include <gtest/gtest.h>

using ngl::core::parse_progress_line;

TEST(ProgressParserTest, ComputesPercentOfTotal) {
  auto p = parse_progress_line("download:50/200");
  ASSERT_TRUE(p.has_value());
  EXPECT_DOUBLE_EQ(*p, 25.0);

  p = parse_progress_line("download:200/200");
  ASSERT_TRUE(p.has_value());
  EXPECT_DOUBLE_EQ(*p, 100.0);

  p = parse_progress_line("download:0/4096");
  ASSERT_TRUE(p.has_value());
  EXPECT_DOUBLE_EQ(*p, 0.0);
}

TEST(ProgressParserTest, ClampsOvershootToHundred) {
  auto p = parse_progress_line("download:300/200");
  ASSERT_TRUE(p.has_value());
  EXPECT_DOUBLE_EQ(*p, 100.0);
}

TEST(ProgressParserTest, AcceptsFractionalCountsAndBlanks) {
  auto p = parse_progress_line("download: 512.5 / 1025 \r");
  ASSERT_TRUE(p.has_value());
  EXPECT_DOUBLE_EQ(*p, 50.0);
}

TEST(ProgressParserTest, RejectsUnknownTotals) {
  EXPECT_FALSE(parse_progress_line("download:NA/NA").has_value());
  EXPECT_FALSE(parse_progress_line("download:1024/NA").has_value());
  EXPECT_FALSE(parse_progress_line("download:5/0").has_value());
  EXPECT_FALSE(parse_progress_line("download:5/").has_value());
}

TEST(ProgressParserTest, RejectsUnrelatedLines) {
  EXPECT_FALSE(parse_progress_line("").has_value());
  EXPECT_FALSE(parse_progress_line("download:").has_value());
  EXPECT_FALSE(
      parse_progress_line("[download]  42.0% of 3.50MiB at 1.2MiB/s")
          .has_value());
  EXPECT_FALSE(parse_progress_line("[ExtractAudio] Destination: a.mp3")
                   .has_value());
  EXPECT_FALSE(parse_progress_line(" download:50/200").has_value());
}

TEST(ProgressParserTest, RejectsTrailingGarbageAndExtraSeparators) {
  EXPECT_FALSE(parse_progress_line("download:50/200abc").has_value());
  EXPECT_FALSE(parse_progress_line("download:50/100/200").has_value());
  EXPECT_FALSE(parse_progress_line("download:inf/200").has_value());
  EXPECT_FALSE(parse_progress_line("download:nan/200").has_value());
}

TEST(ProgressParserTest, HonoursCustomMarker) {
  auto p = parse_progress_line("dl|1/4", "dl|");
  ASSERT_TRUE(p.has_value());
  EXPECT_DOUBLE_EQ(*p, 25.0);
  EXPECT_FALSE(parse_progress_line("download:1/4", "dl|").has_value());
}

TEST(ProgressParserTest, TemplateStartsWithMarker) {
  EXPECT_EQ(ngl::core::kProgressTemplate.substr(
                0, ngl::core::kProgressMarker.size()),
            ngl::core::kProgressMarker);
}
