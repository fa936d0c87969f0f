#include "infra/qr_code.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

using ngl::core::ErrorKind;
using ngl::infra::QrCode;
using ngl::infra::QrEcc;

namespace {

// Reads the 15 format bits stored around the top-left finder.
int read_format_bits(const QrCode &qr) {
  int bits = 0;
  for (int i = 0; i <= 5; i++) {
    bits |= static_cast<int>(qr.module(8, i)) << i;
  }
  bits |= static_cast<int>(qr.module(8, 7)) << 6;
  bits |= static_cast<int>(qr.module(8, 8)) << 7;
  bits |= static_cast<int>(qr.module(7, 8)) << 8;
  for (int i = 9; i < 15; i++) {
    bits |= static_cast<int>(qr.module(14 - i, 8)) << i;
  }
  return bits;
}

// Same 15 bits, read from the copy split across the other two finders.
int read_format_bits_copy(const QrCode &qr) {
  const int size = qr.size();
  int bits = 0;
  for (int i = 0; i < 8; i++) {
    bits |= static_cast<int>(qr.module(size - 1 - i, 8)) << i;
  }
  for (int i = 8; i < 15; i++) {
    bits |= static_cast<int>(qr.module(8, size - 15 + i)) << i;
  }
  return bits;
}

std::size_t count_code_points(const std::string &utf8) {
  std::size_t n = 0;
  for (unsigned char c : utf8) {
    if ((c & 0xC0) != 0x80) {
      ++n;
    }
  }
  return n;
}

void expect_finder_at(const QrCode &qr, int x0, int y0) {
  for (int dy = 0; dy < 7; dy++) {
    for (int dx = 0; dx < 7; dx++) {
      const bool ring = dx == 0 || dx == 6 || dy == 0 || dy == 6;
      const bool core = dx >= 2 && dx <= 4 && dy >= 2 && dy <= 4;
      EXPECT_EQ(qr.module(x0 + dx, y0 + dy), ring || core)
          << "finder at " << x0 << "," << y0 << " module " << dx << "," << dy;
    }
  }
}

} // namespace

TEST(QrCodeTest, ShortTextFitsVersionOne) {
  auto result = QrCode::encode_text("hello");
  ASSERT_TRUE(result.is_ok());
  const QrCode &qr = result.value();
  EXPECT_EQ(qr.version(), 1);
  EXPECT_EQ(qr.size(), 21);
  EXPECT_EQ(qr.ecc(), QrEcc::Medium);
}

TEST(QrCodeTest, TransferUrlPicksSmallestVersion) {
  // 25 bytes: over the 14-byte version 1 limit, within version 2.
  auto result = QrCode::encode_text("http://192.168.1.20:54321");
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value().version(), 2);
  EXPECT_EQ(result.value().size(), 25);
}

TEST(QrCodeTest, FunctionPatternsArePresent) {
  auto result = QrCode::encode_text("http://10.0.0.7:40123");
  ASSERT_TRUE(result.is_ok());
  const QrCode &qr = result.value();
  const int size = qr.size();

  expect_finder_at(qr, 0, 0);
  expect_finder_at(qr, size - 7, 0);
  expect_finder_at(qr, 0, size - 7);

  for (int i = 8; i < size - 8; i++) {
    EXPECT_EQ(qr.module(i, 6), i % 2 == 0) << "row timing at " << i;
    EXPECT_EQ(qr.module(6, i), i % 2 == 0) << "column timing at " << i;
  }
  EXPECT_TRUE(qr.module(8, size - 8));
}

TEST(QrCodeTest, FormatBitsEncodeLevel) {
  for (QrEcc ecc : {QrEcc::Low, QrEcc::Medium, QrEcc::Quartile, QrEcc::High}) {
    auto result = QrCode::encode_text("nightingale", ecc);
    ASSERT_TRUE(result.is_ok());
    const QrCode &qr = result.value();

    const int raw = read_format_bits(qr);
    EXPECT_EQ(raw, read_format_bits_copy(qr));
    const int data = (raw ^ 0x5412) >> 10;
    const int level = data >> 3;
    switch (ecc) {
    case QrEcc::Low:
      EXPECT_EQ(level, 1);
      break;
    case QrEcc::Medium:
      EXPECT_EQ(level, 0);
      break;
    case QrEcc::Quartile:
      EXPECT_EQ(level, 3);
      break;
    case QrEcc::High:
      EXPECT_EQ(level, 2);
      break;
    }
  }
}

TEST(QrCodeTest, LargeVersionsCarryVersionInformation) {
  // Past the version 6 limit so the version blocks are drawn.
  auto result = QrCode::encode_text(std::string(200, 'a'));
  ASSERT_TRUE(result.is_ok());
  const QrCode &qr = result.value();
  ASSERT_GE(qr.version(), 7);
  EXPECT_EQ(qr.size(), qr.version() * 4 + 17);

  int bits = 0;
  for (int i = 0; i < 18; i++) {
    bits |= static_cast<int>(qr.module(qr.size() - 11 + i % 3, i / 3)) << i;
  }
  EXPECT_EQ(bits >> 12, qr.version());
}

TEST(QrCodeTest, OversizedPayloadIsEncodeError) {
  auto result = QrCode::encode_text(std::string(3000, 'x'));
  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().kind, ErrorKind::Encode);
  EXPECT_NE(result.error().message.find("Failed to generate QR code"),
            std::string::npos);

  auto at_limit = QrCode::encode_text(std::string(2331, 'x'));
  ASSERT_TRUE(at_limit.is_ok());
  EXPECT_EQ(at_limit.value().version(), 40);
  EXPECT_TRUE(QrCode::encode_text(std::string(2332, 'x')).is_err());
}

TEST(QrCodeTest, EncodingIsDeterministic) {
  auto a = QrCode::encode_text("http://192.168.0.2:8080");
  auto b = QrCode::encode_text("http://192.168.0.2:8080");
  ASSERT_TRUE(a.is_ok());
  ASSERT_TRUE(b.is_ok());
  EXPECT_EQ(a.value().render_half_blocks(), b.value().render_half_blocks());
}

TEST(QrCodeTest, OutsideSymbolIsLight) {
  auto result = QrCode::encode_text("x");
  ASSERT_TRUE(result.is_ok());
  EXPECT_FALSE(result.value().module(-1, 0));
  EXPECT_FALSE(result.value().module(0, result.value().size()));
}

TEST(QrCodeTest, HalfBlockRenderingDimensions) {
  auto result = QrCode::encode_text("hello");
  ASSERT_TRUE(result.is_ok());
  const std::string text = result.value().render_half_blocks();

  std::vector<std::string> lines;
  std::istringstream in(text);
  for (std::string line; std::getline(in, line);) {
    lines.push_back(line);
  }
  // 21 modules + 2 * 4 quiet zone = 29 rows, two per line.
  ASSERT_EQ(lines.size(), 15u);
  for (const auto &line : lines) {
    EXPECT_EQ(count_code_points(line), 29u);
  }
  // The inverted quiet zone is solid ink.
  EXPECT_EQ(lines.front().substr(0, 3), "█");
}

TEST(QrCodeTest, NonInvertedQuietZoneIsBlank) {
  auto result = QrCode::encode_text("hello");
  ASSERT_TRUE(result.is_ok());
  const std::string text = result.value().render_half_blocks(2, false);
  const auto first_line = text.substr(0, text.find('\n'));
  EXPECT_EQ(first_line, std::string(25, ' '));
}
