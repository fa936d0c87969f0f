#include "infra/qr_code.h"

#include <qrcodegen.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace ngl::infra {

using ngl::core::Error;
using ngl::core::ErrorKind;
using ngl::core::Result;

namespace {

qrcodegen::QrCode::Ecc to_library_ecc(QrEcc ecc) {
  switch (ecc) {
  case QrEcc::Low:
    return qrcodegen::QrCode::Ecc::LOW;
  case QrEcc::Medium:
    return qrcodegen::QrCode::Ecc::MEDIUM;
  case QrEcc::Quartile:
    return qrcodegen::QrCode::Ecc::QUARTILE;
  case QrEcc::High:
    return qrcodegen::QrCode::Ecc::HIGH;
  }
  return qrcodegen::QrCode::Ecc::MEDIUM;
}

} // namespace

QrCode::QrCode(int version, QrEcc ecc, std::vector<bool> modules)
    : version_(version), size_(version * 4 + 17), ecc_(ecc),
      modules_(std::move(modules)) {}

Result<QrCode, Error> QrCode::encode_text(std::string_view text, QrEcc ecc) {
  // Byte mode only: a URL would otherwise be split into mixed segments.
  const std::vector<std::uint8_t> bytes(text.begin(), text.end());
  try {
    const std::vector<qrcodegen::QrSegment> segments{
        qrcodegen::QrSegment::makeBytes(bytes)};
    const auto symbol =
        qrcodegen::QrCode::encodeSegments(segments, to_library_ecc(ecc),
                                          qrcodegen::QrCode::MIN_VERSION,
                                          qrcodegen::QrCode::MAX_VERSION, -1,
                                          /*boostEcl=*/false);
    const int size = symbol.getSize();
    std::vector<bool> modules(static_cast<std::size_t>(size) * size);
    for (int y = 0; y < size; y++) {
      for (int x = 0; x < size; x++) {
        modules[static_cast<std::size_t>(y) * size + x] = symbol.getModule(x, y);
      }
    }
    return Result<QrCode, Error>::Ok(
        QrCode(symbol.getVersion(), ecc, std::move(modules)));
  } catch (const std::length_error &e) {
    return Result<QrCode, Error>::Err(
        Error(ErrorKind::Encode, 0,
              std::string("Failed to generate QR code: ") + e.what(),
              {{"bytes", std::to_string(text.size())}}));
  }
}

bool QrCode::module(int x, int y) const {
  if (x < 0 || y < 0 || x >= size_ || y >= size_) {
    return false;
  }
  return modules_[static_cast<std::size_t>(y) * size_ + x];
}

std::string QrCode::render_half_blocks(int quiet_zone, bool invert) const {
  if (quiet_zone < 0) {
    quiet_zone = 0;
  }
  const int lo = -quiet_zone;
  const int hi = size_ + quiet_zone; // exclusive
  const auto ink = [&](int x, int y) {
    if (y >= hi) {
      return false; // below the last row of an odd-height image
    }
    return module(x, y) != invert;
  };

  std::string out;
  for (int y = lo; y < hi; y += 2) {
    for (int x = lo; x < hi; x++) {
      const bool top = ink(x, y);
      const bool bottom = ink(x, y + 1);
      if (top && bottom) {
        out += "█";
      } else if (top) {
        out += "▀";
      } else if (bottom) {
        out += "▄";
      } else {
        out += ' ';
      }
    }
    out += '\n';
  }
  return out;
}

} // namespace ngl::infra
