#pragma once

#include "core/error.h"
#include "core/result.h"

#include <string>
#include <string_view>
#include <vector>

namespace ngl::infra {

/// Error correction level. Medium recovers about 15% of codewords.
enum class QrEcc { Low, Medium, Quartile, High };

/// Module matrix of a QR symbol produced by qrcodegen, plus the terminal
/// renderer used for the transfer display code.
class QrCode {
public:
  /// Smallest version that fits `text` in byte mode at `ecc`.
  /// Err(Encode) when the payload exceeds version 40 capacity.
  static ngl::core::Result<QrCode, ngl::core::Error>
  encode_text(std::string_view text, QrEcc ecc = QrEcc::Medium);

  [[nodiscard]] int version() const { return version_; }
  [[nodiscard]] int size() const { return size_; }
  [[nodiscard]] QrEcc ecc() const { return ecc_; }

  /// True for a dark module; coordinates outside the symbol are light.
  [[nodiscard]] bool module(int x, int y) const;

  /// Two modules per character cell (upper and lower half blocks), with a
  /// `quiet_zone` light border. `invert` paints light modules with ink so
  /// the code reads correctly on dark terminal backgrounds.
  [[nodiscard]] std::string render_half_blocks(int quiet_zone = 4,
                                               bool invert = true) const;

private:
  QrCode(int version, QrEcc ecc, std::vector<bool> modules);

  int version_;
  int size_;
  QrEcc ecc_;
  std::vector<bool> modules_; // row-major, size_ * size_
};

} // namespace ngl::infra
