#include "core/job.h"

namespace ngl::core {

const char *to_string(OutputStream stream) {
  switch (stream) {
  case OutputStream::Stdout:
    return "stdout";
  case OutputStream::Stderr:
    return "stderr";
  }
  return "unknown";
}

} // namespace ngl::core
