#include "result.hpp"

namespace r3dact::engine {

const char* error_code_name(error_code code) noexcept {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::invalid_pattern:
    return "invalid_pattern";
  case error_code::invalid_encoding:
    return "invalid_encoding";
  }
  return "unknown";
}

} // namespace r3dact::engine
