#pragma once

// core engine
#include "engine/result.hpp"
#include "engine/pattern.hpp"
#include "engine/pattern_matcher.hpp"
#include "engine/redactor.hpp"
#include "engine/file_processor.hpp"

// utilities
#include "utils/hex_utils.hpp"
#include "utils/hex_pattern.hpp"
#include "utils/file_utils.hpp"
#include "utils/text_utils.hpp"

namespace r3dact {

inline constexpr const char* version = "0.1.0";

} // namespace r3dact
