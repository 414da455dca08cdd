#pragma once

#include "frameisa/isa/action.hpp"
#include "frameisa/isa/decode_error.hpp"
#include "frameisa/isa/extended.hpp"
#include "frameisa/isa/instruction.hpp"
#include "frameisa/isa/modifier.hpp"
#include "frameisa/isa/subject.hpp"

namespace frameisa::isa {
    inline constexpr const char* kIsaVersion = "0.1.0";
} // namespace frameisa::isa
