#include <gtest/gtest.h>

// This test ensures that every public header compiles cleanly when included
// together (common for downstream users).

#include "frameisa/cli/commands.hpp"
#include "frameisa/cli/options.hpp"
#include "frameisa/core/buffer.hpp"
#include "frameisa/core/errors.hpp"
#include "frameisa/core/types.hpp"
#include "frameisa/isa/action.hpp"
#include "frameisa/isa/decode_error.hpp"
#include "frameisa/isa/extended.hpp"
#include "frameisa/isa/instruction.hpp"
#include "frameisa/isa/isa.hpp"
#include "frameisa/isa/modifier.hpp"
#include "frameisa/isa/subject.hpp"
#include "frameisa/storage/hashing.hpp"

TEST(PublicHeaders, Compile) {
    SUCCEED();
}
