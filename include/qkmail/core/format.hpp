#pragma once
#include <fmt/core.h>
namespace qkmail::compat {
    using fmt::format;
}
