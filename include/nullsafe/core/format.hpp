#pragma once

#include <fmt/format.h>

namespace nullsafe::compat {
    using fmt::format;
}
