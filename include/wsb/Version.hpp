#pragma once

namespace wsb {
inline constexpr const char* kVersion = "1.0.0";
}
