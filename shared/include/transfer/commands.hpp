#pragma once

namespace transfer::commands {

inline constexpr const char* COPY = "copy";
inline constexpr const char* MOVE = "move";
inline constexpr const char* VERIFY = "verify";
inline constexpr const char* HELP = "help";

}
