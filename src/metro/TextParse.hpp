#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace metro {

// Token parsers shared by the script runner and the command-line tools.
//
// Every parser consumes the whole token (no surrounding whitespace, no unit
// suffixes) and leaves its outputs untouched when it returns false.

// Decimal with an optional sign.
bool ParseInt(std::string_view s, int& out);

// Decimal or 0x-prefixed hex; no sign.
bool ParseSeed(std::string_view s, std::uint64_t& out);

// Rejects nan, inf and anything that overflows a double.
bool ParseFiniteDouble(std::string_view s, double& out);

// "48x32" (either case of x). Both sides must be within [1, kMaxMapDimension].
bool ParseMapSize(std::string_view s, int& outW, int& outH);

// "x,y" station vertex.
bool ParseVertexToken(std::string_view s, int& outX, int& outY);

// 0x-prefixed, zero-padded to 16 digits. ParseSeed reads it back.
std::string FormatHex64(std::uint64_t v);

} // namespace metro
