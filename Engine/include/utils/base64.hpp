#pragma once

#include <core/types.hpp>
#include <string>

namespace Stonetrail {

std::string base64_encode(const Bytes& data);

// Throws std::invalid_argument on characters outside the standard alphabet.
Bytes base64_decode(const std::string& text);

} // namespace Stonetrail
