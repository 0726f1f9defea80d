#ifndef DICE_NOTATION_HPP
#define DICE_NOTATION_HPP

#include <string_view>
#include "dice/cast.hpp"
#include "dice/error.hpp"

namespace dice {

// Parses "<count>?d<sides>", e.g. "3d6" or "d20". Count defaults to 1.
// Throws ParseError: MALFORMED_TOKEN when the token does not match the
// grammar or a number overflows, INVALID_DESCRIPTOR when count < 1 or sides < 2.
Descriptor ParseDescriptor(std::string_view token);

} // namespace dice

#endif // DICE_NOTATION_HPP
