#include "dice/cast.hpp"

#include <stdexcept>
#include "utils/format.hpp"

namespace dice {

Descriptor::Descriptor(uint32_t count, uint32_t sides)
   : m_count(count)
   , m_sides(sides)
{
   if (count < MIN_COUNT)
      throw std::invalid_argument("count must be greater than 0");
   if (count > MAX_COUNT)
      throw std::invalid_argument("count must not exceed 1000000");
   if (sides < MIN_SIDES)
      throw std::invalid_argument("sides must be greater than 1");
}

std::span<char> WriteAsText(const Descriptor & descriptor, std::span<char> dest)
{
   return fmt::Format(dest, "{}d{}", descriptor.GetCount(), descriptor.GetSides());
}

std::string ToString(const Descriptor & descriptor)
{
   return fmt::ToString<32>("{}", descriptor);
}

} // namespace dice
