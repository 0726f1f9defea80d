#ifndef DICE_CAST_HPP
#define DICE_CAST_HPP

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace dice {

// A group of identical dice: count rolls of a die with faces 1..sides.
class Descriptor
{
public:
   enum : uint32_t
   {
      MIN_COUNT = 1U,
      MAX_COUNT = 1000000U,
      MIN_SIDES = 2U
   };

   // Throws std::invalid_argument unless MIN_COUNT <= count <= MAX_COUNT and sides >= MIN_SIDES.
   Descriptor(uint32_t count, uint32_t sides);

   uint32_t GetCount() const noexcept { return m_count; }
   uint32_t GetSides() const noexcept { return m_sides; }

   bool operator==(const Descriptor &) const = default;

private:
   uint32_t m_count;
   uint32_t m_sides;
};

using Rolls = std::vector<uint32_t>;

// Canonical "<count>d<sides>" form.
std::span<char> WriteAsText(const Descriptor & descriptor, std::span<char> dest);
std::string ToString(const Descriptor & descriptor);

} // namespace dice

#endif // DICE_CAST_HPP
