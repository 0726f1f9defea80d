#ifndef DICE_ENGINE_HPP
#define DICE_ENGINE_HPP

#include <cstdint>
#include <memory>
#include "dice/cast.hpp"

namespace dice {

class IEngine
{
public:
   virtual ~IEngine() = default;

   // Uniformly distributed value in [min, max], both inclusive.
   virtual uint32_t GenerateValue(uint32_t min, uint32_t max) = 0;
};

std::unique_ptr<IEngine> CreateUniformEngine();

std::unique_ptr<IEngine> CreateUniformEngine(uint32_t seed);

// Draws descriptor.GetCount() independent values in [1, descriptor.GetSides()], in roll order.
Rolls Roll(const Descriptor & descriptor, IEngine & engine);

} // namespace dice

#endif // DICE_ENGINE_HPP
