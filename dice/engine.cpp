#include "dice/engine.hpp"

#include <random>

using namespace dice;

namespace {

class UniformEngine : public IEngine
{
public:
   UniformEngine()
      : m_generator(std::random_device()())
   {}
   explicit UniformEngine(uint32_t seed)
      : m_generator(seed)
   {}
   uint32_t GenerateValue(uint32_t min, uint32_t max) override
   {
      std::uniform_int_distribution<uint32_t> dist(min, max);
      return dist(m_generator);
   }

private:
   std::mt19937 m_generator;
};

} // namespace

namespace dice {

std::unique_ptr<IEngine> CreateUniformEngine()
{
   return std::make_unique<UniformEngine>();
}

std::unique_ptr<IEngine> CreateUniformEngine(uint32_t seed)
{
   return std::make_unique<UniformEngine>(seed);
}

Rolls Roll(const Descriptor & descriptor, IEngine & engine)
{
   Rolls rolls(descriptor.GetCount());
   for (auto & value : rolls) {
      value = engine.GenerateValue(1U, descriptor.GetSides());
   }
   return rolls;
}

} // namespace dice
