#include <iostream>
#include "core/application.hpp"
#include "dice/engine.hpp"
#include "utils/logger.hpp"

int main(int argc, char * argv[])
{
   const core::Environment env{
      std::cout,
      std::cerr,
      [](LogPriority minPriority) {
         return CreateLogger("diceroll", minPriority);
      },
      [](std::optional<uint32_t> seed) {
         return seed ? dice::CreateUniformEngine(*seed) : dice::CreateUniformEngine();
      },
   };
   return core::RunApplication(argc, argv, env);
}
