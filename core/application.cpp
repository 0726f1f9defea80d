#include "core/application.hpp"

#include <exception>
#include "core/options.hpp"
#include "dice/engine.hpp"

namespace core {

ExitCode RunApplication(int argc, const char * const argv[], const Environment & env)
{
   const std::string programName = argc > 0 ? argv[0] : "diceroll";
   std::unique_ptr<ILogger> logger = env.loggerBuilder(LogPriority::INFO);
   try {
      Options opts;
      try {
         opts = ParseOptions(argc, argv);
      }
      catch (const UsageError & e) {
         logger->Write(LogPriority::ERROR, e.what());
         env.err << GetUsage(programName);
         return ExitCode::INVALID_INPUT;
      }
      catch (const dice::ParseError & e) {
         logger->Write(LogPriority::ERROR, e.what());
         return ExitCode::INVALID_INPUT;
      }

      if (opts.help) {
         env.out << GetUsage(programName);
         return ExitCode::OK;
      }
      if (opts.verbose)
         logger = env.loggerBuilder(LogPriority::DEBUG);
      if (opts.seed)
         logger->Write<LogPriority::DEBUG>("Using seed {}", *opts.seed);

      Session session(env.engineBuilder(opts.seed), *logger);
      return session.Run(opts.dice, opts.aggregate, env.out);
   }
   catch (const std::exception & e) {
      logger->Write(LogPriority::FATAL, e.what());
      return ExitCode::INTERNAL_ERROR;
   }
}

} // namespace core
