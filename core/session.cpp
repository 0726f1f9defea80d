#include "core/session.hpp"
#include "core/logging.hpp"
#include "dice/engine.hpp"
#include "dice/notation.hpp"

namespace core {

Session::Session(std::unique_ptr<dice::IEngine> engine, ILogger & logger)
   : m_engine(std::move(engine))
   , m_logger(logger)
{}

Session::~Session() = default;

ExitCode Session::Run(const std::vector<std::string> & tokens,
                      dice::Aggregate aggregate,
                      std::ostream & out)
{
   if (tokens.empty()) {
      m_logger.Write(LogPriority::WARN, "Provide some dice to roll");
      return ExitCode::NOTHING_TO_DO;
   }

   auto descriptors = ParseAll(tokens);
   if (!descriptors)
      return ExitCode::INVALID_INPUT;

   m_logger.Write<LogPriority::DEBUG>("Rolling {} dice group(s), aggregate: {}",
                                      descriptors->size(),
                                      dice::ToString(aggregate));
   for (const auto & descriptor : *descriptors) {
      const dice::Rolls rolls = dice::Roll(descriptor, *m_engine);
      out << dice::ToString(descriptor) << ' ' << dice::ApplyAggregate(aggregate, rolls) << '\n';
   }
   out.flush();
   return ExitCode::OK;
}

std::optional<std::vector<dice::Descriptor>> Session::ParseAll(const std::vector<std::string> & tokens)
{
   std::vector<dice::Descriptor> descriptors;
   descriptors.reserve(tokens.size());
   bool failed = false;

   for (const auto & token : tokens) {
      try {
         descriptors.push_back(dice::ParseDescriptor(token));
         m_logger.Write<LogPriority::DEBUG>("Parsed '{}' as {}", token, descriptors.back());
      }
      catch (const dice::ParseError & e) {
         m_logger.Write(LogPriority::ERROR, e.what());
         failed = true;
      }
   }
   if (failed)
      return std::nullopt;
   return descriptors;
}

} // namespace core
