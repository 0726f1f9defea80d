#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <vector>
#include "core/application.hpp"
#include "dice/engine.hpp"
#include "tests/fakelogger.hpp"

namespace {

class FilteringLogger : public ILogger
{
public:
   FilteringLogger(FakeLogger & target, LogPriority minPriority)
      : m_target(target)
      , m_minPriority(minPriority)
   {}
   void Write(LogPriority prio, std::string msg) override
   {
      if (prio >= m_minPriority)
         m_target.Write(prio, std::move(msg));
   }

private:
   FakeLogger & m_target;
   const LogPriority m_minPriority;
};

class MockEngine : public dice::IEngine
{
public:
   explicit MockEngine(uint32_t value)
      : m_value(value)
   {}
   uint32_t GenerateValue(uint32_t, uint32_t) override { return m_value; }

private:
   uint32_t m_value;
};

class BrokenEngine : public dice::IEngine
{
public:
   uint32_t GenerateValue(uint32_t, uint32_t) override
   {
      throw std::runtime_error("entropy source failed");
   }
};

class ApplicationFixture : public ::testing::Test
{
protected:
   core::ExitCode Run(std::vector<const char *> args)
   {
      args.insert(args.begin(), "diceroll");
      const core::Environment env{
         out,
         err,
         [this](LogPriority minPriority) {
            loggerPriorities.push_back(minPriority);
            return std::make_unique<FilteringLogger>(logger, minPriority);
         },
         [this](std::optional<uint32_t> seed) -> std::unique_ptr<dice::IEngine> {
            requestedSeed = seed;
            if (brokenEngine)
               return std::make_unique<BrokenEngine>();
            return std::make_unique<MockEngine>(4U);
         },
      };
      return core::RunApplication(static_cast<int>(args.size()), args.data(), env);
   }

   FakeLogger logger;
   std::ostringstream out;
   std::ostringstream err;
   std::vector<LogPriority> loggerPriorities;
   std::optional<uint32_t> requestedSeed;
   bool brokenEngine = false;
};

TEST_F(ApplicationFixture, rolls_and_prints_each_die)
{
   EXPECT_EQ(core::ExitCode::OK, Run({"-a", "sum", "3d6", "d20"}));
   EXPECT_EQ("3d6 12\n1d20 4\n", out.str());
   EXPECT_EQ("", err.str());
   EXPECT_TRUE(logger.NoWarningsOrErrors());
   EXPECT_FALSE(requestedSeed);
}

TEST_F(ApplicationFixture, no_dice_is_nothing_to_do)
{
   EXPECT_EQ(core::ExitCode::NOTHING_TO_DO, Run({}));
   EXPECT_EQ("", out.str());
   EXPECT_TRUE(logger.Contains(LogPriority::WARN, "Provide some dice to roll"));
}

TEST_F(ApplicationFixture, unknown_aggregate_is_invalid_input)
{
   EXPECT_EQ(core::ExitCode::INVALID_INPUT, Run({"-a", "mean", "3d6"}));
   EXPECT_EQ("", out.str());
   EXPECT_TRUE(logger.Contains(LogPriority::ERROR, "invalid aggregate function 'mean'"));
}

TEST_F(ApplicationFixture, bad_die_is_invalid_input_without_output)
{
   EXPECT_EQ(core::ExitCode::INVALID_INPUT, Run({"3d6", "bad"}));
   EXPECT_EQ("", out.str());
   EXPECT_TRUE(logger.Contains(LogPriority::ERROR, "'bad'"));
}

TEST_F(ApplicationFixture, malformed_command_line_prints_usage)
{
   EXPECT_EQ(core::ExitCode::INVALID_INPUT, Run({"--frobnicate", "3d6"}));
   EXPECT_EQ("", out.str());
   EXPECT_NE(std::string::npos, err.str().find("Usage: diceroll"));
   EXPECT_EQ(1U, logger.CountEntries(LogPriority::ERROR));

   err.str("");
   EXPECT_EQ(core::ExitCode::INVALID_INPUT, Run({"--seed=-1", "d6"}));
   EXPECT_NE(std::string::npos, err.str().find("Usage: diceroll"));
   EXPECT_FALSE(requestedSeed);
}

TEST_F(ApplicationFixture, help_prints_usage_and_succeeds)
{
   EXPECT_EQ(core::ExitCode::OK, Run({"--help", "3d6"}));
   EXPECT_NE(std::string::npos, out.str().find("Usage: diceroll"));
   EXPECT_EQ(std::string::npos, out.str().find("3d6 4 4 4"));
   EXPECT_EQ("", err.str());
}

TEST_F(ApplicationFixture, unexpected_exception_is_internal_error)
{
   brokenEngine = true;
   EXPECT_EQ(core::ExitCode::INTERNAL_ERROR, Run({"2d6"}));
   EXPECT_TRUE(logger.Contains(LogPriority::FATAL, "entropy source failed"));
}

TEST_F(ApplicationFixture, verbose_lowers_the_log_level)
{
   EXPECT_EQ(core::ExitCode::OK, Run({"d4"}));
   EXPECT_EQ((std::vector<LogPriority>{LogPriority::INFO}), loggerPriorities);
   EXPECT_EQ(0U, logger.CountEntries(LogPriority::DEBUG));

   loggerPriorities.clear();
   EXPECT_EQ(core::ExitCode::OK, Run({"-v", "--seed", "9", "d4"}));
   EXPECT_EQ((std::vector<LogPriority>{LogPriority::INFO, LogPriority::DEBUG}), loggerPriorities);
   EXPECT_TRUE(logger.Contains(LogPriority::DEBUG, "Using seed 9"));
   EXPECT_TRUE(logger.Contains(LogPriority::DEBUG, "Parsed 'd4' as 1d4"));
}

TEST_F(ApplicationFixture, seed_is_passed_to_the_engine)
{
   EXPECT_EQ(core::ExitCode::OK, Run({"-s", "1234", "d6"}));
   ASSERT_TRUE(requestedSeed);
   EXPECT_EQ(1234U, *requestedSeed);
}

} // namespace
