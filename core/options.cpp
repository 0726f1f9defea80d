#include "core/options.hpp"

#include <charconv>
#include <sstream>
#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace {

constexpr const char * DICE_KEY = "dice";

po::options_description VisibleOptions()
{
   po::options_description desc("Options");
   // clang-format off
   desc.add_options()
      ("help,h", "print this message and exit")
      ("aggregate,a", po::value<std::string>()->value_name("FUNC"),
       "aggregate function applied to the rolls of every die: sum, avg, max or min")
      ("seed,s", po::value<std::string>()->value_name("N"),
       "seed the random engine for reproducible rolls")
      ("verbose,v", "log debug information to stderr");
   // clang-format on
   return desc;
}

// Unsigned decimal digits only; no sign.
uint32_t ParseSeed(const std::string & text)
{
   uint32_t seed = 0;
   const auto [last, ec] = std::from_chars(text.data(), text.data() + text.size(), seed);
   if (text.empty() || ec != std::errc() || last != text.data() + text.size())
      throw core::UsageError("the argument ('" + text + "') for option '--seed' is invalid");
   return seed;
}

} // namespace

namespace core {

Options ParseOptions(int argc, const char * const argv[])
{
   po::options_description all = VisibleOptions();
   all.add_options()(DICE_KEY, po::value<std::vector<std::string>>(), "dice to roll");

   po::positional_options_description positional;
   positional.add(DICE_KEY, -1);

   po::variables_map vm;
   try {
      po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
      po::notify(vm);
   }
   catch (const po::error & e) {
      throw UsageError(e.what());
   }

   Options opts;
   opts.help = vm.count("help") > 0;
   opts.verbose = vm.count("verbose") > 0;
   if (vm.count(DICE_KEY))
      opts.dice = vm[DICE_KEY].as<std::vector<std::string>>();
   if (vm.count("aggregate"))
      opts.aggregate = dice::ParseAggregate(vm["aggregate"].as<std::string>());
   if (vm.count("seed"))
      opts.seed = ParseSeed(vm["seed"].as<std::string>());
   return opts;
}

std::string GetUsage(const std::string & programName)
{
   std::ostringstream ss;
   ss << "Usage: " << programName << " [OPTIONS] DICE...\n"
      << "Roll dice given in <count>d<sides> notation, e.g. 3d6 or d20.\n\n"
      << VisibleOptions();
   return ss.str();
}

} // namespace core
