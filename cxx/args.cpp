#include "args.hpp"

#include "sy/log/log.hpp"
#include "sy/sys/threads.hpp"

#include <cstdlib>
#include <exception>
#include <fmt/format.h>
#include <scn/scan.h>
#include <unordered_map>

using namespace sy;

namespace {
std::unordered_map<int, Log::Display> levelMap{{0, Log::Display::None},
                                               {1, Log::Display::Ephemeral},
                                               {2, Log::Display::Low},
                                               {3, Log::Display::Mid},
                                               {4, Log::Display::High}};
}

args::Group                      global_group("GLOBAL OPTIONS");
args::HelpFlag                   help(global_group, "H", "Show this help message", {'h', "help"});
args::MapFlag<int, Log::Display> verbosity(global_group, "V", "Log level 0-4", {'v', "verbosity"}, levelMap);
args::ValueFlag<Index>           nthreads(global_group, "N", "Limit number of threads", {"nthreads"});

void SetLogging(std::string const &name)
{
  if (verbosity) {
    Log::SetDisplayLevel(verbosity.Get());
  } else if (char *const env_p = std::getenv("SY_VERBOSITY")) {
    Log::SetDisplayLevel(levelMap.at(std::atoi(env_p)));
  }
  Log::Print(name, "Welcome to SYRAH");
}

void SetThreadCount()
{
  if (nthreads) {
    Threads::SetGlobalThreadCount(nthreads.Get());
  } else if (char *const env_p = std::getenv("SY_THREADS")) {
    Threads::SetGlobalThreadCount(std::atoi(env_p));
  }
}

void ParseCommand(args::Subparser &parser)
{
  args::GlobalOptions globals(parser, global_group);
  parser.Parse();
  SetLogging(parser.GetCommand().Name());
  SetThreadCount();
}

void ParseCommand(args::Subparser &parser, args::Positional<std::string> &iname)
{
  ParseCommand(parser);
  if (!iname) { throw args::Error("No input file specified"); }
}

template <int N> void SzReader<N>::operator()(std::string const &name, std::string const &value, sy::Sz<N> &sz)
{
  size_t ind = 0;
  if (auto result = scn::scan<Index>(value, "{}")) {
    sz[ind] = result->value();
    for (ind = 1; ind < N; ind++) {
      result = scn::scan<Index>(result->range(), ",{}");
      if (!result) { throw(args::ParseError(fmt::format("Could not read {} from '{}'", name, value))); }
      sz[ind] = result->value();
    }
  } else {
    throw(args::ParseError(fmt::format("Could not read {} from '{}'", name, value)));
  }
}

template struct SzReader<3>;

template <typename T, int ND>
void ArrayReader<T, ND>::operator()(std::string const &name, std::string const &value, Eigen::Array<T, ND, 1> &v)
{
  size_t ind = 0;
  if (auto result = scn::scan<T>(value, "{}")) {
    v[ind] = result->value();
    for (ind = 1; ind < ND; ind++) {
      result = scn::scan<T>(result->range(), ",{}");
      if (!result) { throw(args::ParseError(fmt::format("Could not read {} from '{}'", name, value))); }
      v[ind] = result->value();
    }
  } else {
    throw(args::ParseError(fmt::format("Could not read {} from '{}'", name, value)));
  }
}

template struct ArrayReader<double, 3>;
