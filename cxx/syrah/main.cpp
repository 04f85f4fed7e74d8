#include "args.hpp"
#include "sy/log/log.hpp"

using namespace sy;

#define COMMAND(PARSER, NM, CMD, DESC)                                                                                         \
  void          main_##NM(args::Subparser &parser);                                                                            \
  args::Command NM(PARSER, CMD, DESC, &main_##NM);

int main(int const argc, char const *const argv[])
{
  args::ArgumentParser parser("SYRAH");
  args::GlobalOptions  globals(parser, global_group);

  args::Group resamp(parser, "RESAMPLE");
  COMMAND(resamp, axial, "axial", "Resample an oblique magnitude/phase pair to axial");
  COMMAND(resamp, like, "like", "Resample an image onto the grid of another");

  args::Group util(parser, "UTIL");
  COMMAND(util, hdr, "hdr", "Print the geometry of an image");
  COMMAND(util, obliquity, "obliquity", "Print the obliquity of an image");
  COMMAND(util, phantom, "phantom", "Write an oblique magnitude/phase phantom");

  try {
    parser.ParseCLI(argc, argv);
    Log::End();
  } catch (args::Help &) {
    fmt::print(stderr, "{}\n", parser.Help());
    return EXIT_SUCCESS;
  } catch (args::Error &e) {
    fmt::print(stderr, "{}\n", parser.Help());
    fmt::print(stderr, fmt::fg(fmt::terminal_color::bright_red), "{}\n", e.what());
    return EXIT_FAILURE;
  } catch (Log::Failure &f) {
    Log::Fail(f);
    Log::End();
    return EXIT_FAILURE;
  } catch (std::exception const &e) {
    Log::Fail(Log::Failure("None", "{}", e.what()));
    Log::End();
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
