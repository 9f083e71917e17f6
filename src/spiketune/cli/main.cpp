#include <exception>
#include <iostream>

#include "spiketune/cli/commands.hpp"
#include "spiketune/cli/options.hpp"
#include "spiketune/common.hpp"

int main(int argc, char **argv)
{
  using namespace spiketune;

  try
  {
    const DefaultPaths defaults = compute_default_paths(argc > 0 ? argv[0] : nullptr);
    const cli::Options opts = cli::parse_args(argc, argv, defaults);
    return cli::dispatch(opts);
  }
  catch (const std::exception &ex)
  {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
