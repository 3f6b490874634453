#include <iostream>

#include "ragkb_cli/cli_handler.hpp"
#include "ragkb_core/config.hpp"

int main(int argc, char *argv[])
{
  try
  {
    // Parse first so a usage error is reported before any config is read
    ragkb_cli::CliOptions options = ragkb_cli::CliHandler::parse_arguments(argc, argv);

    ragkb_core::Config config =
        ragkb_core::Config::from_file_or_defaults(ragkb_core::Config::default_path());

    ragkb_cli::CliHandler handler(config.api_base_url);
    handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
