#include <iostream>

#include "docvec_cli/cli_handler.hpp"

int main(int argc, char *argv[])
{
  docvec_cli::CliHandler handler;

  docvec_cli::CliOptions options;
  try
  {
    options = handler.parse_arguments(argc, argv);
  }
  catch (const docvec_cli::CliError &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    std::cerr << "Run 'docvec help' for usage." << std::endl;
    return docvec_cli::CliHandler::EXIT_USAGE;
  }

  try
  {
    return handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return docvec_cli::CliHandler::EXIT_FAILURE_STATUS;
  }
}
