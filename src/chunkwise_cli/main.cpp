#include "chunkwise_cli/cli_handler.hpp"
#include "chunkwise_cli/config.hpp"
#include "chunkwise_core/converter/markitdown_client.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>

int main(int argc, char *argv[])
{
  try
  {
    // Get config path from environment variable; a missing file means defaults
    const char *config_env = std::getenv("CHUNKWISE_CONFIG");
    std::string config_path = config_env ? config_env : "chunkwiserc.json";

    chunkwise_cli::Config config = std::filesystem::exists(config_path)
                                       ? chunkwise_cli::Config::from_file(config_path)
                                       : chunkwise_cli::Config::from_json(nlohmann::json::object());

    if (const char *url = std::getenv("MARKITDOWN_API_URL"); url && *url)
    {
      config.markitdown_url = url;
    }

    auto converter = std::make_shared<chunkwise_core::MarkitdownClient>(
        config.markitdown_url, std::chrono::seconds(config.request_timeout_seconds));

    chunkwise_cli::CliHandler handler(config, converter);

    // Parse command line arguments
    chunkwise_cli::CliOptions options = chunkwise_cli::CliHandler::parse_arguments(argc, argv);

    // Execute the command
    handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
