#pragma once

#include <iostream>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

#include "chunkwise_cli/config.hpp"
#include "chunkwise_core/converter/document_converter.hpp"
#include "chunkwise_core/services/document_processor.hpp"

namespace chunkwise_cli
{

  enum class Command
  {
    Chunk,
    Wrap,
    Text,
    Process,
    Extensions,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string file_path;
    std::string doc_id;
    std::string source;
    bool save = false;  // keep the raw upload under the configured upload directory
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    CliHandler(const Config &config,
               std::shared_ptr<chunkwise_core::DocumentConverter> converter,
               std::ostream &out = std::cout);

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command
    void execute_command(const CliOptions &options);

  private:
    Config config_;
    chunkwise_core::DocumentProcessor processor_;
    std::ostream &out_;

    // Command handlers
    void handle_chunk_command(const CliOptions &options);
    void handle_wrap_command(const CliOptions &options);
    void handle_text_command(const CliOptions &options);
    void handle_process_command(const CliOptions &options);
    void handle_extensions_command();

    // Helper methods
    chunkwise_core::RequestContext make_context() const;
    static std::string read_file(const std::string &path);
    void print_json_response(const nlohmann::json &response);
    void print_help();
  };

}
