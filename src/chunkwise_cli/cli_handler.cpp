#include "chunkwise_cli/cli_handler.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "chunkwise_core/services/file_store.hpp"
#include "chunkwise_core/utils/document_utils.hpp"
#include "chunkwise_core/utils/uuid.hpp"

namespace chunkwise_cli {

namespace {

// Reads "--flag value" pairs; --save is the only flag without a value
CliOptions parse_flags(Command command, int argc, char* argv[]) {
    CliOptions options;
    options.command = command;

    for (int i = 2; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--save" || flag == "-s") {
            options.save = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw CliError("Missing value for " + flag);
        }
        std::string value = argv[++i];

        if (flag == "--file" || flag == "-f") {
            options.file_path = value;
        } else if (flag == "--doc-id" || flag == "-d") {
            options.doc_id = value;
        } else if (flag == "--source") {
            options.source = value;
        } else {
            throw CliError("Unknown option: " + flag);
        }
    }
    return options;
}

}  // namespace

CliHandler::CliHandler(const Config& config,
                       std::shared_ptr<chunkwise_core::DocumentConverter> converter,
                       std::ostream& out)
    : config_(config), processor_(std::move(converter), config.processor_options()), out_(out) {}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    if (argc < 2) {
        return CliOptions{};
    }

    std::string command = argv[1];
    CliOptions options;

    if (command == "chunk" || command == "c") {
        options = parse_flags(Command::Chunk, argc, argv);
        if (options.file_path.empty()) {
            throw CliError("Chunk command requires a file path. Usage: chunk --file <path>");
        }
    } else if (command == "wrap" || command == "w") {
        options = parse_flags(Command::Wrap, argc, argv);
        if (options.file_path.empty() || options.doc_id.empty()) {
            throw CliError(
                "Wrap command requires a file path and a document id. "
                "Usage: wrap --file <path> --doc-id <id> [--source <source>]");
        }
    } else if (command == "text" || command == "t") {
        options = parse_flags(Command::Text, argc, argv);
        if (options.file_path.empty()) {
            throw CliError("Text command requires a file path. Usage: text --file <path>");
        }
    } else if (command == "process" || command == "p") {
        options = parse_flags(Command::Process, argc, argv);
        if (options.file_path.empty()) {
            throw CliError("Process command requires a file path. Usage: process --file <path> [--save]");
        }
    } else if (command == "extensions" || command == "e") {
        options.command = Command::Extensions;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Chunk:
            handle_chunk_command(options);
            break;
        case Command::Wrap:
            handle_wrap_command(options);
            break;
        case Command::Text:
            handle_text_command(options);
            break;
        case Command::Process:
            handle_process_command(options);
            break;
        case Command::Extensions:
            handle_extensions_command();
            break;
        case Command::Help:
            print_help();
            break;
    }
}

void CliHandler::handle_chunk_command(const CliOptions& options) {
    std::vector<std::string> chunks = processor_.chunk_markdown(read_file(options.file_path));

    print_json_response({{"file", options.file_path},
                         {"chunk_count", chunks.size()},
                         {"chunks", chunks}});
}

void CliHandler::handle_wrap_command(const CliOptions& options) {
    const std::string markdown = read_file(options.file_path);

    chunkwise_core::ChunkAddress address{
        .doc_id = options.doc_id,
        .file_id = chunkwise_core::generate_uuid_v4(),
        .source = options.source.empty()
                      ? std::filesystem::path(options.file_path).filename().string()
                      : options.source,
        .created_at = std::chrono::system_clock::now()};

    std::vector<std::string> wrapped = processor_.wrap_markdown_with_metadata(markdown, address);

    print_json_response({{"doc_id", address.doc_id},
                         {"file_id", address.file_id},
                         {"chunk_count", wrapped.size()},
                         {"chunks", wrapped}});
}

void CliHandler::handle_text_command(const CliOptions& options) {
    chunkwise_core::ProcessedFile processed = processor_.process_text(read_file(options.file_path));
    print_json_response(processed);
}

void CliHandler::handle_process_command(const CliOptions& options) {
    if (!std::filesystem::is_regular_file(options.file_path)) {
        throw CliError("File not found: " + options.file_path);
    }

    chunkwise_core::UploadedFile upload = chunkwise_core::UploadedFile::from_path(options.file_path);
    chunkwise_core::ProcessedFile processed = processor_.process_file(make_context(), upload);

    nlohmann::json response = {{"file", processed},
                               {"metadata", chunkwise_core::generate_file_metadata(processed)}};

    if (options.save) {
        std::filesystem::path stored =
            chunkwise_core::FileStore::save(upload, config_.upload_directory, processed.id);
        response["stored_path"] = stored.string();
    }

    print_json_response(response);
}

void CliHandler::handle_extensions_command() {
    print_json_response({{"extensions", processor_.get_supported_extensions(make_context())}});
}

chunkwise_core::RequestContext CliHandler::make_context() const {
    return chunkwise_core::RequestContext::with_timeout(
        std::chrono::seconds(config_.request_timeout_seconds));
}

std::string CliHandler::read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw CliError("Failed to open file: " + path);
    }
    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        throw CliError("Failed to read file: " + path);
    }
    return content.str();
}

void CliHandler::print_json_response(const nlohmann::json& response) {
    out_ << response.dump(2) << std::endl;
}

void CliHandler::print_help() {
    out_ << "chunkwise - document chunking for retrieval pipelines\n\n"
         << "Usage: chunkwise <command> [options]\n\n"
         << "Commands:\n"
         << "  chunk, c        --file <path>                  Chunk a markdown file by structure\n"
         << "  wrap, w         --file <path> --doc-id <id>    Chunk and prepend front-matter\n"
         << "                  [--source <source>]\n"
         << "  text, t         --file <path>                  Process a plain text file\n"
         << "  process, p      --file <path> [--save]         Convert, hash and chunk a document\n"
         << "  extensions, e                                  List supported file extensions\n"
         << "  help, h                                        Show this help\n\n"
         << "Environment:\n"
         << "  CHUNKWISE_CONFIG     Path to the JSON config file (default: chunkwiserc.json)\n"
         << "  MARKITDOWN_API_URL   Overrides markitdown_url from the config\n";
}

}  // namespace chunkwise_cli
