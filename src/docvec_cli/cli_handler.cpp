#include "docvec_cli/cli_handler.hpp"

#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

#include "docvec_core/config.hpp"
#include "docvec_core/db/database_manager.hpp"
#include "docvec_core/db/vector_store.hpp"
#include "docvec_core/extractors/content_extractor_factory.hpp"
#include "docvec_core/llm/embedding_provider.hpp"

namespace docvec_cli {

namespace {

// One pipeline run's resources. The connection is released when this goes out of scope.
struct StoreSession {
  std::shared_ptr<docvec_core::DatabaseManager> db_manager;
  std::shared_ptr<docvec_core::VectorStore> vector_store;
  std::shared_ptr<docvec_core::EmbeddingProvider> embedding_provider;

  explicit StoreSession(const docvec_core::Config &config) {
    // Provider first so a misconfigured provider fails before the store is opened
    embedding_provider = docvec_core::make_embedding_provider(config);

    db_manager = std::make_shared<docvec_core::DatabaseManager>(config.database_path,
                                                                config.database_key);
    docvec_core::VectorStoreOptions store_options;
    // The store is declared with the width the provider produces
    store_options.dimension = embedding_provider->dimension();
    store_options.index_path = config.index_path;
    store_options.hnsw_m = config.hnsw_m;
    store_options.hnsw_ef_construction = config.hnsw_ef_construction;
    store_options.hnsw_ef_search = config.hnsw_ef_search;
    vector_store = std::make_shared<docvec_core::VectorStore>(*db_manager, store_options);
    vector_store->ensure_schema();
  }

  ~StoreSession() {
    // The store references the manager; drop it first
    vector_store.reset();
    db_manager.reset();
  }
};

}  // namespace

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
  CliOptions options;
  options.command = Command::Help;

  if (argc < 2) {
    return options;
  }

  std::string command = argv[1];
  if (command == "index" || command == "i") {
    options.command = Command::Index;
  } else if (command == "search" || command == "s") {
    options.command = Command::Search;
  } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
    options.command = Command::Help;
    return options;
  } else {
    throw CliError("Unknown command: " + command);
  }

  for (int i = 2; i < argc; i += 2) {
    std::string flag = argv[i];
    if (i + 1 >= argc) {
      throw CliError("Missing value for " + flag);
    }
    std::string value = argv[i + 1];

    if (flag == "--config" || flag == "-c") {
      options.config_path = value;
    } else if (options.command == Command::Index && (flag == "--file" || flag == "-f")) {
      options.file_path = value;
    } else if (options.command == Command::Search && (flag == "--query" || flag == "-q")) {
      options.query = value;
    } else if (options.command == Command::Search && (flag == "--top-k" || flag == "-k")) {
      options.top_k = parse_top_k(value);
    } else {
      throw CliError("Unknown option for " + command + ": " + flag);
    }
  }

  if (options.command == Command::Index && options.file_path.empty()) {
    throw CliError("Index command requires a file path. Usage: index --file <path>");
  }
  if (options.command == Command::Search && options.query.empty()) {
    throw CliError("Search command requires a query. Usage: search --query <query>");
  }
  return options;
}

int CliHandler::parse_top_k(const std::string &value) {
  int top_k = 0;
  try {
    size_t consumed = 0;
    top_k = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw CliError("--top-k expects a positive integer, got '" + value + "'");
    }
  } catch (const std::logic_error &) {
    // std::invalid_argument and std::out_of_range from std::stoi
    throw CliError("--top-k expects a positive integer, got '" + value + "'");
  }
  if (top_k <= 0) {
    throw CliError("--top-k expects a positive integer, got '" + value + "'");
  }
  return top_k;
}

int CliHandler::execute_command(const CliOptions &options) {
  try {
    switch (options.command) {
      case Command::Index:
        return handle_index_command(options);
      case Command::Search:
        return handle_search_command(options);
      case Command::Help:
        print_help();
        return EXIT_OK;
    }
  } catch (const docvec_core::ConfigurationError &e) {
    print_error(std::string("Configuration error: ") + e.what());
  } catch (const docvec_core::StoreConnectionError &e) {
    print_error(std::string("Could not connect to the store: ") + e.what());
  } catch (const docvec_core::ContentExtractorError &e) {
    print_error(std::string("Could not extract text: ") + e.what());
  } catch (const docvec_core::QueryEmbeddingError &e) {
    print_error(e.what());
  } catch (const docvec_core::EmbeddingError &e) {
    print_error(std::string("Embedding provider error: ") + e.what());
  } catch (const docvec_core::VectorStoreError &e) {
    print_error(std::string("Vector store error: ") + e.what());
  }
  return EXIT_FAILURE_STATUS;
}

int CliHandler::handle_index_command(const CliOptions &options) {
  docvec_core::Config config = docvec_core::Config::load(options.config_path);
  StoreSession session(config);

  docvec_core::IndexingService indexing_service(
      session.vector_store, session.embedding_provider,
      std::make_shared<docvec_core::ContentExtractorFactory>(),
      docvec_core::SentenceChunker(static_cast<size_t>(config.sentences_per_chunk)));

  std::cout << "Indexing " << options.file_path << " with "
            << session.embedding_provider->name() << "..." << std::endl;
  docvec_core::IndexReport report = indexing_service.index_file(options.file_path);
  std::cout << format_index_report(report);

  if (report.outcome == docvec_core::IndexOutcome::NoDataPrepared) {
    print_error("No chunks could be embedded for " + report.filename);
    return EXIT_FAILURE_STATUS;
  }
  return EXIT_OK;
}

int CliHandler::handle_search_command(const CliOptions &options) {
  docvec_core::Config config = docvec_core::Config::load(options.config_path);
  StoreSession session(config);

  docvec_core::SearchService search_service(session.vector_store, session.embedding_provider);
  const int top_k = options.top_k.value_or(config.default_top_k);

  std::cout << "Searching for: \"" << options.query << "\"" << std::endl;
  std::cout << format_search_results(search_service.search(options.query, top_k));
  return EXIT_OK;
}

std::string CliHandler::format_search_results(
    const std::vector<docvec_core::SearchResult> &results) {
  std::ostringstream out;
  if (results.empty()) {
    out << "No relevant documents found." << std::endl;
    return out.str();
  }
  for (size_t i = 0; i < results.size(); ++i) {
    const auto &result = results[i];
    out << "\n--- Result " << (i + 1) << " (Similarity: " << std::fixed << std::setprecision(4)
        << result.score << ") ---" << std::endl;
    out << "Source: " << result.filename << std::endl;
    out << result.chunk_text << std::endl;
  }
  return out.str();
}

std::string CliHandler::format_index_report(const docvec_core::IndexReport &report) {
  std::ostringstream out;
  out << "\n=== Index Report ===" << std::endl;
  out << "File:             " << report.filename << std::endl;
  out << "Outcome:          " << docvec_core::to_string(report.outcome) << std::endl;
  out << "Stage:            " << docvec_core::to_string(report.stage) << std::endl;
  out << "Strategy:         " << report.split_strategy << std::endl;
  out << "Chunks:           " << report.chunks_total << std::endl;
  out << "Records inserted: " << report.records_inserted << std::endl;
  out << "Chunks skipped:   " << report.chunks_skipped << std::endl;
  out << "Chunks failed:    " << report.chunks_failed << std::endl;
  for (const auto &failure : report.failures) {
    out << "  chunk " << failure.chunk_number << ": " << failure.message << std::endl;
  }
  return out.str();
}

void CliHandler::print_error(const std::string &error) {
  std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
  std::cout << R"(
docvec - Document chunking, embedding and semantic search

Usage: docvec <command> [options]

Commands:
  index, i      Extract, chunk, embed and store a document (.txt, .md, .pdf, .docx)
    --file, -f <path>      Path to the document

  search, s     Semantic search over every stored chunk
    --query, -q <query>    Search query
    --top-k, -k <num>      Number of results to return (default: 5)

  help, h       Show this help message

Common options:
  --config, -c <file>      JSON config file (default: ./docvecrc.json when present)

Environment Variables:
  DOCVEC_DATABASE_PATH       Path of the SQLite store
  DOCVEC_DATABASE_KEY        SQLCipher key for the store
  DOCVEC_EMBEDDING_PROVIDER  gemini (default) or ollama
  DOCVEC_EMBEDDING_API_KEY   Embedding provider credential (GEMINI_API_KEY also accepted)

Examples:
  docvec index --file notes/meeting.md
  docvec search --query "quarterly revenue targets" --top-k 3
)" << std::endl;
}

}  // namespace docvec_cli
