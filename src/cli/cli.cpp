#include "chunkfs/cli/cli.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>
#include <boost/log/trivial.hpp>
#include "chunkfs/reader/blocking.hpp"

namespace chunkfs {
namespace cli {

namespace {
// Size of each read issued while streaming a whole file
constexpr std::size_t CAT_READ_SIZE = 64 * 1024;
}

//==============================================
// CONSTRUCTOR
//==============================================

CLI::CLI(file::FileStore& file_store, boost::asio::any_io_executor executor,
         std::size_t chunks_to_buffer, std::ostream& out)
  : file_store_(file_store)
  , executor_(std::move(executor))
  , chunks_to_buffer_(chunks_to_buffer)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}

//==============================================
// STARTUP
//==============================================

void CLI::run(std::istream& input) {
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "chunkfs> " << std::flush;

  while (std::getline(input, line)) {
    if (!execute(line)) {
      break;
    }
    out_ << "chunkfs> " << std::flush;
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command, name;
  iss >> command;

  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << line;

  if (command.empty()) {
    return true;
  }
  if (command == "quit") {
    return false;
  }
  if (command == "help") {
    handle_help_command();
    return true;
  }
  if (command == "pwd") {
    out_ << "Local working directory: " << std::filesystem::current_path().string() << "\n"
         << "Chunk store directory: " << file_store_.get_store().base_path().string() << std::endl;
    return true;
  }

  if (!(iss >> name)) {
    out_ << "Invalid input. Usage: <command> <file> [arguments]" << std::endl;
    return true;
  }

  if (command == "store") {
    handle_store_command(name);
  }
  else if (command == "cat") {
    handle_cat_command(name);
  }
  else if (command == "peek") {
    std::uint64_t offset = 0;
    std::size_t length = 0;
    if (!(iss >> offset >> length)) {
      out_ << "Usage: peek <file> <offset> <length>" << std::endl;
      return true;
    }
    handle_peek_command(name, offset, length);
  }
  else if (command == "info") {
    handle_info_command(name);
  }
  else if (command == "rm") {
    handle_remove_command(name);
  }
  else {
    out_ << "Unknown command or invalid arguments" << std::endl;
  }
  return true;
}

//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::handle_store_command(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    out_ << "Error opening file: " << path << std::endl;
    return;
  }

  try {
    std::string name = std::filesystem::path(path).filename().string();
    file::FileManifest manifest = file_store_.store_file(name, file);
    out_ << "Stored " << name << ": " << manifest.file_size << " bytes in "
         << manifest.chunk_count << " chunks" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error storing file", e.what());
  }
}

void CLI::handle_cat_command(const std::string& name) {
  try {
    auto file = file_store_.open_file(name, executor_, chunks_to_buffer_);
    std::vector<uint8_t> buffer(CAT_READ_SIZE);

    std::size_t bytes = 0;
    while ((bytes = reader::read_blocking(*file, buffer.data(), 0, buffer.size())) > 0) {
      out_.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(bytes));
    }
    file->close();
    out_ << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading file", e.what());
  }
}

void CLI::handle_peek_command(const std::string& name, std::uint64_t offset, std::size_t length) {
  try {
    auto file = file_store_.open_file(name, executor_, chunks_to_buffer_);
    file = reader::seek_blocking(*file, offset);

    std::vector<uint8_t> buffer(length);
    std::size_t bytes = reader::read_blocking(*file, buffer.data(), 0, buffer.size());
    file->close();

    out_.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(bytes));
    out_ << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading file", e.what());
  }
}

void CLI::handle_info_command(const std::string& name) {
  try {
    file::FileManifest manifest = file_store_.manifest(name);
    out_ << name << ": " << manifest.file_size << " bytes, " << manifest.chunk_count
         << " chunks of " << manifest.chunk_size << " bytes" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading manifest", e.what());
  }
}

void CLI::handle_remove_command(const std::string& name) {
  try {
    file_store_.remove_file(name);
    out_ << "File deleted successfully" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error deleting file", e.what());
  }
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                        Display this help message" << std::endl;
  out_ << "  pwd                         Print working and store directories" << std::endl;
  out_ << "  store <path>                Chunk, encrypt and store local <path>" << std::endl;
  out_ << "  cat <file>                  Stream <file> to the terminal" << std::endl;
  out_ << "  peek <file> <off> <len>     Print <len> bytes of <file> from <off>" << std::endl;
  out_ << "  info <file>                 Show the chunk layout of <file>" << std::endl;
  out_ << "  rm <file>                   Delete <file> and its chunks" << std::endl;
  out_ << "  quit                        Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace chunkfs
