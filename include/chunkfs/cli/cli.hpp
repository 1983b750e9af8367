#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <boost/asio/any_io_executor.hpp>
#include "chunkfs/file/file_store.hpp"

namespace chunkfs {
namespace cli {

class CLI {
public:
  // ---- CONSTRUCTOR ----
  CLI(file::FileStore& file_store, boost::asio::any_io_executor executor,
      std::size_t chunks_to_buffer, std::ostream& out);


  // ---- STARTUP ----
  // Reads commands from input until "quit" or end of input
  void run(std::istream& input);
  // Executes one command line, returns false on "quit"
  bool execute(const std::string& line);

private:
  // ---- PARAMETERS ----
  file::FileStore& file_store_;
  boost::asio::any_io_executor executor_;
  std::size_t chunks_to_buffer_;
  std::ostream& out_;


  // ---- COMMAND PROCESSING ----
  void handle_store_command(const std::string& path);
  void handle_cat_command(const std::string& name);
  void handle_peek_command(const std::string& name, std::uint64_t offset, std::size_t length);
  void handle_info_command(const std::string& name);
  void handle_remove_command(const std::string& name);
  void handle_help_command();
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace chunkfs
