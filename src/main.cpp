#include "chunkfs/cli/cli.hpp"
#include "chunkfs/crypto/chunk_cipher.hpp"
#include "chunkfs/file/file_store.hpp"
#include "chunkfs/logger/logger.hpp"
#include "chunkfs/store/store.hpp"
#include <boost/asio/thread_pool.hpp>
#include <boost/log/trivial.hpp>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  std::string directory{"chunkfs_store"};
  std::string passphrase;
  std::size_t chunks_to_buffer{4};
  std::size_t chunk_size{chunkfs::chunk::MAX_SIZE};
  std::size_t threads{2};
  boost::log::trivial::severity_level log_level{boost::log::trivial::info};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -k <passphrase> [options]\n"
        << "Required arguments:\n"
        << "  -k, --key       Passphrase the store key is derived from\n"
        << "Optional arguments:\n"
        << "  -d, --dir       Chunk store directory (default: chunkfs_store)\n"
        << "  -b, --buffer    Chunks buffered per open file (default: 4)\n"
        << "  -c, --chunk     Chunk size in bytes for new files (default: 5242880)\n"
        << "  -t, --threads   Worker threads (default: 2)\n"
        << "  -l, --log       Log level: trace, debug, info, warning, error, fatal (default: info)\n"
        << "Example: " << program_name << " -k secret -d ./store -b 8\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {
    "-d", "--dir", "-k", "--key", "-b", "--buffer",
    "-c", "--chunk", "-t", "--threads", "-l", "--log"
  };

  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Every argument needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    try {
      if (flag == "-d" || flag == "--dir") {
        options.directory = value;
      } else if (flag == "-k" || flag == "--key") {
        options.passphrase = value;
      } else if (flag == "-b" || flag == "--buffer") {
        options.chunks_to_buffer = static_cast<std::size_t>(std::stoul(value));
      } else if (flag == "-c" || flag == "--chunk") {
        options.chunk_size = static_cast<std::size_t>(std::stoul(value));
      } else if (flag == "-t" || flag == "--threads") {
        options.threads = static_cast<std::size_t>(std::stoul(value));
      } else if (flag == "-l" || flag == "--log") {
        if (!chunkfs::logging::parse_log_level(value, options.log_level)) {
          std::cerr << "Error: Unknown log level: " << value << '\n';
          print_usage(argv[0]);
          return options;
        }
      }
    } catch (const std::logic_error&) {
      std::cerr << "Error: Invalid value for " << flag << ": " << value << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  if (options.passphrase.empty()) {
    std::cerr << "Error: A passphrase is required\n";
    print_usage(argv[0]);
    return options;
  }
  if (options.chunks_to_buffer == 0 || options.chunk_size == 0 || options.threads == 0) {
    std::cerr << "Error: Buffer, chunk size and thread count must be positive\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    chunkfs::logging::init_logging("chunkfs.log", options.log_level);

    boost::asio::thread_pool pool(options.threads);
    auto store = std::make_shared<chunkfs::store::ChunkStore>(options.directory);
    chunkfs::file::FileStore file_store(store,
                                        chunkfs::crypto::ChunkCipher::derive_key(options.passphrase),
                                        options.chunk_size);
    chunkfs::cli::CLI cli(file_store, pool.get_executor(), options.chunks_to_buffer, std::cout);

    cli.run(std::cin);

    pool.join();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Shell failed: " << e.what();
    std::cerr << "Error: Failed to start shell: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
