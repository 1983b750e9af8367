#ifndef CHUNKFS_READER_ERROR_HPP
#define CHUNKFS_READER_ERROR_HPP

#include <stdexcept>
#include <string>
#include <type_traits>
#include <boost/system/error_code.hpp>

namespace chunkfs {
namespace reader {

// Failures delivered through asynchronous completion handlers
enum class reader_errc {
  closed = 1,        // operation on a retired or closed instance
  source_failure,    // the underlying source failed or ended before the declared size
  invalid_seek       // seek target beyond the end of the file
};

const boost::system::error_category& reader_category();

boost::system::error_code make_error_code(reader_errc e);

// Synchronous failures raised while setting up readers
class ReaderError : public std::runtime_error {
public:
  explicit ReaderError(const std::string& message) : std::runtime_error(message) {}
};

class ConfigurationError : public ReaderError {
public:
  explicit ConfigurationError(const std::string& message)
    : ReaderError("Configuration error: " + message) {}
};

} // namespace reader
} // namespace chunkfs

namespace boost {
namespace system {

template <>
struct is_error_code_enum<chunkfs::reader::reader_errc> : std::true_type {};

} // namespace system
} // namespace boost

#endif // CHUNKFS_READER_ERROR_HPP
