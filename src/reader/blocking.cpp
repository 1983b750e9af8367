#include "chunkfs/reader/blocking.hpp"
#include <future>
#include <boost/system/system_error.hpp>

namespace chunkfs {
namespace reader {

namespace {

template <typename T>
void settle(std::promise<T>& promise, const boost::system::error_code& ec, T value) {
  if (ec) {
    promise.set_exception(std::make_exception_ptr(boost::system::system_error(ec)));
  } else {
    promise.set_value(std::move(value));
  }
}

} // namespace

std::size_t read_blocking(BufferedReader& reader, uint8_t* dest, std::size_t offset, std::size_t length) {
  auto promise = std::make_shared<std::promise<std::size_t>>();
  auto result = promise->get_future();
  reader.async_read_into(dest, offset, length,
    [promise](const boost::system::error_code& ec, std::size_t bytes) {
      settle(*promise, ec, bytes);
    });
  return result.get();
}

std::shared_ptr<BufferedReader> seek_blocking(BufferedReader& reader, std::uint64_t offset) {
  auto promise = std::make_shared<std::promise<std::shared_ptr<BufferedReader>>>();
  auto result = promise->get_future();
  reader.async_seek(offset,
    [promise](const boost::system::error_code& ec, std::shared_ptr<BufferedReader> next) {
      settle(*promise, ec, std::move(next));
    });
  return result.get();
}

std::shared_ptr<BufferedReader> reset_blocking(BufferedReader& reader) {
  auto promise = std::make_shared<std::promise<std::shared_ptr<BufferedReader>>>();
  auto result = promise->get_future();
  reader.async_reset(
    [promise](const boost::system::error_code& ec, std::shared_ptr<BufferedReader> next) {
      settle(*promise, ec, std::move(next));
    });
  return result.get();
}

} // namespace reader
} // namespace chunkfs
