#ifndef CHUNKFS_READER_BLOCKING_HPP
#define CHUNKFS_READER_BLOCKING_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include "chunkfs/reader/buffered_reader.hpp"

namespace chunkfs {
namespace reader {

// Waits for the asynchronous operation and throws boost::system::system_error on failure.
// Never call these from a thread of the reader's own executor: the completion
// would have no thread left to run on.

std::size_t read_blocking(BufferedReader& reader, uint8_t* dest, std::size_t offset, std::size_t length);

std::shared_ptr<BufferedReader> seek_blocking(BufferedReader& reader, std::uint64_t offset);

std::shared_ptr<BufferedReader> reset_blocking(BufferedReader& reader);

} // namespace reader
} // namespace chunkfs

#endif // CHUNKFS_READER_BLOCKING_HPP
