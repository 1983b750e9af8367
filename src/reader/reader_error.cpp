#include "chunkfs/reader/reader_error.hpp"

namespace chunkfs {
namespace reader {

namespace {

class ReaderCategory : public boost::system::error_category {
public:
  const char* name() const noexcept override { return "chunkfs.reader"; }

  std::string message(int value) const override {
    switch (static_cast<reader_errc>(value)) {
      case reader_errc::closed:         return "Reader closed";
      case reader_errc::source_failure: return "Source reader failure";
      case reader_errc::invalid_seek:   return "Seek beyond end of file";
      default:                          return "Unknown reader error";
    }
  }
};

} // namespace

const boost::system::error_category& reader_category() {
  static const ReaderCategory category;
  return category;
}

boost::system::error_code make_error_code(reader_errc e) {
  return boost::system::error_code(static_cast<int>(e), reader_category());
}

} // namespace reader
} // namespace chunkfs
