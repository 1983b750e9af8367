#include "chunkfs/reader/refill_gate.hpp"
#include "chunkfs/reader/reader_error.hpp"
#include <atomic>
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>

namespace chunkfs {
namespace reader {

//==============================================
// CONSTRUCTION
//==============================================

std::shared_ptr<RefillGate> RefillGate::create(boost::asio::any_io_executor executor) {
  return std::make_shared<RefillGate>(std::move(executor));
}

RefillGate::RefillGate(boost::asio::any_io_executor executor)
  : executor_(std::move(executor)) {}

//==============================================
// ADMISSION
//==============================================

void RefillGate::run_exclusive(Operation operation, Completion handler) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(Admission{std::move(operation), std::move(handler)});
    if (active_) {
      BOOST_LOG_TRIVIAL(trace) << "Refill gate: Operation queued, pending: " << queue_.size();
      return;
    }
    active_ = true;
  }

  auto self = shared_from_this();
  boost::asio::post(executor_, [self]() { self->start_next(); });
}

//==============================================
// SCHEDULING
//==============================================

void RefillGate::start_next() {
  Admission next;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
      active_ = false;
      running_ = false;
      return;
    }
    next = std::move(queue_.front());
    queue_.pop();
    running_ = true;
  }

  auto self = shared_from_this();
  auto completed = std::make_shared<std::atomic<bool>>(false);
  Completion handler = std::move(next.handler);

  Completion finish = [self, handler, completed](const boost::system::error_code& ec, std::size_t bytes) {
    if (completed->exchange(true)) {
      BOOST_LOG_TRIVIAL(warning) << "Refill gate: Ignoring repeated completion";
      return;
    }
    {
      std::lock_guard<std::mutex> lock(self->mutex_);
      self->running_ = false;
    }
    if (handler) {
      boost::asio::post(self->executor_, [handler, ec, bytes]() { handler(ec, bytes); });
    }
    boost::asio::post(self->executor_, [self]() { self->start_next(); });
  };

  try {
    next.operation(finish);
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Refill gate: Admitted operation threw: " << e.what();
    finish(make_error_code(reader_errc::source_failure), 0);
  }
}

//==============================================
// QUERY METHODS
//==============================================

bool RefillGate::busy() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

std::size_t RefillGate::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

} // namespace reader
} // namespace chunkfs
