#ifndef CHUNKFS_REFILL_GATE_HPP
#define CHUNKFS_REFILL_GATE_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <boost/asio/any_io_executor.hpp>
#include <boost/system/error_code.hpp>

namespace chunkfs {
namespace reader {

// Serializing asynchronous lock. Admitted operations run one at a time, in
// admission order; the next one starts only after the previous one called its
// completion. A failed operation does not block the operations queued behind it.
class RefillGate : public std::enable_shared_from_this<RefillGate> {
public:
  using Completion = std::function<void(const boost::system::error_code&, std::size_t)>;
  // Receives the completion it must call exactly once when its asynchronous work ends
  using Operation = std::function<void(Completion)>;

  // Delete copy operations, queued operations refer to this instance
  RefillGate(const RefillGate&) = delete;
  RefillGate& operator=(const RefillGate&) = delete;


  // ---- CONSTRUCTION ----
  static std::shared_ptr<RefillGate> create(boost::asio::any_io_executor executor);
  explicit RefillGate(boost::asio::any_io_executor executor);


  // ---- ADMISSION ----
  // Queues operation; handler receives its result on the executor
  void run_exclusive(Operation operation, Completion handler);


  // ---- QUERY METHODS ----
  // True while an admitted operation has not completed yet
  bool busy() const;
  // Operations admitted but not started
  std::size_t pending() const;

private:
  struct Admission {
    Operation operation;
    Completion handler;
  };

  // ---- PARAMETERS ----
  boost::asio::any_io_executor executor_;
  mutable std::mutex mutex_;
  std::queue<Admission> queue_;
  bool active_{false};
  bool running_{false};


  // ---- SCHEDULING ----
  // Pops and runs the next admission, or marks the gate idle
  void start_next();
};

} // namespace reader
} // namespace chunkfs

#endif // CHUNKFS_REFILL_GATE_HPP
