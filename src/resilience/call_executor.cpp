#include <learnvault/resilience/call_executor.h>

#include <stdexcept>

namespace learnvault::resilience {
namespace {

std::size_t CheckedThreads(std::size_t threads) {
    if (threads == 0) {
        throw std::invalid_argument("CallExecutor threads must be > 0");
    }
    return threads;
}

} // namespace

CallExecutor::CallExecutor(std::size_t threads, std::size_t max_outstanding)
    : threads_(CheckedThreads(threads)),
      max_outstanding_(max_outstanding == 0 ? 4 * threads_ : max_outstanding),
      pool_(threads_) {}

CallExecutor::~CallExecutor() {
    Stop();
}

void CallExecutor::Stop() {
    if (stopped_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    pool_.stop();
    pool_.join();
}

} // namespace learnvault::resilience
