#include "fslite/utils/io_executor.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace fslite {
namespace utils {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

IoExecutor::IoExecutor(std::size_t threads, std::chrono::milliseconds timeout)
  : threads_(threads)
  , timeout_(timeout)
  , pool_(threads == 0 ? 1 : threads) {

  if (threads == 0) {
    BOOST_LOG_TRIVIAL(error) << "IO executor: Worker count must be positive";
    throw std::invalid_argument("IO executor: Worker count must be positive");
  }
  if (timeout.count() <= 0) {
    BOOST_LOG_TRIVIAL(error) << "IO executor: Timeout must be positive, got " << timeout.count() << " ms";
    throw std::invalid_argument("IO executor: Timeout must be positive");
  }

  BOOST_LOG_TRIVIAL(info) << "IO executor: Started " << threads_ << " workers, timeout "
                          << timeout_.count() << " ms";
}

IoExecutor::~IoExecutor() {
  BOOST_LOG_TRIVIAL(debug) << "IO executor: Joining workers";
  pool_.join();
}

} // namespace utils
} // namespace fslite
