#include "dialog/scheduler.hh"
#include "log/logging.hh"
#include <boost/asio/error.hpp>

namespace http_dialog {

asio_scheduler::asio_scheduler(executor_type ex) : executor_{std::move(ex)} {
}

auto asio_scheduler::schedule_once(duration delay, std::function<void()> callback) -> void {
  auto timer = std::make_shared<asio::steady_timer>(executor_, delay);
  // the handler owns the timer until it fires
  timer->async_wait([timer, callback = std::move(callback)](const boost::system::error_code& e) {
    if (e) {
      if (e != asio::error::operation_aborted) {
        LOG(ERROR) << "timer failed: " << e.message() << ENDL;
      }
      return;
    }
    callback();
  });
}

}	// end of namespace http_dialog
