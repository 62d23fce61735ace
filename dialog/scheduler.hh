#pragma once
#include "dialog/connection.hh"
#include "network_fwd.hh"

namespace http_dialog {

/// scheduler driven by asio steady timers, callbacks run on the given executor
class asio_scheduler final : public scheduler {
public:
  explicit asio_scheduler(executor_type ex);

  auto schedule_once(duration delay, std::function<void()> callback) -> void override;

private:
  executor_type executor_;
};

}	// end of namespace http_dialog
