#include <conduit/gateway/correlator.hpp>

#include <conduit/common/exceptions.hpp>
#include <conduit/common/util.hpp>
#include <conduit/common/uuid.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace conduit::gateway {

  bool ReplySlot::fill(messaging::MessagePtr reply)
  {
    {
      std::lock_guard<std::mutex> lock{_lock};
      if (_state != State::EMPTY) {
        return false;
      }
      _reply = std::move(reply);
      _state = State::VALUE;
    }
    _cv.notify_all();
    return true;
  }

  bool ReplySlot::fail(std::exception_ptr exc)
  {
    {
      std::lock_guard<std::mutex> lock{_lock};
      if (_state != State::EMPTY) {
        return false;
      }
      _error = std::move(exc);
      _state = State::ERROR;
    }
    _cv.notify_all();
    return true;
  }

  ReplySlot::State ReplySlot::await(messaging::timeout_t timeout)
  {
    std::unique_lock<std::mutex> lock{_lock};
    auto written = [this]() { return _state != State::EMPTY; };

    if (!timeout.has_value()) {
      _cv.wait(lock, written);
      return _state;
    }

    // Expiry is decided under the same lock as fill/fail - exactly one outcome.
    if (!_cv.wait_for(lock, timeout.value(), written)) {
      _state = State::EXPIRED;
    }
    return _state;
  }

  ReplySlot::State ReplySlot::state() const
  {
    std::lock_guard<std::mutex> lock{_lock};
    return _state;
  }

  messaging::MessagePtr ReplySlot::reply() const
  {
    std::lock_guard<std::mutex> lock{_lock};
    return _reply;
  }

  std::exception_ptr ReplySlot::error() const
  {
    std::lock_guard<std::mutex> lock{_lock};
    return _error;
  }

  PendingRegistry::PendingRegistry()
  {
    _logger = common::util::create_logger("PendingRegistry");
  }

  std::shared_ptr<PendingRegistry> PendingRegistry::global()
  {
    static std::shared_ptr<PendingRegistry> instance = std::make_shared<PendingRegistry>();
    return instance;
  }

  std::shared_ptr<ReplySlot> PendingRegistry::insert(const std::string& id)
  {
    auto slot = std::make_shared<ReplySlot>();

    rw_acc_t acc;
    if (!_slots.insert(acc, id)) {
      throw common::ObjectExists{fmt::format("Invocation {} is already pending", id)};
    }
    acc->second = slot;

    SPDLOG_LOGGER_DEBUG(_logger, "Registered reply slot {}", id);
    return slot;
  }

  std::shared_ptr<ReplySlot> PendingRegistry::_take(const std::string& id)
  {
    rw_acc_t acc;
    if (!_slots.find(acc, id)) {
      return nullptr;
    }
    auto slot = std::move(acc->second);
    _slots.erase(acc);
    return slot;
  }

  bool PendingRegistry::resolve(const std::string& id, messaging::MessagePtr reply)
  {
    auto slot = _take(id);
    if (!slot) {
      SPDLOG_LOGGER_DEBUG(_logger, "Dropping reply for {}, no invocation is waiting", id);
      return false;
    }
    return slot->fill(std::move(reply));
  }

  bool PendingRegistry::fail(const std::string& id, std::exception_ptr exc)
  {
    auto slot = _take(id);
    if (!slot) {
      SPDLOG_LOGGER_DEBUG(_logger, "Dropping failure for {}, no invocation is waiting", id);
      return false;
    }
    return slot->fail(std::move(exc));
  }

  bool PendingRegistry::remove(const std::string& id)
  {
    return _slots.erase(id);
  }

  bool PendingRegistry::contains(const std::string& id) const
  {
    ro_acc_t acc;
    return _slots.find(acc, id);
  }

  size_t PendingRegistry::size() const
  {
    return _slots.size();
  }

  TemporaryReplyChannel::TemporaryReplyChannel(
      std::string id, std::shared_ptr<PendingRegistry> registry
  )
      : _id(std::move(id)), _registry(std::move(registry))
  {
  }

  bool TemporaryReplyChannel::send(const messaging::MessagePtr& msg, messaging::timeout_t)
  {
    if (msg->is_error()) {
      _registry->fail(_id, msg->error());
    } else {
      _registry->resolve(_id, msg);
    }
    return true;
  }

  ReplyCorrelator::ReplyCorrelator(std::shared_ptr<PendingRegistry> registry)
      : _registry(std::move(registry))
  {
    _logger = common::util::create_logger("ReplyCorrelator");
  }

  Correlation ReplyCorrelator::open()
  {
    std::string id = common::UUID::next();
    auto slot = _registry->insert(id);
    auto channel = std::make_shared<TemporaryReplyChannel>(id, _registry);
    return Correlation{std::move(id), std::move(slot), std::move(channel)};
  }

  messaging::MessagePtr
  ReplyCorrelator::await(const Correlation& correlation, messaging::timeout_t timeout)
  {
    auto state = correlation.slot->await(timeout);

    // Filled slots are removed by the resolving side; this covers expiry.
    _registry->remove(correlation.id);

    switch (state) {
    case ReplySlot::State::VALUE:
      return correlation.slot->reply();
    case ReplySlot::State::ERROR:
      std::rethrow_exception(correlation.slot->error());
    case ReplySlot::State::EXPIRED:
      SPDLOG_LOGGER_DEBUG(
          _logger, "No reply for {} within {} ms", correlation.id, timeout.value().count()
      );
      return nullptr;
    case ReplySlot::State::EMPTY:
      break;
    }
    throw common::ConduitException{
        fmt::format("Reply slot {} returned from waiting while empty", correlation.id)
    };
  }

  bool ReplyCorrelator::resolve(const std::string& id, messaging::MessagePtr reply)
  {
    return _registry->resolve(id, std::move(reply));
  }

  bool ReplyCorrelator::fail(const std::string& id, std::exception_ptr exc)
  {
    return _registry->fail(id, std::move(exc));
  }

  void ReplyCorrelator::release(const Correlation& correlation)
  {
    _registry->remove(correlation.id);
  }

} // namespace conduit::gateway
