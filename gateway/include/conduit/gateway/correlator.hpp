#ifndef CONDUIT_GATEWAY_CORRELATOR_HPP
#define CONDUIT_GATEWAY_CORRELATOR_HPP

#include <conduit/messaging/channel.hpp>
#include <conduit/messaging/message.hpp>

#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <string>

#include <spdlog/logger.h>
#include <tbb/concurrent_hash_map.h>

namespace conduit::gateway {

  /**
   * Rendezvous cell of one outstanding invocation.
   *
   * EMPTY -> VALUE | ERROR | EXPIRED. The first transition wins and later
   * writes are discarded. Only the waiting side moves the slot to EXPIRED.
   **/
  class ReplySlot {
  public:
    enum class State { EMPTY, VALUE, ERROR, EXPIRED };

    bool fill(messaging::MessagePtr reply);

    bool fail(std::exception_ptr exc);

    // Waits until the slot is written or the timeout elapses; the clock starts here.
    State await(messaging::timeout_t timeout);

    State state() const;

    messaging::MessagePtr reply() const;

    std::exception_ptr error() const;

  private:
    mutable std::mutex _lock;
    std::condition_variable _cv;

    State _state = State::EMPTY;
    messaging::MessagePtr _reply;
    std::exception_ptr _error;
  };

  // Process-wide table of reply slots indexed by the request identifier.
  class PendingRegistry {
  public:
    PendingRegistry();

    static std::shared_ptr<PendingRegistry> global();

    // Throws ObjectExists if the identifier is already pending.
    std::shared_ptr<ReplySlot> insert(const std::string& id);

    // Removes the entry and fills the slot. False when nothing is pending under this id
    // or the slot was already expired.
    bool resolve(const std::string& id, messaging::MessagePtr reply);

    bool fail(const std::string& id, std::exception_ptr exc);

    // Idempotent.
    bool remove(const std::string& id);

    bool contains(const std::string& id) const;

    size_t size() const;

  private:
    std::shared_ptr<ReplySlot> _take(const std::string& id);

    // IntelTBB concurrent hash map.
    using table_t = oneapi::tbb::concurrent_hash_map<std::string, std::shared_ptr<ReplySlot>>;
    using rw_acc_t = typename table_t::accessor;
    using ro_acc_t = typename table_t::const_accessor;

    table_t _slots;

    std::shared_ptr<spdlog::logger> _logger;
  };

  /**
   * Private, single-reader reply destination of an invocation.
   *
   * Placed in the reply-channel and error-channel headers of the request. Messages
   * carrying an error indicator fail the slot; others fill it.
   **/
  class TemporaryReplyChannel : public messaging::MessageChannel {
  public:
    TemporaryReplyChannel(std::string id, std::shared_ptr<PendingRegistry> registry);

    // Late and duplicated replies are dropped and still reported as accepted.
    bool send(const messaging::MessagePtr& msg, messaging::timeout_t timeout = std::nullopt) override;

    std::string_view name() const override
    {
      return _id;
    }

  private:
    std::string _id;
    std::shared_ptr<PendingRegistry> _registry;
  };

  struct Correlation {
    std::string id;
    std::shared_ptr<ReplySlot> slot;
    messaging::ChannelPtr reply_channel;
  };

  class ReplyCorrelator {
  public:
    ReplyCorrelator(std::shared_ptr<PendingRegistry> registry);

    // Registers the slot; must be called before the request is sent.
    Correlation open();

    // Returns the reply, or nullptr when the timeout elapsed. Rethrows a failure written
    // to the slot. The registry entry is always released on return.
    messaging::MessagePtr await(const Correlation& correlation, messaging::timeout_t timeout);

    bool resolve(const std::string& id, messaging::MessagePtr reply);

    bool fail(const std::string& id, std::exception_ptr exc);

    // The request was never dispatched.
    void release(const Correlation& correlation);

    const std::shared_ptr<PendingRegistry>& registry() const
    {
      return _registry;
    }

  private:
    std::shared_ptr<PendingRegistry> _registry;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace conduit::gateway

#endif
