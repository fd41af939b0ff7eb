#ifndef PEERWATCH_NETWORK_MESSAGE_DISPATCHER_HPP
#define PEERWATCH_NETWORK_MESSAGE_DISPATCHER_HPP

#include "network/message.hpp"
#include "network/transport.hpp"
#include <functional>
#include <map>
#include <string>
#include <utility>

namespace peerwatch {
namespace network {

/**
 * MessageDispatcher - routes decoded envelopes to the component owning
 * their type
 *
 * Handlers are registered once while the NetworkManager is constructed and
 * only run on the reactor thread, so the table needs no locking. The
 * message is borrowed for the duration of the call.
 *
 * Usage:
 *   dispatcher.Register<message::DhtFindMessage>(
 *     [this](const Endpoint& from, const message::DhtFindMessage& m) {
 *       return dht_->HandleFind(from, m);
 *     });
 *   dispatcher.Dispatch(from, *msg);
 */
class MessageDispatcher {
public:
  using MessageHandler = std::function<bool(const Endpoint&, const message::Message&)>;

  // Register a handler for an envelope type; empty types and handlers are
  // rejected, a second registration replaces the first
  void RegisterHandler(const std::string& type, MessageHandler handler);

  // Typed registration: the type comes from MessageT and the handler gets
  // the concrete envelope
  template <typename MessageT>
  void Register(std::function<bool(const Endpoint&, const MessageT&)> handler) {
    if (!handler) {
      RegisterHandler(MessageT().command(), nullptr);
      return;
    }
    RegisterHandler(MessageT().command(),
                    [handler = std::move(handler)](const Endpoint& from, const message::Message& msg) {
                      return handler(from, static_cast<const MessageT&>(msg));
                    });
  }

  // False if no handler owns the type, or the handler failed or threw
  bool Dispatch(const Endpoint& from, const message::Message& msg) const;

private:
  std::map<std::string, MessageHandler> handlers_;
};

} // namespace network
} // namespace peerwatch

#endif // PEERWATCH_NETWORK_MESSAGE_DISPATCHER_HPP
