#include "network/message_dispatcher.hpp"
#include "util/logging.hpp"

namespace peerwatch {
namespace network {

void MessageDispatcher::RegisterHandler(const std::string& type, MessageHandler handler) {
  if (type.empty() || !handler) {
    LOG_NET_ERROR("refusing handler registration for envelope type '{}'", type);
    return;
  }
  handlers_[type] = std::move(handler);
  LOG_NET_TRACE("registered handler for {}", type);
}

bool MessageDispatcher::Dispatch(const Endpoint& from, const message::Message& msg) const {
  const std::string type = msg.command();
  auto it = handlers_.find(type);
  if (it == handlers_.end()) {
    LOG_NET_TRACE("no handler for {} from {}", type, from.ToString());
    return false;
  }

  try {
    return it->second(from, msg);
  } catch (const std::exception& e) {
    LOG_NET_ERROR("{} handler failed for {} from {}: {}", type, msg.from, from.ToString(), e.what());
    return false;
  }
}

} // namespace network
} // namespace peerwatch
