#ifndef __WT_WEB_SOCKET_CONTEXT__
#define __WT_WEB_SOCKET_CONTEXT__

#include <libwebsockets.h>

#include "Headers.hpp"
#include "Transport.hpp"

namespace wt {
/**
 * @brief Owns the libwebsockets context shared by every WebSocket transport
 * of the process and services it on the caller's thread.
 */
class WebSocketContext : public TransportFactory,
                         public std::enable_shared_from_this<WebSocketContext> {
 public:
  WebSocketContext();

  virtual ~WebSocketContext();

  /** @brief Creates an unopened transport bound to this context. */
  virtual shared_ptr<Transport> create();

  /**
   * @brief Services pending socket events without blocking.  Transport
   * listeners fire from inside this call.
   */
  virtual void poll(int timeoutMs);

  inline lws_context* getContext() { return context; }

 protected:
  lws_context* context;
};
}  // namespace wt

#endif  // __WT_WEB_SOCKET_CONTEXT__
