#ifndef __WT_WEB_SOCKET_TRANSPORT__
#define __WT_WEB_SOCKET_TRANSPORT__

#include <libwebsockets.h>

#include "Headers.hpp"
#include "Transport.hpp"
#include "WebSocketContext.hpp"
#include "WriteBuffer.hpp"

namespace wt {
/**
 * @brief Transport over one libwebsockets client connection (ws:// or
 * wss://).
 *
 * Outbound frames are queued and written from the writeable callback, one
 * frame per callback.  Fragmented inbound messages are reassembled before
 * they reach the listener.
 */
class WebSocketTransport : public Transport {
 public:
  explicit WebSocketTransport(shared_ptr<WebSocketContext> _context);

  virtual ~WebSocketTransport();

  virtual void open(const string& url);
  virtual void sendText(const string& text);
  virtual void sendBinary(const string& data);
  virtual void close();
  virtual bool isOpen() { return connected && !closing; }
  virtual size_t pendingBytes() { return writeBuffer.size(); }

  /** @brief Protocol callback registered with the shared context. */
  static int lwsCallback(lws* wsi, lws_callback_reasons reason, void* user,
                         void* in, size_t len);

 protected:
  int handleCallback(lws* wsi, lws_callback_reasons reason, void* in,
                     size_t len);
  int writeNextFrame();
  void enqueue(const string& data, bool binary);
  void detach();

  shared_ptr<WebSocketContext> context;
  lws* wsi;
  bool connected;
  bool closing;
  WriteBuffer writeBuffer;
  string rxBuffer;
  string url;
};
}  // namespace wt

#endif  // __WT_WEB_SOCKET_TRANSPORT__
