#include "WebSocketContext.hpp"

#include "WebSocketTransport.hpp"

namespace wt {
namespace {
const lws_protocols CLIENT_PROTOCOLS[] = {
    {"wt-client", WebSocketTransport::lwsCallback, 0, 64 * 1024, 0, NULL, 0},
    {NULL, NULL, 0, 0, 0, NULL, 0}};
}  // namespace

WebSocketContext::WebSocketContext() {
  lws_set_log_level(LLL_ERR | LLL_WARN, NULL);

  lws_context_creation_info info;
  memset(&info, 0, sizeof(info));
  info.port = CONTEXT_PORT_NO_LISTEN;
  info.protocols = CLIENT_PROTOCOLS;
  info.gid = -1;
  info.uid = -1;
  info.options = LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;
  context = lws_create_context(&info);
  if (context == NULL) {
    throw std::runtime_error("Could not create libwebsockets context");
  }
  LOG(INFO) << "Created websocket context";
}

WebSocketContext::~WebSocketContext() {
  if (context) {
    lws_context_destroy(context);
    context = NULL;
  }
}

shared_ptr<Transport> WebSocketContext::create() {
  return shared_ptr<Transport>(new WebSocketTransport(shared_from_this()));
}

void WebSocketContext::poll(int timeoutMs) {
  // A negative timeout makes lws_service return as soon as pending events
  // are handled; the caller paces the loop.
  VLOG(5) << "Servicing websocket context (budget " << timeoutMs << "ms)";
  lws_service(context, -1);
}
}  // namespace wt
