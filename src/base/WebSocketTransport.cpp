#include "WebSocketTransport.hpp"

namespace wt {
WebSocketTransport::WebSocketTransport(shared_ptr<WebSocketContext> _context)
    : context(_context), wsi(NULL), connected(false), closing(false) {}

WebSocketTransport::~WebSocketTransport() { detach(); }

void WebSocketTransport::open(const string& _url) {
  if (wsi != NULL) {
    STFATAL << "Tried to open a transport twice";
  }
  url = _url;

  // lws_parse_uri works in place and needs a writable copy
  vector<char> uri(url.begin(), url.end());
  uri.push_back('\0');
  const char* protocol = NULL;
  const char* address = NULL;
  const char* path = NULL;
  int port = 0;
  if (lws_parse_uri(&uri[0], &protocol, &address, &port, &path)) {
    if (listener) {
      listener->onError("Invalid websocket url: " + url);
    }
    return;
  }
  string fullPath = string("/") + path;
  bool useSsl = (string(protocol) == "wss" || string(protocol) == "https");

  lws_client_connect_info ccinfo;
  memset(&ccinfo, 0, sizeof(ccinfo));
  ccinfo.context = context->getContext();
  ccinfo.address = address;
  ccinfo.port = port;
  ccinfo.path = fullPath.c_str();
  ccinfo.host = address;
  ccinfo.origin = address;
  ccinfo.ssl_connection = useSsl ? LCCSCF_USE_SSL : 0;
  ccinfo.userdata = this;
  ccinfo.pwsi = &wsi;

  LOG(INFO) << "Opening websocket to " << url;
  if (lws_client_connect_via_info(&ccinfo) == NULL) {
    wsi = NULL;
    LOG(WARNING) << "Could not start websocket connection to " << url;
    if (listener) {
      listener->onError("Connection to " + url + " failed");
    }
  }
}

void WebSocketTransport::sendText(const string& text) { enqueue(text, false); }

void WebSocketTransport::sendBinary(const string& data) {
  enqueue(data, true);
}

void WebSocketTransport::enqueue(const string& data, bool binary) {
  if (!connected || closing) {
    LOG(INFO) << "Dropping " << data.size() << " byte frame for closed "
              << "transport " << url;
    return;
  }
  writeBuffer.enqueue(data, binary);
  lws_callback_on_writable(wsi);
}

void WebSocketTransport::close() {
  if (wsi == NULL || closing) {
    return;
  }
  LOG(INFO) << "Closing websocket to " << url;
  closing = true;
  lws_callback_on_writable(wsi);
}

void WebSocketTransport::detach() {
  if (wsi == NULL) {
    return;
  }
  // The connection may outlive this object inside lws.  Unhook it and let
  // lws tear it down on the next service.
  lws_set_wsi_user(wsi, NULL);
  lws_set_timeout(wsi, PENDING_TIMEOUT_CLOSE_SEND, LWS_TO_KILL_ASYNC);
  wsi = NULL;
  connected = false;
}

int WebSocketTransport::lwsCallback(lws* wsi, lws_callback_reasons reason,
                                    void* user, void* in, size_t len) {
  WebSocketTransport* transport = static_cast<WebSocketTransport*>(user);
  if (transport == NULL) {
    // Detached connection still draining
    return reason == LWS_CALLBACK_CLIENT_WRITEABLE ? -1 : 0;
  }
  return transport->handleCallback(wsi, reason, in, len);
}

int WebSocketTransport::handleCallback(lws* _wsi, lws_callback_reasons reason,
                                       void* in, size_t len) {
  switch (reason) {
    case LWS_CALLBACK_CLIENT_ESTABLISHED:
      LOG(INFO) << "Websocket established: " << url;
      wsi = _wsi;
      connected = true;
      if (closing) {
        lws_callback_on_writable(_wsi);
        break;
      }
      if (listener) {
        listener->onOpen();
      }
      break;

    case LWS_CALLBACK_CLIENT_RECEIVE: {
      if (lws_is_first_fragment(_wsi)) {
        rxBuffer.clear();
      }
      rxBuffer.append(static_cast<const char*>(in), len);
      if (!lws_is_final_fragment(_wsi) ||
          lws_remaining_packet_payload(_wsi) > 0) {
        break;
      }
      string message;
      message.swap(rxBuffer);
      bool binary = lws_frame_is_binary(_wsi);
      VLOG(3) << "Received " << (binary ? "binary" : "text") << " frame of "
              << message.size() << " bytes";
      if (listener) {
        if (binary) {
          listener->onBinary(message);
        } else {
          listener->onText(message);
        }
      }
      break;
    }

    case LWS_CALLBACK_CLIENT_WRITEABLE:
      // Frames queued before close() still go out first
      if (writeBuffer.hasPendingData()) {
        return writeNextFrame();
      }
      if (closing) {
        lws_close_reason(_wsi, LWS_CLOSE_STATUS_NORMAL, NULL, 0);
        return -1;
      }
      break;

    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
      string message = in ? string(static_cast<const char*>(in), len)
                          : string("connection failed");
      LOG(WARNING) << "Websocket error on " << url << ": " << message;
      wsi = NULL;
      connected = false;
      writeBuffer.clear();
      if (listener) {
        listener->onError(message);
      }
      break;
    }

    case LWS_CALLBACK_CLIENT_CLOSED:
      LOG(INFO) << "Websocket closed: " << url;
      wsi = NULL;
      connected = false;
      writeBuffer.clear();
      if (listener && !closing) {
        listener->onClose();
      }
      break;

    case LWS_CALLBACK_WSI_DESTROY:
      wsi = NULL;
      connected = false;
      break;

    default:
      break;
  }
  return 0;
}

int WebSocketTransport::writeNextFrame() {
  const WriteBuffer::Frame* frame = writeBuffer.peek();
  if (frame == NULL) {
    return 0;
  }
  size_t length = frame->data.size();
  vector<unsigned char> buf(LWS_PRE + length);
  if (length) {
    memcpy(&buf[LWS_PRE], frame->data.data(), length);
  }
  int written =
      lws_write(wsi, &buf[LWS_PRE], length,
                frame->binary ? LWS_WRITE_BINARY : LWS_WRITE_TEXT);
  if (written < (int)length) {
    LOG(WARNING) << "Websocket write failed on " << url;
    return -1;
  }
  writeBuffer.pop();
  if (writeBuffer.hasPendingData() || closing) {
    lws_callback_on_writable(wsi);
  }
  return 0;
}
}  // namespace wt
