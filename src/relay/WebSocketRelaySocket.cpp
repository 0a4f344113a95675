#include "WebSocketRelaySocket.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "Errors.hpp"
#include "RelayUrl.hpp"

namespace pt {
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {
const int CONNECT_TIMEOUT_SECONDS = 30;

typedef websocket::stream<beast::tcp_stream> PlainStream;
typedef websocket::stream<beast::ssl_stream<beast::tcp_stream>> SecureStream;

template <typename Stream>
struct StreamTraits;

template <>
struct StreamTraits<PlainStream> {
  static unique_ptr<PlainStream> make(net::io_context& io, ssl::context*) {
    return unique_ptr<PlainStream>(new PlainStream(io));
  }

  template <typename Handler>
  static void handshake(PlainStream&, const string&, Handler handler) {
    handler(beast::error_code());
  }
};

template <>
struct StreamTraits<SecureStream> {
  static unique_ptr<SecureStream> make(net::io_context& io,
                                       ssl::context* context) {
    return unique_ptr<SecureStream>(new SecureStream(io, *context));
  }

  template <typename Handler>
  static void handshake(SecureStream& ws, const string& host,
                        Handler handler) {
    // SNI, most relays sit behind a shared frontend
    if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(),
                                  host.c_str())) {
      handler(beast::error_code(static_cast<int>(::ERR_get_error()),
                                net::error::get_ssl_category()));
      return;
    }
    ws.next_layer().set_verify_callback(ssl::host_name_verification(host));
    ws.next_layer().async_handshake(ssl::stream_base::client, handler);
  }
};

template <typename Stream>
class BeastRelaySocket : public RelaySocket {
 public:
  BeastRelaySocket(const RelayUrl& _url, shared_ptr<ssl::context> _sslContext)
      : url(_url),
        sslContext(_sslContext),
        workGuard(net::make_work_guard(ioContext)),
        resolver(ioContext),
        closed(false) {
    ws = StreamTraits<Stream>::make(ioContext, sslContext.get());
    ioThread.reset(new thread([this]() {
      el::Helpers::setThreadName("relay-io");
      ioContext.run();
    }));
  }

  virtual ~BeastRelaySocket() {
    close();
    workGuard.reset();
    ioContext.stop();
    ioThread->join();
  }

  virtual void connect() {
    auto done = make_shared<promise<void>>();
    auto result = done->get_future();
    net::post(ioContext, [this, done]() {
      if (closed) {
        fail(done, net::error::operation_aborted);
        return;
      }
      resolver.async_resolve(
          url.host, to_string(url.port),
          [this, done](beast::error_code ec,
                       tcp::resolver::results_type results) {
            if (ec || closed) {
              fail(done, ec ? ec : net::error::operation_aborted);
              return;
            }
            onResolved(done, results);
          });
    });
    try {
      result.get();
    } catch (const boost::system::system_error& se) {
      throw RelayConnectFailure("Could not connect to " + url.toString() +
                                ": " + se.code().message());
    }
  }

  virtual void send(const string& text) {
    auto payload = make_shared<string>(text);
    auto done = make_shared<promise<void>>();
    auto result = done->get_future();
    net::post(ioContext, [this, payload, done]() {
      ws->text(true);
      ws->async_write(net::buffer(*payload),
                      [done, payload](beast::error_code ec, size_t) {
                        if (ec) {
                          fail(done, ec);
                        } else {
                          done->set_value();
                        }
                      });
    });
    result.get();
  }

  virtual bool receive(string* text) {
    auto done = make_shared<promise<bool>>();
    auto result = done->get_future();
    net::post(ioContext, [this, text, done]() {
      ws->async_read(readBuffer, [this, text, done](beast::error_code ec,
                                                   size_t) {
        if (ec == websocket::error::closed) {
          done->set_value(false);
          return;
        }
        if (ec) {
          done->set_exception(
              make_exception_ptr(boost::system::system_error(ec)));
          return;
        }
        *text = beast::buffers_to_string(readBuffer.data());
        readBuffer.consume(readBuffer.size());
        done->set_value(true);
      });
    });
    return result.get();
  }

  virtual void close() {
    if (closed.exchange(true)) {
      return;
    }
    net::post(ioContext, [this]() {
      resolver.cancel();
      beast::get_lowest_layer(*ws).close();
    });
  }

 protected:
  template <typename T>
  static void fail(const shared_ptr<promise<T>>& done, beast::error_code ec) {
    done->set_exception(make_exception_ptr(boost::system::system_error(ec)));
  }

  void onResolved(shared_ptr<promise<void>> done,
                  tcp::resolver::results_type results) {
    beast::get_lowest_layer(*ws).expires_after(
        std::chrono::seconds(CONNECT_TIMEOUT_SECONDS));
    beast::get_lowest_layer(*ws).async_connect(
        results, [this, done](beast::error_code ec,
                              tcp::resolver::results_type::endpoint_type) {
          if (ec || closed) {
            fail(done, ec ? ec : net::error::operation_aborted);
            return;
          }
          StreamTraits<Stream>::handshake(
              *ws, url.host, [this, done](beast::error_code ec) {
                if (ec || closed) {
                  fail(done, ec ? ec : net::error::operation_aborted);
                  return;
                }
                onTransportReady(done);
              });
        });
  }

  void onTransportReady(shared_ptr<promise<void>> done) {
    // The websocket layer applies its own timeouts from here on
    beast::get_lowest_layer(*ws).expires_never();
    ws->set_option(websocket::stream_base::timeout::suggested(
        beast::role_type::client));
    ws->set_option(
        websocket::stream_base::decorator([](websocket::request_type& req) {
          req.set(http::field::user_agent, string("portalterm/") + PT_VERSION);
        }));
    string hostHeader = url.host;
    if (url.port != (url.secure ? 443 : 80)) {
      hostHeader += ":" + to_string(url.port);
    }
    ws->async_handshake(hostHeader, url.target,
                        [this, done](beast::error_code ec) {
                          if (ec || closed) {
                            fail(done,
                                 ec ? ec : net::error::operation_aborted);
                            return;
                          }
                          VLOG(1) << "WebSocket open to " << url.toString();
                          done->set_value();
                        });
  }

  RelayUrl url;
  shared_ptr<ssl::context> sslContext;
  net::io_context ioContext;
  net::executor_work_guard<net::io_context::executor_type> workGuard;
  tcp::resolver resolver;
  unique_ptr<Stream> ws;
  beast::flat_buffer readBuffer;
  atomic<bool> closed;
  shared_ptr<thread> ioThread;
};
}  // namespace

WebSocketRelaySocketFactory::WebSocketRelaySocketFactory()
    : sslContext(new ssl::context(ssl::context::tls_client)) {
  sslContext->set_default_verify_paths();
  sslContext->set_verify_mode(ssl::verify_peer);
}

shared_ptr<RelaySocket> WebSocketRelaySocketFactory::create(const string& url) {
  RelayUrl parsed;
  try {
    parsed = RelayUrl::parse(url);
  } catch (const std::runtime_error& re) {
    throw RelayConnectFailure(re.what());
  }
  if (parsed.secure) {
    return shared_ptr<RelaySocket>(
        new BeastRelaySocket<SecureStream>(parsed, sslContext));
  }
  return shared_ptr<RelaySocket>(
      new BeastRelaySocket<PlainStream>(parsed, sslContext));
}
}  // namespace pt
