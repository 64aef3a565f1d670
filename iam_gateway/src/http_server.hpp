#pragma once

#include "metrics.hpp"
#include "gateway_api.hpp"

#include <boost/asio.hpp>

#include <cstddef>
#include <memory>
#include <string>

namespace server {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

struct Config {
  std::string listen_host = "0.0.0.0";
  unsigned short listen_port = 9100;
  std::size_t max_request_body_bytes = 1024u * 1024u;
  Metrics* metrics = nullptr;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
  Listener(asio::io_context& ioc, tcp::endpoint endpoint, gateway::Api& api, Config cfg);

  // False when the endpoint could not be bound; run() is then a no-op.
  bool ok() const { return ok_; }
  void run();

private:
  static void fail(boost::system::error_code ec, const char* what);

  void do_accept();
  void on_accept(boost::system::error_code ec, tcp::socket socket);

  asio::io_context& ioc_;
  tcp::acceptor acceptor_;
  gateway::Api& api_;
  Config cfg_;
  bool ok_ = false;
};

} // namespace server
