#include "ragkb_api/server.hpp"

#include <cstdint>
#include <iostream>

namespace ragkb_api {

Server::Server(const std::string &host, int port, unsigned int threads)
    : host_(host), port_(port), threads_(threads == 0 ? 1 : threads), running_(false) {}

Server::~Server() {
  stop();
}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  std::cout << "Listening on " << host_ << ":" << port_ << " with " << threads_
            << " thread(s)" << std::endl;
  server_thread_future_ = std::async(std::launch::async, [this] {
    app_.bindaddr(host_)
        .port(static_cast<std::uint16_t>(port_))
        .concurrency(static_cast<std::uint16_t>(threads_))
        .run();
  });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();

  if (server_thread_future_.valid()) {
    server_thread_future_.get();
  }
  running_ = false;
}

}  // namespace ragkb_api
