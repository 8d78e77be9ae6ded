#ifndef ICA_CLIENT_CONFIG_H
#define ICA_CLIENT_CONFIG_H

#include <cstdint>
#include <string>

#include "platform_log.h"

namespace ica::client {

struct AccountConfig {
  std::string identifier;
};

// Empty URLs fall back to the region defaults.
struct EndpointConfig {
  bool china_mainland{false};
  std::string auth;
  std::string setup;
  std::string home;
};

struct SessionConfig {
  std::string cookie_directory;
  std::string client_id;
  bool accept_terms{false};
  std::uint32_t handshake_attempts{2};
};

struct NetworkConfig {
  std::uint32_t timeout_ms{30000};
  std::uint32_t connect_timeout_ms{10000};
  bool verify_tls{true};
  std::string ca_bundle;
  std::string proxy;
  // Run requests on a worker thread instead of the calling thread.
  bool async_transport{false};
  bool treat_access_denied_as_retryable{true};
};

struct ConsentConfig {
  std::uint32_t max_attempts{10};
  std::uint32_t interval_ms{5000};
};

struct LogConfig {
  ica::platform::log::Level level{ica::platform::log::Level::kInfo};
};

struct ClientConfig {
  AccountConfig account;
  EndpointConfig endpoints;
  SessionConfig session;
  NetworkConfig network;
  ConsentConfig consent;
  LogConfig log;
};

bool LoadClientConfig(const std::string& path, ClientConfig& out_cfg,
                      std::string& error);

}  // namespace ica::client

#endif  // ICA_CLIENT_CONFIG_H
