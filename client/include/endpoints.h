#ifndef ICA_CLIENT_ENDPOINTS_H
#define ICA_CLIENT_ENDPOINTS_H

#include <string>

namespace ica::client {

// Public OAuth widget key of the web client.
constexpr char kWidgetKey[] =
    "d39ba9916b7251055b22c7f910e2ea796ee65e98b2ddecea8f5dde8d9d1a815d";

struct Endpoints {
  std::string auth;
  std::string setup;
  std::string home;

  static Endpoints ForRegion(bool china_mainland);
};

}  // namespace ica::client

#endif  // ICA_CLIENT_ENDPOINTS_H
