#pragma once
#include <cstdint>

namespace ssap {

constexpr const char* CLIENT_VERSION = "0.2.0";

constexpr const char* DEFAULT_URI_PREFIX = "ssap://";
constexpr const char* LUNA_URI_PREFIX = "luna://";

constexpr uint16_t DEFAULT_SECURE_PORT = 3001;
constexpr uint16_t DEFAULT_PLAIN_PORT = 3000;

constexpr int DEFAULT_REQUEST_TIMEOUT_MS = 5000;
constexpr int DEFAULT_READY_TIMEOUT_MS = 5000;
constexpr int DEFAULT_RECONNECT_DELAY_MS = 1000;
constexpr int DEFAULT_REGISTER_RETRY_DELAY_MS = 10000;
constexpr int CONNECTION_LOG_WINDOW_MS = 2500;

} // namespace ssap
