#pragma once

#include <simq/mqtt/errors.hpp>
#include <simq/mqtt/packet.hpp>
#include <simq/mqtt/tls_socket.hpp>
#include <simq/mqtt/transport.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace simq::mqtt {

    constexpr uint16_t DEFAULT_PORT = 1883;
    constexpr uint16_t DEFAULT_TLS_PORT = 8883;

    // Client configuration
    struct ClientConfig {
        // Basic settings
        std::string client_id;
        std::string host;
        uint16_t port = 0;                      // 0 selects the protocol default
        std::optional<std::string> username;
        std::optional<std::string> password;    // sent only together with a username
        uint16_t keep_alive = 0;                // seconds, 0 disables

        // Will message
        std::optional<LastWill> last_will;

        // TLS/SSL
        bool use_tls = false;
        TLSConfig tls_config;

        // Timeouts
        SocketTimeout socket_timeout = std::chrono::milliseconds(1000);
        uint32_t message_timeout_ms = 5000;

        void set_last_will(const std::string& topic, const std::string& message,
            bool retain = false, QoS qos = QOS_0) {
            if (topic.empty()) {
                throw PreconditionException("last will topic must not be empty");
            }
            if (qos > QOS_2) {
                throw PreconditionException("last will qos " + std::to_string(qos) + " out of range");
            }

            last_will = LastWill{ topic, message, qos, retain };
        }

        uint16_t effective_port() const {
            if (port != 0) {
                return port;
            }
            return use_tls ? DEFAULT_TLS_PORT : DEFAULT_PORT;
        }

        void validate() const {
            if (host.empty()) {
                throw PreconditionException("host must not be empty");
            }
            if (client_id.size() > 65535) {
                throw PreconditionException("client id longer than 65535 bytes");
            }
            if (last_will && last_will->topic.empty()) {
                throw PreconditionException("last will topic must not be empty");
            }
            if (socket_timeout && socket_timeout->count() < 0) {
                throw PreconditionException("socket timeout must not be negative");
            }
            // Deadlines are compared on 32-bit wrapping ticks
            if (message_timeout_ms >= 0x80000000u) {
                throw PreconditionException("message timeout must be below 2^31 ms");
            }
        }
    };

} // namespace simq::mqtt
