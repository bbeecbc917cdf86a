#pragma once

#include <simq/mqtt/errors.hpp>
#include <simq/mqtt/logger.hpp>
#include <simq/mqtt/socket.hpp>
#include <simq/mqtt/tls_socket.hpp>
#include <simq/mqtt/transport.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace simq::mqtt {

    // ITransport over a TCP socket, optionally upgraded to TLS after connect.
    class SocketTransport : public ITransport {
    private:
        std::unique_ptr<Socket> socket_;

    public:
        SocketTransport() = default;

        ~SocketTransport() override {
            close();
        }

        void connect(const std::string& host, uint16_t port) override {
            if (socket_ && socket_->is_valid()) {
                throw TransportException("socket already connected");
            }

            socket_ = std::make_unique<Socket>();
            SIMQ_LOG_DEBUG("TRANSPORT") << "Connecting to " << host << ":" << port << "...";

            if (!socket_->connect(host, port)) {
                std::string error = Socket::get_last_error_string();
                socket_.reset();
                throw TransportException("cannot connect to " + host + ":" +
                    std::to_string(port) + ": " + error);
            }

            socket_->set_tcp_nodelay(true);
            SIMQ_LOG_DEBUG("TRANSPORT") << "TCP connection established";
        }

        void upgrade_to_secure(const TLSConfig& config, const std::string& host) override {
            if (!socket_ || !socket_->is_valid()) {
                throw TransportException("TLS upgrade requires a connected socket");
            }
            if (socket_->is_tls()) {
                throw TransportException("TLS already enabled");
            }

            auto tls_socket = std::make_unique<TLSSocket>(std::move(*socket_));
            socket_.reset();

            if (!tls_socket->enable_tls(config, host)) {
                throw TransportException("cannot enable TLS: " + tls_socket->get_last_error().message());
            }

            if (!tls_socket->perform_handshake()) {
                throw TransportException("TLS handshake failed: " + tls_socket->get_last_error().message());
            }

            SIMQ_LOG_INFO("TRANSPORT") << "TLS connection established ("
                << tls_socket->get_protocol_version() << ")";
            SIMQ_LOG_DEBUG("TRANSPORT") << "Cipher: " << tls_socket->get_cipher();

            socket_ = std::move(tls_socket);
        }

        void set_timeout(SocketTimeout timeout) override {
            if (!socket_) {
                return;
            }

            bool ok;
            if (!timeout) {
                ok = socket_->set_non_blocking(false) &&
                    socket_->set_receive_timeout(0) &&
                    socket_->set_send_timeout(0);
            }
            else if (timeout->count() <= 0) {
                ok = socket_->set_non_blocking(true);
            }
            else {
                int ms = static_cast<int>(timeout->count());
                ok = socket_->set_non_blocking(false) &&
                    socket_->set_receive_timeout(ms) &&
                    socket_->set_send_timeout(ms);
            }

            if (!ok) {
                throw TransportException("cannot set socket timeout: " + Socket::get_last_error_string());
            }
        }

        std::optional<std::vector<uint8_t>> read(size_t n) override {
            std::vector<uint8_t> data(n);
            size_t received = 0;

            while (socket_ && received < n) {
                int r = socket_->receive(data.data() + received, n - received);
                if (r > 0) {
                    received += static_cast<size_t>(r);
                    continue;
                }

                if (r < 0 && errno == EINTR) {
                    continue;
                }

                if (r < 0 && Socket::would_block() && received == 0) {
                    return std::nullopt;
                }

                if (r < 0 && !Socket::would_block()) {
                    SIMQ_LOG_DEBUG("TRANSPORT") << "Receive failed: " << Socket::get_last_error_string();
                }

                // Closed by peer, failed, or timed out part way through
                break;
            }

            data.resize(received);
            return data;
        }

        int write(const uint8_t* data, size_t len) override {
            if (!socket_) {
                return -1;
            }

            size_t sent = 0;
            while (sent < len) {
                int w = socket_->send(data + sent, len - sent);
                if (w > 0) {
                    sent += static_cast<size_t>(w);
                    continue;
                }

                if (w < 0 && errno == EINTR) {
                    continue;
                }

                SIMQ_LOG_DEBUG("TRANSPORT") << "Send failed after " << sent << " of " << len
                    << " bytes: " << Socket::get_last_error_string();
                return sent > 0 ? static_cast<int>(sent) : -1;
            }

            return static_cast<int>(sent);
        }

        void close() override {
            if (socket_) {
                socket_->close();
                socket_.reset();
            }
        }

        bool is_open() const override {
            return socket_ && socket_->is_connected();
        }
    };

    inline std::unique_ptr<ITransport> make_socket_transport() {
        return std::make_unique<SocketTransport>();
    }

} // namespace simq::mqtt
