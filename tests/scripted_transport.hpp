#pragma once

#include <simq/mqtt/errors.hpp>
#include <simq/mqtt/tls_socket.hpp>
#include <simq/mqtt/transport.hpp>

#include <deque>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace simq::mqtt::test {

    // State shared between a test and the transport owned by the client.
    struct ScriptedState {
        // Inbound stream; std::nullopt entries are read timeouts.
        std::deque<std::optional<uint8_t>> inbound;
        // What read() returns once inbound is drained: closed or timed out
        bool peer_closed = false;

        std::vector<uint8_t> written;
        std::optional<size_t> write_limit;
        std::vector<SocketTimeout> timeouts;

        std::string host;
        uint16_t port = 0;
        int connects = 0;
        int closes = 0;
        bool upgraded = false;
        bool fail_connect = false;

        void feed(std::initializer_list<uint8_t> bytes) {
            for (uint8_t b : bytes) {
                inbound.push_back(b);
            }
        }

        void feed(const std::vector<uint8_t>& bytes) {
            for (uint8_t b : bytes) {
                inbound.push_back(b);
            }
        }

        void feed_timeout() {
            inbound.push_back(std::nullopt);
        }

        size_t unread() const {
            return inbound.size();
        }
    };

    class ScriptedTransport : public ITransport {
    private:
        std::shared_ptr<ScriptedState> state_;
        bool open_ = false;

    public:
        explicit ScriptedTransport(std::shared_ptr<ScriptedState> state)
            : state_(std::move(state)) {}

        void connect(const std::string& host, uint16_t port) override {
            state_->host = host;
            state_->port = port;
            state_->connects++;
            if (state_->fail_connect) {
                throw TransportException("connection refused");
            }
            open_ = true;
        }

        void upgrade_to_secure(const TLSConfig&, const std::string&) override {
            state_->upgraded = true;
        }

        void set_timeout(SocketTimeout timeout) override {
            state_->timeouts.push_back(timeout);
        }

        std::optional<std::vector<uint8_t>> read(size_t n) override {
            std::vector<uint8_t> data;
            auto& inbound = state_->inbound;

            while (data.size() < n) {
                if (inbound.empty()) {
                    if (data.empty() && !state_->peer_closed) {
                        return std::nullopt;
                    }
                    break;
                }
                if (!inbound.front()) {
                    if (data.empty()) {
                        inbound.pop_front();
                        return std::nullopt;
                    }
                    break;
                }
                data.push_back(*inbound.front());
                inbound.pop_front();
            }

            return data;
        }

        int write(const uint8_t* data, size_t len) override {
            size_t accepted = len;
            if (state_->write_limit && *state_->write_limit < len) {
                accepted = *state_->write_limit;
            }
            state_->written.insert(state_->written.end(), data, data + accepted);
            return static_cast<int>(accepted);
        }

        void close() override {
            if (open_) {
                open_ = false;
                state_->closes++;
            }
        }

        bool is_open() const override {
            return open_;
        }
    };

    inline TransportFactory scripted_factory(std::shared_ptr<ScriptedState> state) {
        return [state]() {
            return std::make_unique<ScriptedTransport>(state);
        };
    }

} // namespace simq::mqtt::test
