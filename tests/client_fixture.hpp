#pragma once

#include <gtest/gtest.h>

#include <simq/mqtt/client.hpp>

#include "manual_clock.hpp"
#include "scripted_transport.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace simq::mqtt::test {

    struct ReceivedMessage {
        std::string topic;
        std::string payload;
        bool retained;
    };

    // Client wired to a scripted transport and a manual clock, with both
    // callbacks recording into vectors.
    class ClientTest : public ::testing::Test {
    protected:
        std::shared_ptr<ScriptedState> state = std::make_shared<ScriptedState>();
        std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(1000);

        std::vector<std::pair<uint16_t, DeliveryStatus>> statuses;
        std::vector<ReceivedMessage> messages;

        void SetUp() override {
            Logger::set_level(LogLevel::OFF);
        }

        ClientConfig make_config() {
            ClientConfig config;
            config.client_id = "abc";
            config.host = "broker.test";
            config.message_timeout_ms = 5000;
            return config;
        }

        std::unique_ptr<MqttClient> make_client(const ClientConfig& config) {
            auto client = std::make_unique<MqttClient>(config, scripted_factory(state), clock);
            client->set_callback_status([this](uint16_t pid, DeliveryStatus status) {
                statuses.emplace_back(pid, status);
                });
            client->set_callback([this](const std::string& topic, const std::vector<uint8_t>& payload, bool retained) {
                messages.push_back({ topic, std::string(payload.begin(), payload.end()), retained });
                });
            return client;
        }

        std::unique_ptr<MqttClient> make_client() {
            return make_client(make_config());
        }

        void feed_connack(uint8_t session_present = 0, uint8_t code = 0) {
            state->feed({ 0x20, 0x02, session_present, code });
        }

        // Connected client with the handshake traffic already cleared.
        std::unique_ptr<MqttClient> connected_client(const ClientConfig& config) {
            auto client = make_client(config);
            feed_connack();
            client->connect();
            state->written.clear();
            state->timeouts.clear();
            return client;
        }

        std::unique_ptr<MqttClient> connected_client() {
            return connected_client(make_config());
        }

        std::vector<uint8_t> written() const {
            return state->written;
        }
    };

} // namespace simq::mqtt::test
