#pragma once

#include <simq/mqtt/buffer.hpp>
#include <simq/mqtt/config.hpp>
#include <simq/mqtt/errors.hpp>
#include <simq/mqtt/logger.hpp>
#include <simq/mqtt/packet.hpp>
#include <simq/mqtt/packet_id.hpp>
#include <simq/mqtt/pending_acks.hpp>
#include <simq/mqtt/socket_transport.hpp>
#include <simq/mqtt/time_utils.hpp>
#include <simq/mqtt/transport.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace simq::mqtt {

    using MessageCallback = std::function<void(const std::string& topic,
        const std::vector<uint8_t>& payload, bool retained)>;

    // Results of one dispatch step
    struct NoMessage {};

    struct PingResponse {};

    struct PubAckReceived {
        uint16_t packet_id;
        bool known;         // false when reported as DeliveryStatus::UNKNOWN_PID
    };

    struct SubAckReceived {
        uint16_t packet_id;
        QoS granted_qos;
    };

    struct PublishReceived {
        std::string topic;
        QoS qos;
        uint16_t packet_id; // 0 for QoS 0
        bool retained;
    };

    // Control packet the client does not process; its body has been consumed.
    struct UnhandledPacket {
        uint8_t header;
    };

    using InboundPacket = std::variant<NoMessage, PingResponse, PubAckReceived,
        SubAckReceived, PublishReceived, UnhandledPacket>;

    /// @brief MQTT 3.1.1 client for QoS 0 and 1.
    ///
    /// Single owner, no internal threads. The owner drives inbound traffic by
    /// calling wait_msg() or check_msg(); delivery outcomes of QoS 1 PUBLISH
    /// and SUBSCRIBE requests are reported through the status callback.
    ///
    /// A fatal MqttException (see MqttException::is_fatal) closes and drops
    /// the transport before it propagates; connect() must be called again.
    class MqttClient {
    private:
        ClientConfig config_;
        TransportFactory transport_factory_;
        std::shared_ptr<IClock> clock_;

        std::unique_ptr<ITransport> transport_;
        PacketIdAllocator packet_ids_;
        PendingAckTable pending_acks_;
        MessageCallback on_message_;

        Ticks last_rx_;
        Ticks last_rcommand_;

    public:
        explicit MqttClient(ClientConfig config,
            TransportFactory transport_factory = make_socket_transport,
            std::shared_ptr<IClock> clock = std::make_shared<SteadyClock>())
            : config_(std::move(config)),
            transport_factory_(std::move(transport_factory)),
            clock_(std::move(clock)),
            pending_acks_(config_.message_timeout_ms) {
            config_.validate();
            if (!transport_factory_) {
                throw PreconditionException("transport factory must be set");
            }
            if (!clock_) {
                throw PreconditionException("clock must be set");
            }

            last_rx_ = clock_->now_ticks();
            last_rcommand_ = last_rx_;
        }

        ~MqttClient() {
            drop_transport();
        }

        MqttClient(const MqttClient&) = delete;
        MqttClient& operator=(const MqttClient&) = delete;

        void set_callback(MessageCallback callback) {
            on_message_ = std::move(callback);
        }

        void set_callback_status(StatusCallback callback) {
            pending_acks_.set_status_callback(std::move(callback));
        }

        // Opens the transport and performs the CONNECT/CONNACK handshake.
        // Returns the CONNACK session-present flag.
        bool connect(bool clean_session = true, Timeout timeout = Timeout::use_default()) {
            if (transport_) {
                throw PreconditionException("already connected");
            }

            // Encode first so that invalid settings never open a socket
            Buffer packet = build_connect(clean_session);

            const uint16_t port = config_.effective_port();
            SIMQ_LOG_INFO("CLIENT") << "Connecting to " << config_.host << ":" << port
                << (config_.use_tls ? " (TLS)" : "");

            transport_ = transport_factory_();
            if (!transport_) {
                throw TransportException("transport factory returned no transport");
            }

            try {
                transport_->connect(config_.host, port);
                transport_->set_timeout(timeout.resolve(config_.socket_timeout));
                if (config_.use_tls) {
                    transport_->upgrade_to_secure(config_.tls_config, config_.host);
                }

                SIMQ_LOG_DEBUG("CLIENT") << "Sending CONNECT packet (" << packet.size() << " bytes)";
                write_all(packet);

                if (clean_session) {
                    pending_acks_.clear();
                    packet_ids_.reset();
                }

                ConnAckPacket ack = ConnAckPacket::parse(read_exact(ConnAckPacket::WIRE_SIZE));
                if (ack.return_code != 0) {
                    throw_connect_error(ack.return_code);
                }

                last_rcommand_ = clock_->now_ticks();
                SIMQ_LOG_INFO("CLIENT") << "Connected"
                    << (ack.session_present ? ", session resumed" : "");
                return ack.session_present;
            }
            catch (const std::exception& e) {
                SIMQ_LOG_ERROR("CLIENT") << "Connection failed: " << e.what();
                drop_transport();
                throw;
            }
        }

        void disconnect(Timeout timeout = Timeout::use_default()) {
            require_connected("disconnect");

            Buffer packet(2);
            DisconnectPacket().serialize(packet);

            guarded([&]() {
                apply_timeout(timeout);
                write_all(packet);
                });

            drop_transport();
            SIMQ_LOG_INFO("CLIENT") << "Disconnected";
        }

        void ping(Timeout timeout = Timeout::use_default()) {
            require_connected("ping");

            Buffer packet(2);
            PingReqPacket().serialize(packet);

            guarded([&]() {
                apply_timeout(timeout);
                write_all(packet);
                });
            SIMQ_LOG_DEBUG("CLIENT") << "PINGREQ sent";
        }

        // Returns the packet id awaiting PUBACK for QoS 1, nothing for QoS 0.
        std::optional<uint16_t> publish(const std::string& topic, std::string_view message,
            bool retain = false, QoS qos = QOS_0, bool dup = false,
            Timeout timeout = Timeout::use_default()) {
            require_supported_qos(qos);
            require_connected("publish");

            PublishPacket publish;
            publish.set_topic(topic);
            publish.set_payload(message);
            publish.set_qos(qos);
            publish.set_retain(retain);
            publish.set_dup(dup);
            publish.validate_size();

            std::optional<uint16_t> packet_id;
            if (qos > QOS_0) {
                packet_id = packet_ids_.next();
                publish.set_packet_id(*packet_id);
            }

            Buffer packet(message.size() + topic.size() + 8);
            publish.serialize(packet);

            guarded([&]() {
                apply_timeout(timeout);
                write_all(packet);
                });

            if (packet_id) {
                pending_acks_.register_pid(*packet_id, clock_->now_ticks());
            }

            SIMQ_LOG_DEBUG("CLIENT") << "PUBLISH sent to '" << topic << "' (" << qos
                << (packet_id ? ", packet id " + std::to_string(*packet_id) : std::string()) << ")";
            return packet_id;
        }

        uint16_t subscribe(const std::string& topic, QoS qos = QOS_0,
            Timeout timeout = Timeout::use_default()) {
            require_supported_qos(qos);
            if (!on_message_) {
                throw PreconditionException("subscribe requires a message callback");
            }
            require_connected("subscribe");

            SubscribePacket subscribe;
            subscribe.set_topic(topic);
            subscribe.set_qos(qos);
            subscribe.validate_size();
            subscribe.set_packet_id(packet_ids_.next());

            Buffer packet(topic.size() + 8);
            subscribe.serialize(packet);

            guarded([&]() {
                apply_timeout(timeout);
                write_all(packet);
                });

            pending_acks_.register_pid(subscribe.packet_id(), clock_->now_ticks());

            SIMQ_LOG_DEBUG("CLIENT") << "SUBSCRIBE sent for '" << topic << "' (" << qos
                << ", packet id " << subscribe.packet_id() << ")";
            return subscribe.packet_id();
        }

        // Processes at most one inbound packet, waiting up to the timeout
        // for it to start.
        InboundPacket wait_msg(Timeout timeout = Timeout::use_default()) {
            require_connected("wait_msg");

            return guarded([&]() {
                apply_timeout(timeout);
                return dispatch_one(std::nullopt);
                });
        }

        // Non-blocking dispatch step: returns NoMessage at once when nothing
        // is pending, otherwise reads the packet with the socket timeout.
        InboundPacket check_msg() {
            require_connected("check_msg");

            return guarded([&]() {
                transport_->set_timeout(std::chrono::milliseconds(0));
                return dispatch_one(config_.socket_timeout);
                });
        }

        bool is_connected() const {
            return transport_ && transport_->is_open();
        }

        uint16_t keep_alive() const { return config_.keep_alive; }

        // Tick of the last byte read from the broker
        Ticks last_rx() const { return last_rx_; }

        // Tick of the last fully processed control packet
        Ticks last_rcommand() const { return last_rcommand_; }

        const PendingAckTable& pending_acks() const { return pending_acks_; }

    private:
        Buffer build_connect(bool clean_session) const {
            ConnectPacket connect;
            connect.set_client_id(config_.client_id);
            connect.set_keep_alive(config_.keep_alive);
            connect.set_clean_session(clean_session);
            if (config_.last_will) {
                connect.set_will(*config_.last_will);
            }
            if (config_.username) {
                connect.set_username(*config_.username);
            }
            if (config_.password) {
                connect.set_password(*config_.password);
            }

            Buffer packet(connect.remaining_length() + 5);
            connect.serialize(packet);
            return packet;
        }

        void require_connected(const char* operation) const {
            if (!transport_) {
                throw PreconditionException(std::string(operation) + " requires a connection");
            }
        }

        void apply_timeout(const Timeout& timeout) {
            transport_->set_timeout(timeout.resolve(config_.socket_timeout));
        }

        // Runs f, dropping the transport if it raises a fatal error.
        template<typename F>
        auto guarded(F&& f) -> decltype(f()) {
            try {
                return f();
            }
            catch (const MqttException& e) {
                if (e.is_fatal()) {
                    SIMQ_LOG_ERROR("CLIENT") << e.what()
                        << (e.context().empty() ? "" : " (" + e.context() + ")");
                    drop_transport();
                }
                throw;
            }
        }

        void drop_transport() {
            if (transport_) {
                transport_->close();
                transport_.reset();
            }
        }

        void write_all(const Buffer& packet) {
            int written = transport_->write(packet.data(), packet.size());
            if (written < 0 || static_cast<size_t>(written) != packet.size()) {
                throw FramingMismatchException(packet.size(),
                    written < 0 ? 0 : static_cast<size_t>(written), "write");
            }
        }

        // Reads exactly n bytes of a packet already under way.
        std::vector<uint8_t> read_exact(size_t n) {
            if (n == 0) {
                return {};
            }

            std::optional<std::vector<uint8_t>> data = transport_->read(n);
            if (!data) {
                throw FramingMismatchException(n, 0, "timed out inside a packet");
            }
            if (!data->empty()) {
                last_rx_ = clock_->now_ticks();
            }
            if (data->empty()) {
                throw TransportClosedException();
            }
            if (data->size() != n) {
                throw FramingMismatchException(n, data->size(), "short read");
            }
            return std::move(*data);
        }

        uint16_t read_uint16() {
            std::vector<uint8_t> bytes = read_exact(2);
            return static_cast<uint16_t>((bytes[0] << 8) | bytes[1]);
        }

        uint32_t read_remaining_length() {
            return varint::decode([this]() { return read_exact(1)[0]; });
        }

        void sweep() {
            pending_acks_.sweep(clock_->now_ticks());
        }

        InboundPacket dispatch_one(const std::optional<SocketTimeout>& body_timeout) {
            std::optional<std::vector<uint8_t>> first = transport_->read(1);
            if (!first) {
                sweep();
                return NoMessage{};
            }
            if (first->empty()) {
                throw TransportClosedException();
            }

            last_rx_ = clock_->now_ticks();
            const uint8_t header_byte = (*first)[0];

            if (body_timeout) {
                transport_->set_timeout(*body_timeout);
            }

            switch (packet_type_of(header_byte)) {
            case PINGRESP:
                if (header_byte == header::PINGRESP) {
                    return handle_pingresp();
                }
                break;
            case PUBACK:
                return handle_puback();
            case SUBACK:
                return handle_suback();
            case PUBLISH:
                sweep();
                if (!transport_) {
                    return closed_during_dispatch();
                }
                return handle_publish(header_byte);
            default:
                break;
            }

            sweep();
            if (!transport_) {
                return closed_during_dispatch();
            }
            return handle_unhandled(header_byte);
        }

        // A status callback disconnected the client; the packet is left unread.
        InboundPacket closed_during_dispatch() {
            SIMQ_LOG_DEBUG("CLIENT") << "Connection closed by a callback during dispatch";
            return NoMessage{};
        }

        InboundPacket handle_pingresp() {
            uint8_t remaining = read_exact(1)[0];
            if (remaining != 0) {
                throw FramingMismatchException("PINGRESP remaining length " +
                    std::to_string(remaining) + ", expected 0");
            }

            last_rcommand_ = clock_->now_ticks();
            SIMQ_LOG_DEBUG("CLIENT") << "PINGRESP received";
            sweep();
            return PingResponse{};
        }

        InboundPacket handle_puback() {
            uint8_t remaining = read_exact(1)[0];
            if (remaining != 2) {
                throw FramingMismatchException("PUBACK remaining length " +
                    std::to_string(remaining) + ", expected 2");
            }

            uint16_t packet_id = read_uint16();
            bool known = pending_acks_.contains(packet_id);
            if (known) {
                last_rcommand_ = clock_->now_ticks();
                SIMQ_LOG_DEBUG("CLIENT") << "PUBACK received for packet " << packet_id;
                pending_acks_.resolve(packet_id);
            }
            else {
                SIMQ_LOG_WARN("CLIENT") << "PUBACK for packet " << packet_id
                    << " which is not awaiting one";
                pending_acks_.report_unknown(packet_id);
            }

            sweep();
            return PubAckReceived{ packet_id, known };
        }

        InboundPacket handle_suback() {
            SubAckPacket ack = SubAckPacket::parse(read_exact(SubAckPacket::BODY_SIZE));
            if (!pending_acks_.contains(ack.packet_id)) {
                throw UnexpectedAckException("SUBACK", ack.packet_id);
            }

            last_rcommand_ = clock_->now_ticks();
            SIMQ_LOG_DEBUG("CLIENT") << "SUBACK received for packet " << ack.packet_id
                << ", granted " << static_cast<QoS>(ack.return_code);
            pending_acks_.resolve(ack.packet_id);

            sweep();
            return SubAckReceived{ ack.packet_id, static_cast<QoS>(ack.return_code) };
        }

        InboundPacket handle_publish(uint8_t header_byte) {
            const uint8_t qos_bits = header_byte & header::PUBLISH_QOS_MASK;
            if (qos_bits == header::PUBLISH_QOS_MASK) {
                throw FramingMismatchException("PUBLISH with reserved QoS bits");
            }
            const QoS qos = static_cast<QoS>(qos_bits >> 1);

            uint32_t remaining = read_remaining_length();
            if (remaining < 2) {
                throw FramingMismatchException("PUBLISH remaining length " +
                    std::to_string(remaining) + " too short for a topic");
            }

            uint16_t topic_length = read_uint16();
            size_t prefix = 2 + static_cast<size_t>(topic_length) + (qos > QOS_0 ? 2 : 0);
            if (prefix > remaining) {
                throw FramingMismatchException("PUBLISH remaining length " +
                    std::to_string(remaining) + " shorter than its " +
                    std::to_string(prefix) + " byte header");
            }

            std::vector<uint8_t> topic_bytes = read_exact(topic_length);
            std::string topic(topic_bytes.begin(), topic_bytes.end());

            uint16_t packet_id = 0;
            if (qos > QOS_0) {
                packet_id = read_uint16();
            }

            std::vector<uint8_t> payload = read_exact(remaining - prefix);
            const bool retained = (header_byte & header::PUBLISH_RETAIN) != 0;

            SIMQ_LOG_DEBUG("CLIENT") << "PUBLISH received on '" << topic << "' ("
                << payload.size() << " bytes, " << qos << (retained ? ", retained" : "") << ")";

            if (on_message_) {
                on_message_(topic, payload, retained);
            }
            else {
                SIMQ_LOG_WARN("CLIENT") << "No message callback set, dropping message on '" << topic << "'";
            }
            last_rcommand_ = clock_->now_ticks();

            if (qos == QOS_2) {
                throw UnsupportedQoSException(QOS_2, true);
            }

            // The message callback may have disconnected the client
            if (qos == QOS_1 && transport_) {
                Buffer ack(4);
                PubAckPacket(packet_id).serialize(ack);
                write_all(ack);
            }

            return PublishReceived{ topic, qos, packet_id, retained };
        }

        InboundPacket handle_unhandled(uint8_t header_byte) {
            uint32_t remaining = read_remaining_length();
            read_exact(remaining);

            SIMQ_LOG_DEBUG("CLIENT") << "Ignoring " << packet_type_of(header_byte)
                << " packet (" << remaining << " bytes)";
            return UnhandledPacket{ header_byte };
        }
    };

} // namespace simq::mqtt
