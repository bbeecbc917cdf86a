#pragma once

#include <simq/mqtt/buffer.hpp>
#include <simq/mqtt/errors.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace simq::mqtt {

	/// @brief MQTT Packet types
	enum PacketType : uint8_t {
		RESERVED_0 = 0,
		CONNECT = 1,
		CONNACK = 2,
		PUBLISH = 3,
		PUBACK = 4,
		PUBREC = 5,
		PUBREL = 6,
		PUBCOMP = 7,
		SUBSCRIBE = 8,
		SUBACK = 9,
		UNSUBSCRIBE = 10,
		UNSUBACK = 11,
		PINGREQ = 12,
		PINGRESP = 13,
		DISCONNECT = 14,
		RESERVED_15 = 15
	};
	inline std::string_view to_string(PacketType p) {
		switch (p) {
			case CONNECT:     return "CONNECT";
			case CONNACK:     return "CONNACK";
			case PUBLISH:     return "PUBLISH";
			case PUBACK:      return "PUBACK";
			case PUBREC:      return "PUBREC";
			case PUBREL:      return "PUBREL";
			case PUBCOMP:     return "PUBCOMP";
			case SUBSCRIBE:   return "SUBSCRIBE";
			case SUBACK:      return "SUBACK";
			case UNSUBSCRIBE: return "UNSUBSCRIBE";
			case UNSUBACK:    return "UNSUBACK";
			case PINGREQ:     return "PINGREQ";
			case PINGRESP:    return "PINGRESP";
			case DISCONNECT:  return "DISCONNECT";
			default:          return "RESERVED/UNKNOWN";
		}
	}

	inline PacketType packet_type_of(uint8_t header) {
		return static_cast<PacketType>((header >> 4) & 0x0F);
	}

	/// @brief MQTT Quality of Service levels
	enum QoS : uint8_t {
		QOS_0 = 0,  // At most once
		QOS_1 = 1,  // At least once
		QOS_2 = 2   // Exactly once, never sent or accepted by this client
	};
	inline std::string_view to_string(QoS q) {
		switch (q) {
			case QOS_0: return "QoS=0 (At most once)";
			case QOS_1: return "QoS=1 (At least once)";
			case QOS_2: return "QoS=2 (Exactly once)";
			default :   return "QoS unknown";
		}
	}

	inline std::ostream& operator<<(std::ostream& os, QoS q) {
		return os << to_string(q);
	}

	inline std::ostream& operator<<(std::ostream& os, PacketType p) {
		return os << to_string(p);
	}

	// Fixed header bytes used verbatim on the wire.
	namespace header {
		constexpr uint8_t CONNECT    = 0x10;
		constexpr uint8_t CONNACK    = 0x20;
		constexpr uint8_t PUBLISH    = 0x30;
		constexpr uint8_t PUBACK     = 0x40;
		constexpr uint8_t SUBSCRIBE  = 0x82;
		constexpr uint8_t SUBACK     = 0x90;
		constexpr uint8_t PINGREQ    = 0xC0;
		constexpr uint8_t PINGRESP   = 0xD0;
		constexpr uint8_t DISCONNECT = 0xE0;

		constexpr uint8_t PUBLISH_QOS_MASK = 0x06;
		constexpr uint8_t PUBLISH_RETAIN   = 0x01;
		constexpr uint8_t PUBLISH_DUP      = 0x08;
	}

	// Outbound QoS check shared by the encoders: 2 is a protocol level this
	// client does not implement, anything above is not a QoS at all.
	inline void require_supported_qos(unsigned qos) {
		if (qos == QOS_2) {
			throw UnsupportedQoSException(qos);
		}
		if (qos > QOS_2) {
			throw PreconditionException("qos " + std::to_string(qos) + " out of range");
		}
	}

	// Base packet class
	class MqttPacket {
	protected:
		PacketType type_;
		uint8_t flags_;

	public:
		MqttPacket(PacketType type, uint8_t flags = 0)
			: type_(type), flags_(flags) {}
		virtual ~MqttPacket() = default;

		virtual void serialize(Buffer& buffer) const = 0;

		// Throws when the packet cannot be encoded.
		virtual void validate() const {}

		uint8_t header_byte() const {
			return static_cast<uint8_t>((type_ << 4) | (flags_ & 0x0F));
		}

	protected:
		void write_fixed_header(Buffer& buffer, uint32_t remaining_length) const {
			buffer.write_byte(header_byte());
			buffer.write_variable_length(remaining_length);
		}
	};

	struct LastWill {
		std::string topic;
		std::string message;
		QoS qos = QOS_0;
		bool retain = false;
	};

	// CONNECT packet
	class ConnectPacket : public MqttPacket {
	private:
		static constexpr uint8_t PROTOCOL_LEVEL = 4;  // MQTT 3.1.1
		static constexpr uint32_t VARIABLE_HEADER_SIZE = 10;

		std::string client_id_;
		uint16_t keep_alive_ = 0;
		bool clean_session_ = true;
		std::optional<LastWill> will_;
		std::optional<std::string> username_;
		std::optional<std::string> password_;

	public:
		ConnectPacket() : MqttPacket(CONNECT) {}

		void set_client_id(const std::string& id) { client_id_ = id; }
		void set_keep_alive(uint16_t seconds) { keep_alive_ = seconds; }
		void set_clean_session(bool clean) { clean_session_ = clean; }
		void set_will(const LastWill& will) { will_ = will; }
		void set_username(const std::string& user) { username_ = user; }
		void set_password(const std::string& pass) { password_ = pass; }

		uint8_t connect_flags() const {
			uint8_t flags = 0;
			if (clean_session_) flags |= 0x02;
			if (will_.has_value()) {
				flags |= 0x04;
				flags |= static_cast<uint8_t>((will_->qos & 0x03) << 3);
				if (will_->retain) flags |= 0x20;
			}
			// Password without a username is not representable in 3.1.1
			if (username_.has_value()) {
				flags |= 0x80;
				if (password_.has_value()) flags |= 0x40;
			}
			return flags;
		}

		uint32_t remaining_length() const {
			size_t size = VARIABLE_HEADER_SIZE + 2 + client_id_.size();
			if (will_.has_value()) {
				size += 2 + will_->topic.size() + 2 + will_->message.size();
			}
			if (username_.has_value()) {
				size += 2 + username_->size();
				if (password_.has_value()) {
					size += 2 + password_->size();
				}
			}
			return static_cast<uint32_t>(size);
		}

		void validate() const override {
			if (client_id_.size() > 0xFFFF) {
				throw PreconditionException("client id exceeds 65535 bytes");
			}
			if (will_.has_value()) {
				if (will_->topic.empty()) {
					throw PreconditionException("last will topic must not be empty");
				}
				require_supported_qos(will_->qos);
			}
		}

		void serialize(Buffer& buffer) const override {
			validate();

			write_fixed_header(buffer, remaining_length());

			// Variable header
			buffer.write_string("MQTT");
			buffer.write_byte(PROTOCOL_LEVEL);
			buffer.write_byte(connect_flags());
			buffer.write_uint16(keep_alive_);

			// Payload
			buffer.write_string(client_id_);

			if (will_.has_value()) {
				buffer.write_string(will_->topic);
				buffer.write_string(will_->message);
			}

			if (username_.has_value()) {
				buffer.write_string(username_.value());
				if (password_.has_value()) {
					buffer.write_string(password_.value());
				}
			}
		}
	};

	// CONNACK packet, fixed four bytes in 3.1.1
	struct ConnAckPacket {
		static constexpr size_t WIRE_SIZE = 4;

		bool session_present = false;
		uint8_t return_code = 0;

		static ConnAckPacket parse(const std::vector<uint8_t>& bytes) {
			if (bytes.size() != WIRE_SIZE) {
				throw ConnectProtocolException("expected 4 bytes, got " + std::to_string(bytes.size()));
			}
			if (bytes[0] != header::CONNACK) {
				throw ConnectProtocolException("unexpected packet header " + std::to_string(bytes[0]));
			}
			if (bytes[1] != 0x02) {
				throw ConnectProtocolException("invalid remaining length " + std::to_string(bytes[1]));
			}

			ConnAckPacket ack;
			ack.session_present = (bytes[2] & 0x01) != 0;
			ack.return_code = bytes[3];
			return ack;
		}
	};

	// PUBLISH packet
	class PublishPacket : public MqttPacket {
	private:
		std::string topic_;
		std::string payload_;
		uint16_t packet_id_ = 0;
		QoS qos_ = QOS_0;
		bool retain_ = false;
		bool dup_ = false;

	public:
		PublishPacket() : MqttPacket(PUBLISH) {}

		void set_topic(const std::string& topic) { topic_ = topic; }
		void set_payload(std::string_view payload) { payload_.assign(payload.begin(), payload.end()); }
		void set_qos(QoS qos) { qos_ = qos; }
		void set_packet_id(uint16_t id) { packet_id_ = id; }
		void set_retain(bool retain) { retain_ = retain; }
		void set_dup(bool dup) { dup_ = dup; }

		uint8_t first_byte() const {
			uint8_t byte = header::PUBLISH;
			byte |= static_cast<uint8_t>(qos_ << 1);
			if (retain_) byte |= header::PUBLISH_RETAIN;
			if (dup_) byte |= header::PUBLISH_DUP;
			return byte;
		}

		uint32_t remaining_length() const {
			size_t size = 2 + topic_.size() + payload_.size();
			if (qos_ > QOS_0) {
				size += 2;
			}
			if (size > varint::MAX_VALUE) {
				throw PreconditionException("PUBLISH exceeds maximum packet size");
			}
			return static_cast<uint32_t>(size);
		}

		// Throws when the topic or the whole packet is too large to encode.
		void validate_size() const {
			if (topic_.size() > 0xFFFF) {
				throw PreconditionException("topic length " + std::to_string(topic_.size()) +
					" exceeds 65535");
			}
			remaining_length();
		}

		void validate() const override {
			require_supported_qos(qos_);
			validate_size();
			if (qos_ > QOS_0 && packet_id_ == 0) {
				throw PreconditionException("QoS 1 PUBLISH requires a packet id");
			}
		}

		void serialize(Buffer& buffer) const override {
			validate();

			buffer.write_byte(first_byte());
			buffer.write_variable_length(remaining_length());
			buffer.write_string(topic_);
			if (qos_ > QOS_0) {
				buffer.write_uint16(packet_id_);
			}
			// No length prefix, implied by the remaining length
			buffer.write_bytes(payload_);
		}
	};

	// PUBACK packet
	class PubAckPacket : public MqttPacket {
	private:
		uint16_t packet_id_ = 0;

	public:
		explicit PubAckPacket(uint16_t packet_id) : MqttPacket(PUBACK), packet_id_(packet_id) {}

		void serialize(Buffer& buffer) const override {
			write_fixed_header(buffer, 2);
			buffer.write_uint16(packet_id_);
		}
	};

	// SUBSCRIBE packet, one topic filter per packet
	class SubscribePacket : public MqttPacket {
	private:
		uint16_t packet_id_ = 0;
		std::string topic_;
		QoS qos_ = QOS_0;

	public:
		SubscribePacket() : MqttPacket(SUBSCRIBE, 0x02) {}

		void set_packet_id(uint16_t id) { packet_id_ = id; }
		void set_topic(const std::string& topic) { topic_ = topic; }
		void set_qos(QoS qos) { qos_ = qos; }

		uint16_t packet_id() const { return packet_id_; }

		void validate_size() const {
			if (topic_.size() > 0xFFFF) {
				throw PreconditionException("topic filter length " + std::to_string(topic_.size()) +
					" exceeds 65535");
			}
		}

		uint32_t remaining_length() const {
			return static_cast<uint32_t>(2 + 2 + topic_.size() + 1);
		}

		void validate() const override {
			require_supported_qos(qos_);
			validate_size();
			if (packet_id_ == 0) {
				throw PreconditionException("SUBSCRIBE requires a packet id");
			}
		}

		void serialize(Buffer& buffer) const override {
			validate();

			write_fixed_header(buffer, remaining_length());
			buffer.write_uint16(packet_id_);
			buffer.write_string(topic_);
			buffer.write_byte(static_cast<uint8_t>(qos_));
		}
	};

	// SUBACK packet body: remaining length, packet id, one return code
	struct SubAckPacket {
		static constexpr size_t BODY_SIZE = 4;
		static constexpr uint8_t FAILURE = 0x80;

		uint16_t packet_id = 0;
		uint8_t return_code = 0;

		static SubAckPacket parse(const std::vector<uint8_t>& body) {
			if (body.size() != BODY_SIZE) {
				throw FramingMismatchException(BODY_SIZE, body.size(), "SUBACK");
			}
			if (body[0] != 0x03) {
				throw FramingMismatchException("SUBACK remaining length " +
					std::to_string(body[0]) + ", expected 3");
			}

			SubAckPacket ack;
			ack.packet_id = static_cast<uint16_t>((body[1] << 8) | body[2]);
			ack.return_code = body[3];

			if (ack.return_code == FAILURE) {
				throw SubscribeRejectedException(ack.packet_id);
			}
			if (ack.return_code > QOS_2) {
				throw FramingMismatchException("SUBACK return code " +
					std::to_string(ack.return_code) + " is not a granted QoS");
			}
			return ack;
		}
	};

	// PINGREQ packet
	class PingReqPacket : public MqttPacket {
	public:
		PingReqPacket() : MqttPacket(PINGREQ) {}

		void serialize(Buffer& buffer) const override {
			write_fixed_header(buffer, 0);
		}
	};

	// DISCONNECT packet
	class DisconnectPacket : public MqttPacket {
	public:
		DisconnectPacket() : MqttPacket(DISCONNECT) {}

		void serialize(Buffer& buffer) const override {
			write_fixed_header(buffer, 0);
		}
	};

} // namespace simq::mqtt
