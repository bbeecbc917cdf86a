#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <string_view>

namespace simq::mqtt {

    /// @brief CONNACK return codes (MQTT 3.1.1, section 3.2.2.3)
    enum class ConnectReturnCode : uint8_t {
        ACCEPTED = 0,
        UNACCEPTABLE_PROTOCOL_VERSION = 1,
        IDENTIFIER_REJECTED = 2,
        SERVER_UNAVAILABLE = 3,
        BAD_USERNAME_OR_PASSWORD = 4,
        NOT_AUTHORIZED = 5
    };

    inline std::string_view to_string(ConnectReturnCode code) {
        switch (code) {
        case ConnectReturnCode::ACCEPTED:                      return "Connection accepted";
        case ConnectReturnCode::UNACCEPTABLE_PROTOCOL_VERSION: return "Unacceptable protocol version";
        case ConnectReturnCode::IDENTIFIER_REJECTED:           return "Identifier rejected";
        case ConnectReturnCode::SERVER_UNAVAILABLE:            return "Server unavailable";
        case ConnectReturnCode::BAD_USERNAME_OR_PASSWORD:      return "Bad username or password";
        case ConnectReturnCode::NOT_AUTHORIZED:                return "Not authorized";
        default:                                               return "Unknown error";
        }
    }

    // Exception hierarchy. Everything the client raises derives from
    // MqttException; a caught MqttException means the session is gone unless
    // it is a PreconditionException or UnsupportedQoSException thrown before
    // any byte reached the transport.
    class MqttException : public std::exception {
    protected:
        std::string message_;
        std::string context_;

    public:
        MqttException(const std::string& msg, const std::string& ctx = "")
            : message_(msg), context_(ctx) {}

        const char* what() const noexcept override { return message_.c_str(); }
        const std::string& context() const noexcept { return context_; }

        virtual bool is_fatal() const noexcept { return true; }
    };

    class TransportException : public MqttException {
    public:
        explicit TransportException(const std::string& details)
            : MqttException("Transport failure: " + details) {}
    };

    class TransportClosedException : public MqttException {
    public:
        TransportClosedException()
            : MqttException("Connection closed by peer") {}
    };

    class FramingMismatchException : public MqttException {
    public:
        explicit FramingMismatchException(const std::string& details, const std::string& ctx = "")
            : MqttException("Framing mismatch: " + details, ctx) {}

        FramingMismatchException(size_t expected, size_t actual, const std::string& ctx = "")
            : MqttException(
                "Framing mismatch: expected " + std::to_string(expected) +
                " bytes, got " + std::to_string(actual), ctx) {}
    };

    class ConnectProtocolException : public MqttException {
    public:
        explicit ConnectProtocolException(const std::string& details)
            : MqttException("Malformed CONNACK: " + details) {}
    };

    /// @brief CONNACK carried a non-zero return code outside 1..5.
    class ConnectException : public MqttException {
    protected:
        uint8_t code_;

    public:
        explicit ConnectException(uint8_t code)
            : MqttException("Connection refused with return code " + std::to_string(code)),
            code_(code) {}

        ConnectException(uint8_t code, const std::string& msg)
            : MqttException(msg), code_(code) {}

        uint8_t raw_code() const noexcept { return code_; }
    };

    /// @brief CONNACK return code 1..5.
    class ConnectRejectedException : public ConnectException {
    public:
        explicit ConnectRejectedException(ConnectReturnCode code)
            : ConnectException(static_cast<uint8_t>(code),
                "Connection refused: " + std::string(to_string(code))) {}

        ConnectReturnCode code() const noexcept {
            return static_cast<ConnectReturnCode>(code_);
        }
    };

    class UnacceptableProtocolVersionException : public ConnectRejectedException {
    public:
        UnacceptableProtocolVersionException()
            : ConnectRejectedException(ConnectReturnCode::UNACCEPTABLE_PROTOCOL_VERSION) {}
    };

    class IdentifierRejectedException : public ConnectRejectedException {
    public:
        IdentifierRejectedException()
            : ConnectRejectedException(ConnectReturnCode::IDENTIFIER_REJECTED) {}
    };

    class ServerUnavailableException : public ConnectRejectedException {
    public:
        ServerUnavailableException()
            : ConnectRejectedException(ConnectReturnCode::SERVER_UNAVAILABLE) {}
    };

    class BadCredentialsException : public ConnectRejectedException {
    public:
        BadCredentialsException()
            : ConnectRejectedException(ConnectReturnCode::BAD_USERNAME_OR_PASSWORD) {}
    };

    class NotAuthorizedException : public ConnectRejectedException {
    public:
        NotAuthorizedException()
            : ConnectRejectedException(ConnectReturnCode::NOT_AUTHORIZED) {}
    };

    class SubscribeRejectedException : public MqttException {
    public:
        explicit SubscribeRejectedException(uint16_t packet_id)
            : MqttException("Subscription rejected by broker",
                "packet id " + std::to_string(packet_id)) {}
    };

    class UnexpectedAckException : public MqttException {
    public:
        UnexpectedAckException(const std::string& packet, uint16_t packet_id)
            : MqttException(packet + " for unknown packet id " + std::to_string(packet_id)) {}
    };

    // Outbound requests are rejected before anything is written; an inbound
    // QoS 2 PUBLISH means the broker expects a PUBREC we will never send.
    class UnsupportedQoSException : public MqttException {
    private:
        bool inbound_;

    public:
        explicit UnsupportedQoSException(unsigned qos, bool inbound = false)
            : MqttException("QoS " + std::to_string(qos) + " is not supported",
                inbound ? "inbound PUBLISH" : "outbound request"),
            inbound_(inbound) {}

        bool is_inbound() const noexcept { return inbound_; }
        bool is_fatal() const noexcept override { return inbound_; }
    };

    class PreconditionException : public MqttException {
    public:
        explicit PreconditionException(const std::string& details)
            : MqttException("Precondition failed: " + details) {}

        bool is_fatal() const noexcept override { return false; }
    };

    // Throws the exception matching a non-zero CONNACK return code.
    [[noreturn]] inline void throw_connect_error(uint8_t code) {
        switch (static_cast<ConnectReturnCode>(code)) {
        case ConnectReturnCode::UNACCEPTABLE_PROTOCOL_VERSION: throw UnacceptableProtocolVersionException();
        case ConnectReturnCode::IDENTIFIER_REJECTED:           throw IdentifierRejectedException();
        case ConnectReturnCode::SERVER_UNAVAILABLE:            throw ServerUnavailableException();
        case ConnectReturnCode::BAD_USERNAME_OR_PASSWORD:      throw BadCredentialsException();
        case ConnectReturnCode::NOT_AUTHORIZED:                throw NotAuthorizedException();
        default:                                               throw ConnectException(code);
        }
    }

} // namespace simq::mqtt
