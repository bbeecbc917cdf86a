#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace simq::mqtt {

    // Forward declarations
    struct TLSConfig;

    // Read/write timeout of a transport. std::nullopt blocks indefinitely,
    // zero polls without blocking.
    using SocketTimeout = std::optional<std::chrono::milliseconds>;

    /// @brief Per-call timeout override.
    class Timeout {
    private:
        enum class Kind { DEFAULT, BLOCKING, FIXED };

        Kind kind_;
        std::chrono::milliseconds value_;

        Timeout(Kind kind, std::chrono::milliseconds value) : kind_(kind), value_(value) {}

    public:
        // The client's configured socket timeout.
        static Timeout use_default() { return Timeout(Kind::DEFAULT, std::chrono::milliseconds(0)); }
        static Timeout blocking() { return Timeout(Kind::BLOCKING, std::chrono::milliseconds(0)); }
        static Timeout after(std::chrono::milliseconds value) { return Timeout(Kind::FIXED, value); }

        SocketTimeout resolve(SocketTimeout configured) const {
            switch (kind_) {
            case Kind::BLOCKING: return std::nullopt;
            case Kind::FIXED:    return value_;
            default:             return configured;
            }
        }
    };

    /// @brief Byte-stream transport consumed by the client.
    ///
    /// Implementations report failures to establish the stream by throwing
    /// TransportException. Once connected, read() and write() report through
    /// their return values and the client decides what is fatal.
    class ITransport {
    public:
        virtual ~ITransport() = default;

        virtual void connect(const std::string& host, uint16_t port) = 0;

        // Wraps the connected stream in TLS. host is used for SNI and
        // certificate verification unless the config names one.
        virtual void upgrade_to_secure(const TLSConfig& config, const std::string& host) = 0;

        virtual void set_timeout(SocketTimeout timeout) = 0;

        // Exactly n bytes on success; fewer (possibly zero) when the peer
        // closed the stream or it failed mid-read; std::nullopt when the
        // timeout elapsed before the first byte arrived.
        virtual std::optional<std::vector<uint8_t>> read(size_t n) = 0;

        // Number of bytes written, negative on error.
        virtual int write(const uint8_t* data, size_t len) = 0;

        virtual void close() = 0;

        virtual bool is_open() const = 0;
    };

    using TransportFactory = std::function<std::unique_ptr<ITransport>()>;

} // namespace simq::mqtt
