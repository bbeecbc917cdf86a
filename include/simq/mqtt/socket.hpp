#pragma once

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <netdb.h>
#include <sys/time.h>

#include <cstdint>
#include <cstring>
#include <string>

typedef int socket_t;
#define SIMQ_INVALID_SOCKET -1

namespace simq::mqtt {

    // Blocking TCP client socket
    class Socket {
    protected:
        socket_t fd_;
        bool is_connected_;

        bool set_timeout_option(int option, int timeout_ms) {
            if (fd_ == SIMQ_INVALID_SOCKET) return false;

            // Zero disables the timeout
            struct timeval tv;
            tv.tv_sec = timeout_ms / 1000;
            tv.tv_usec = (timeout_ms % 1000) * 1000;
            return setsockopt(fd_, SOL_SOCKET, option, &tv, sizeof(tv)) == 0;
        }

    public:
        Socket() : fd_(SIMQ_INVALID_SOCKET), is_connected_(false) {}

        virtual ~Socket() {
            close();
        }

        Socket(Socket&& other) noexcept
            : fd_(other.fd_), is_connected_(other.is_connected_) {
            other.fd_ = SIMQ_INVALID_SOCKET;
            other.is_connected_ = false;
        }

        Socket& operator=(Socket&& other) noexcept {
            if (this != &other) {
                close();
                fd_ = other.fd_;
                is_connected_ = other.is_connected_;
                other.fd_ = SIMQ_INVALID_SOCKET;
                other.is_connected_ = false;
            }
            return *this;
        }

        Socket(const Socket&) = delete;
        Socket& operator=(const Socket&) = delete;

        // Client operations. Resolves host (name or literal address) and
        // connects to the first address that accepts.
        bool connect(const std::string& host, uint16_t port) {
            if (fd_ != SIMQ_INVALID_SOCKET) return false;

            struct addrinfo hints {};
            struct addrinfo* result = nullptr;
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;
            hints.ai_protocol = IPPROTO_TCP;

            std::string port_str = std::to_string(port);
            int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
            if (rc != 0) {
                errno = EHOSTUNREACH;
                return false;
            }

            for (struct addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
                fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
                if (fd_ == SIMQ_INVALID_SOCKET) {
                    continue;
                }

                if (::connect(fd_, ai->ai_addr, ai->ai_addrlen) == 0) {
                    is_connected_ = true;
                    break;
                }

                int saved = errno;
                ::close(fd_);
                fd_ = SIMQ_INVALID_SOCKET;
                errno = saved;
            }

            freeaddrinfo(result);
            return is_connected_;
        }

        bool set_non_blocking(bool enable) {
            if (fd_ == SIMQ_INVALID_SOCKET) return false;

            int flags = fcntl(fd_, F_GETFL, 0);
            if (flags == -1) return false;

            if (enable) {
                flags |= O_NONBLOCK;
            }
            else {
                flags &= ~O_NONBLOCK;
            }

            return fcntl(fd_, F_SETFL, flags) != -1;
        }

        bool set_tcp_nodelay(bool enable) {
            if (fd_ == SIMQ_INVALID_SOCKET) return false;

            int flag = enable ? 1 : 0;
            return setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) == 0;
        }

        bool set_receive_timeout(int timeout_ms) {
            return set_timeout_option(SO_RCVTIMEO, timeout_ms);
        }

        bool set_send_timeout(int timeout_ms) {
            return set_timeout_option(SO_SNDTIMEO, timeout_ms);
        }

        // Data transfer
        virtual int send(const uint8_t* data, size_t len) {
            if (fd_ == SIMQ_INVALID_SOCKET || !data || len == 0) return -1;
            return static_cast<int>(::send(fd_, data, len, MSG_NOSIGNAL));
        }

        virtual int receive(uint8_t* buffer, size_t max_len) {
            if (fd_ == SIMQ_INVALID_SOCKET || !buffer || max_len == 0) return -1;
            return static_cast<int>(::recv(fd_, buffer, max_len, 0));
        }

        virtual void close() {
            if (fd_ != SIMQ_INVALID_SOCKET) {
                ::shutdown(fd_, SHUT_RDWR);
                ::close(fd_);
                fd_ = SIMQ_INVALID_SOCKET;
                is_connected_ = false;
            }
        }

        bool is_valid() const {
            return fd_ != SIMQ_INVALID_SOCKET;
        }

        bool is_connected() const {
            return is_connected_ && is_valid();
        }

        virtual bool is_tls() const {
            return false;
        }

        static bool would_block() {
            return (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINPROGRESS);
        }

        static std::string get_last_error_string() {
            return std::string(strerror(errno));
        }
    };

} // namespace simq::mqtt
