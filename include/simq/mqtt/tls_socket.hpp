#pragma once

#include <simq/mqtt/socket.hpp>

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <cerrno>
#include <mutex>
#include <string>

namespace simq::mqtt {

    // TLS versions
    enum class TLSVersion {
        TLS_1_0 = 0x0301,
        TLS_1_1 = 0x0302,
        TLS_1_2 = 0x0303,
        TLS_1_3 = 0x0304,
        TLS_AUTO = 0xFFFF
    };

    // TLS configuration
    struct TLSConfig {
        bool verify_peer = true;
        int verify_depth = 9;

        // Trust anchors; the system default paths are used when both are empty
        std::string ca_cert_file;
        std::string ca_cert_dir;

        // Client certificate authentication
        std::string cert_file;
        std::string key_file;
        std::string key_password;

        std::string ciphers = "HIGH:!aNULL:!MD5:!RC4:!3DES";
        std::string cipher_suites_tls13 = "TLS_AES_256_GCM_SHA384:TLS_AES_128_GCM_SHA256";
        TLSVersion min_version = TLSVersion::TLS_1_2;
        TLSVersion max_version = TLSVersion::TLS_AUTO;

        // Overrides the connect host for SNI and certificate name checks
        std::string sni_hostname;
    };

    // TLS error information
    class TLSError {
    private:
        unsigned long error_code_;
        std::string error_message_;

    public:
        TLSError() : error_code_(0) {}

        TLSError(unsigned long code, const std::string& msg)
            : error_code_(code), error_message_(msg) {}

        const std::string& message() const { return error_message_; }

        static TLSError get_last_error(const std::string& fallback = "unknown TLS error") {
            unsigned long err = ERR_get_error();
            if (err == 0) {
                return TLSError(0, fallback);
            }
            char buffer[256];
            ERR_error_string_n(err, buffer, sizeof(buffer));
            return TLSError(err, buffer);
        }
    };

    // TLS client socket on top of an already connected TCP socket
    class TLSSocket : public Socket {
    private:
        static inline std::once_flag openssl_init_flag_;

        SSL_CTX* ssl_ctx_ = nullptr;
        SSL* ssl_ = nullptr;
        bool tls_enabled_ = false;
        TLSConfig config_;
        TLSError last_error_;

    public:
        explicit TLSSocket(Socket&& base_socket)
            : Socket(std::move(base_socket)) {
            initialize_tls_library();
        }

        ~TLSSocket() override {
            cleanup_tls();
        }

        TLSSocket(const TLSSocket&) = delete;
        TLSSocket& operator=(const TLSSocket&) = delete;

        // Prepares the SSL context and session for the given peer name.
        bool enable_tls(const TLSConfig& config, const std::string& host) {
            if (!is_valid() || tls_enabled_) {
                return false;
            }

            config_ = config;
            if (config_.sni_hostname.empty()) {
                config_.sni_hostname = host;
            }

            return init_openssl();
        }

        // Blocking client handshake; fails on timeout as well as on errors.
        bool perform_handshake() {
            if (!ssl_) {
                return false;
            }

            SSL_set_connect_state(ssl_);
            int result = SSL_connect(ssl_);
            if (result == 1) {
                return true;
            }

            int error = SSL_get_error(ssl_, result);
            if (error == SSL_ERROR_WANT_READ || error == SSL_ERROR_WANT_WRITE) {
                last_error_ = TLSError(0, "handshake timed out");
            }
            else {
                long verify = SSL_get_verify_result(ssl_);
                if (verify != X509_V_OK) {
                    last_error_ = TLSError(static_cast<unsigned long>(verify),
                        X509_verify_cert_error_string(verify));
                }
                else {
                    last_error_ = TLSError::get_last_error("handshake failed");
                }
            }
            return false;
        }

        int send(const uint8_t* data, size_t len) override {
            if (!tls_enabled_) {
                return Socket::send(data, len);
            }
            if (!ssl_ || !data || len == 0) {
                return -1;
            }

            int written = SSL_write(ssl_, data, static_cast<int>(len));
            if (written > 0) {
                return written;
            }

            int error = SSL_get_error(ssl_, written);
            if (error == SSL_ERROR_WANT_WRITE || error == SSL_ERROR_WANT_READ) {
                errno = EAGAIN;
                return -1;
            }

            last_error_ = TLSError::get_last_error("write failed");
            return -1;
        }

        int receive(uint8_t* buffer, size_t max_len) override {
            if (!tls_enabled_) {
                return Socket::receive(buffer, max_len);
            }
            if (!ssl_ || !buffer || max_len == 0) {
                return -1;
            }

            int read = SSL_read(ssl_, buffer, static_cast<int>(max_len));
            if (read > 0) {
                return read;
            }

            int error = SSL_get_error(ssl_, read);
            if (error == SSL_ERROR_WANT_READ || error == SSL_ERROR_WANT_WRITE) {
                errno = EAGAIN;
                return -1;
            }

            if (error == SSL_ERROR_ZERO_RETURN) {
                // Connection closed
                return 0;
            }

            if (error == SSL_ERROR_SYSCALL && would_block()) {
                return -1;
            }

            last_error_ = TLSError::get_last_error("read failed");
            return -1;
        }

        void close() override {
            cleanup_tls();
            Socket::close();
        }

        std::string get_cipher() const {
            return ssl_ ? SSL_get_cipher_name(ssl_) : "No cipher";
        }

        std::string get_protocol_version() const {
            return ssl_ ? SSL_get_version(ssl_) : "none";
        }

        bool is_tls() const override {
            return tls_enabled_;
        }

        const TLSError& get_last_error() const {
            return last_error_;
        }

    private:
        static void initialize_tls_library() {
            std::call_once(openssl_init_flag_, []() {
                OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
                });
        }

        bool fail(const std::string& what) {
            last_error_ = TLSError::get_last_error(what);
            cleanup_tls();
            return false;
        }

        bool init_openssl() {
            ssl_ctx_ = SSL_CTX_new(TLS_client_method());
            if (!ssl_ctx_) {
                last_error_ = TLSError::get_last_error("SSL_CTX_new failed");
                return false;
            }

            // Mark enabled so failures below release the context
            tls_enabled_ = true;

            if (!set_protocol_versions()) {
                return fail("unsupported protocol version range");
            }

            if (!config_.ciphers.empty() &&
                SSL_CTX_set_cipher_list(ssl_ctx_, config_.ciphers.c_str()) != 1) {
                return fail("invalid cipher list");
            }

            if (!config_.cipher_suites_tls13.empty() &&
                SSL_CTX_set_ciphersuites(ssl_ctx_, config_.cipher_suites_tls13.c_str()) != 1) {
                return fail("invalid TLS 1.3 cipher suites");
            }

            if (config_.verify_peer) {
                SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
                SSL_CTX_set_verify_depth(ssl_ctx_, config_.verify_depth);

                if (config_.ca_cert_file.empty() && config_.ca_cert_dir.empty()) {
                    if (SSL_CTX_set_default_verify_paths(ssl_ctx_) != 1) {
                        return fail("cannot load default trust store");
                    }
                }
                else if (SSL_CTX_load_verify_locations(ssl_ctx_,
                    config_.ca_cert_file.empty() ? nullptr : config_.ca_cert_file.c_str(),
                    config_.ca_cert_dir.empty() ? nullptr : config_.ca_cert_dir.c_str()) != 1) {
                    return fail("cannot load CA certificates");
                }
            }
            else {
                SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_NONE, nullptr);
            }

            if (!config_.cert_file.empty()) {
                if (!config_.key_password.empty()) {
                    SSL_CTX_set_default_passwd_cb_userdata(ssl_ctx_,
                        const_cast<char*>(config_.key_password.c_str()));
                }
                if (SSL_CTX_use_certificate_chain_file(ssl_ctx_, config_.cert_file.c_str()) != 1) {
                    return fail("cannot load client certificate");
                }
                const std::string& key = config_.key_file.empty() ? config_.cert_file : config_.key_file;
                if (SSL_CTX_use_PrivateKey_file(ssl_ctx_, key.c_str(), SSL_FILETYPE_PEM) != 1) {
                    return fail("cannot load client key");
                }
                if (SSL_CTX_check_private_key(ssl_ctx_) != 1) {
                    return fail("client key does not match certificate");
                }
            }

            ssl_ = SSL_new(ssl_ctx_);
            if (!ssl_) {
                return fail("SSL_new failed");
            }

            if (SSL_set_fd(ssl_, fd_) != 1) {
                return fail("SSL_set_fd failed");
            }

            if (!config_.sni_hostname.empty()) {
                SSL_set_tlsext_host_name(ssl_, config_.sni_hostname.c_str());
                if (config_.verify_peer && SSL_set1_host(ssl_, config_.sni_hostname.c_str()) != 1) {
                    return fail("cannot set expected host name");
                }
            }

            return true;
        }

        static int to_openssl_version(TLSVersion version) {
            switch (version) {
            case TLSVersion::TLS_1_0: return TLS1_VERSION;
            case TLSVersion::TLS_1_1: return TLS1_1_VERSION;
            case TLSVersion::TLS_1_2: return TLS1_2_VERSION;
            case TLSVersion::TLS_1_3: return TLS1_3_VERSION;
            default: return 0;
            }
        }

        bool set_protocol_versions() {
            int min_version = to_openssl_version(config_.min_version);
            int max_version = to_openssl_version(config_.max_version);

            if (SSL_CTX_set_min_proto_version(ssl_ctx_, min_version ? min_version : TLS1_2_VERSION) != 1) {
                return false;
            }

            // 0 lets OpenSSL use the highest version it supports
            return SSL_CTX_set_max_proto_version(ssl_ctx_, max_version) == 1;
        }

        void cleanup_tls() {
            if (ssl_) {
                if (tls_enabled_ && is_valid()) {
                    SSL_shutdown(ssl_);
                }
                SSL_free(ssl_);
                ssl_ = nullptr;
            }

            if (ssl_ctx_) {
                SSL_CTX_free(ssl_ctx_);
                ssl_ctx_ = nullptr;
            }

            tls_enabled_ = false;
        }
    };

} // namespace simq::mqtt
