#ifndef CTLOAD_TLS_HPP_
#define CTLOAD_TLS_HPP_

// ============================================================================
// TLS client layer
// ============================================================================
//
// Optional TLS support via mbedTLS. Enable with CMake option CTLOAD_WITH_TLS=ON.
// Without it, TlsClientContext::init() returns -1 and open_link() fails every
// secure endpoint (wss, https, tcps) with kTlsUnavailable.
//
// One TlsClientContext per run holds the trust anchors and is read-only after
// init(). Every connection owns a TlsSession with its own RNG and SSL config,
// so sessions never share mutable mbedTLS state across worker threads.

#include "endpoint.hpp"
#include "vocabulary.hpp"

#include <cstdint>
#include <cstring>

#include <string>

#ifdef CTLOAD_WITH_TLS

#include <cerrno>

#include <sys/socket.h>
#include <sys/types.h>

#include <mbedtls/ctr_drbg.h>
#include <mbedtls/entropy.h>
#include <mbedtls/error.h>
#include <mbedtls/net_sockets.h>
#include <mbedtls/ssl.h>
#include <mbedtls/x509_crt.h>
#include <psa/crypto.h>

#endif  // CTLOAD_WITH_TLS

namespace ctload {

#ifdef CTLOAD_WITH_TLS

// Directory scanned for trust anchors when no CA file is configured.
static constexpr const char* kSystemCaPath = "/etc/ssl/certs";

inline std::string tls_error_string(int ret) {
  char buf[128];
  mbedtls_strerror(ret, buf, sizeof(buf));
  return std::string(buf);
}

// ============================================================================
// TLS Client Context (one per run, holds CA chain)
// ============================================================================

class TlsClientContext {
 public:
  TlsClientContext() { mbedtls_x509_crt_init(&ca_chain_); }

  ~TlsClientContext() { mbedtls_x509_crt_free(&ca_chain_); }

  // Non-copyable
  TlsClientContext(const TlsClientContext&) = delete;
  TlsClientContext& operator=(const TlsClientContext&) = delete;

  // Initialize PSA crypto and load trust anchors. Returns 0 on success,
  // mbedtls error code on failure.
  int init(const TlsOptions& options) {
    options_ = options;

    // TLS 1.3 key exchange runs through PSA; a handshake without it fails.
    // Safe to call more than once.
    psa_status_t status = psa_crypto_init();
    if (status != PSA_SUCCESS) return MBEDTLS_ERR_SSL_INTERNAL_ERROR;

    if (!options.verify_peer) {
      initialized_ = true;
      return 0;
    }

    int ret = 0;
    if (!options.ca_file.empty()) {
      ret = mbedtls_x509_crt_parse_file(&ca_chain_, options.ca_file.c_str());
    } else {
      // Returns the number of unparseable files when positive; a system
      // store always carries a few non-certificate entries.
      ret = mbedtls_x509_crt_parse_path(&ca_chain_, kSystemCaPath);
      if (ret > 0) ret = 0;
    }
    if (ret != 0) return ret;

    initialized_ = true;
    return 0;
  }

  bool is_initialized() const { return initialized_; }
  bool verify_peer() const { return options_.verify_peer; }

  // Only meaningful when verify_peer() is true.
  mbedtls_x509_crt* ca_chain() const { return &ca_chain_; }

 private:
  // mbedtls_ssl_conf_ca_chain takes a non-const pointer but never writes.
  mutable mbedtls_x509_crt ca_chain_;
  TlsOptions options_;
  bool initialized_ = false;
};

// ============================================================================
// TLS Session (one per connection)
// ============================================================================

class TlsSession {
 public:
  TlsSession() {
    mbedtls_ssl_init(&ssl_);
    mbedtls_ssl_config_init(&conf_);
    mbedtls_entropy_init(&entropy_);
    mbedtls_ctr_drbg_init(&ctr_drbg_);
  }

  ~TlsSession() {
    mbedtls_ssl_free(&ssl_);
    mbedtls_ssl_config_free(&conf_);
    mbedtls_ctr_drbg_free(&ctr_drbg_);
    mbedtls_entropy_free(&entropy_);
  }

  // Non-copyable
  TlsSession(const TlsSession&) = delete;
  TlsSession& operator=(const TlsSession&) = delete;

  // Setup session over a connected blocking socket. The socket's SO_RCVTIMEO
  // bounds every read; a timeout surfaces as MBEDTLS_ERR_SSL_WANT_READ.
  int setup(const TlsClientContext& ctx, int fd, const std::string& hostname) {
    const char* pers = "ctload_tls";
    int ret = mbedtls_ctr_drbg_seed(&ctr_drbg_, mbedtls_entropy_func, &entropy_,
                                    reinterpret_cast<const unsigned char*>(pers), strlen(pers));
    if (ret != 0) return ret;

    ret = mbedtls_ssl_config_defaults(&conf_, MBEDTLS_SSL_IS_CLIENT, MBEDTLS_SSL_TRANSPORT_STREAM,
                                      MBEDTLS_SSL_PRESET_DEFAULT);
    if (ret != 0) return ret;

    mbedtls_ssl_conf_rng(&conf_, mbedtls_ctr_drbg_random, &ctr_drbg_);
    if (ctx.verify_peer()) {
      mbedtls_ssl_conf_authmode(&conf_, MBEDTLS_SSL_VERIFY_REQUIRED);
      mbedtls_ssl_conf_ca_chain(&conf_, ctx.ca_chain(), nullptr);
    } else {
      mbedtls_ssl_conf_authmode(&conf_, MBEDTLS_SSL_VERIFY_NONE);
    }
    mbedtls_ssl_conf_min_tls_version(&conf_, MBEDTLS_SSL_VERSION_TLS1_2);

    ret = mbedtls_ssl_setup(&ssl_, &conf_);
    if (ret != 0) return ret;

    ret = mbedtls_ssl_set_hostname(&ssl_, hostname.c_str());
    if (ret != 0) return ret;

    fd_ = fd;
    mbedtls_ssl_set_bio(&ssl_, &fd_, &TlsSession::bio_send, &TlsSession::bio_recv, nullptr);
    return 0;
  }

  // Perform TLS handshake
  int handshake() { return mbedtls_ssl_handshake(&ssl_); }

  // Read decrypted data
  int read(uint8_t* buf, size_t len) { return mbedtls_ssl_read(&ssl_, buf, len); }

  // Write data (encrypted)
  int write(const uint8_t* buf, size_t len) { return mbedtls_ssl_write(&ssl_, buf, len); }

  // Close TLS session
  int close_notify() { return mbedtls_ssl_close_notify(&ssl_); }

 private:
  mbedtls_ssl_context ssl_;
  mbedtls_ssl_config conf_;
  mbedtls_entropy_context entropy_;
  mbedtls_ctr_drbg_context ctr_drbg_;
  int fd_ = -1;

  // mbedtls_net_send/recv only report WANT_* on O_NONBLOCK sockets; ours are
  // blocking with timeouts, so EAGAIN is mapped here.
  static int bio_send(void* ctx, const unsigned char* buf, size_t len) {
    int fd = *static_cast<int*>(ctx);
    ssize_t n = ::send(fd, buf, len, MSG_NOSIGNAL);
    if (n >= 0) return static_cast<int>(n);
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return MBEDTLS_ERR_SSL_WANT_WRITE;
    if (errno == EPIPE || errno == ECONNRESET) return MBEDTLS_ERR_NET_CONN_RESET;
    return MBEDTLS_ERR_NET_SEND_FAILED;
  }

  static int bio_recv(void* ctx, unsigned char* buf, size_t len) {
    int fd = *static_cast<int*>(ctx);
    ssize_t n = ::recv(fd, buf, len, 0);
    if (n >= 0) return static_cast<int>(n);
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return MBEDTLS_ERR_SSL_WANT_READ;
    if (errno == ECONNRESET) return MBEDTLS_ERR_NET_CONN_RESET;
    return MBEDTLS_ERR_NET_RECV_FAILED;
  }
};

#else  // !CTLOAD_WITH_TLS

// ============================================================================
// Stub implementations when TLS is disabled
// ============================================================================

inline std::string tls_error_string(int /* ret */) { return "TLS support not built"; }

class TlsClientContext {
 public:
  int init(const TlsOptions& /* options */) { return -1; }
  bool is_initialized() const { return false; }
  bool verify_peer() const { return false; }
};

#endif  // CTLOAD_WITH_TLS

}  // namespace ctload

#endif  // CTLOAD_TLS_HPP_
