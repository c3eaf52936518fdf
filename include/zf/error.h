#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace zf {
  enum class ErrorDomain : std::uint16_t {
    Format = 0x01,
    Crypto = 0x02,
    Codec = 0x03,
    Integrity = 0x04,
    Segment = 0x05,
    IO = 0x06,
    Config = 0x07,
    Internal = 0x7F
  };

  // Domain d owns codes [d << 8, (d << 8) + 0xFF]. Platform error numbers
  // (errno, OpenSSL, zstd) travel in Error::native_code, never in Error::code.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    return static_cast<int>(domain) * kErrorDomainSpan;
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace format {
      inline constexpr int kMalformedHeader = Make(ErrorDomain::Format, 0x01);
      inline constexpr int kUnsupportedVersion = Make(ErrorDomain::Format, 0x02);
    }  // namespace format

    namespace crypto {
      inline constexpr int kKeyUnwrapFailed = Make(ErrorDomain::Crypto, 0x01);
      inline constexpr int kDecryptionFailed = Make(ErrorDomain::Crypto, 0x02);
      inline constexpr int kProviderFailure = Make(ErrorDomain::Crypto, 0x03);
      inline constexpr int kPassphraseRequired = Make(ErrorDomain::Crypto, 0x04);
    }  // namespace crypto

    namespace codec {
      inline constexpr int kDecompressionFailed = Make(ErrorDomain::Codec, 0x01);
      inline constexpr int kCompressionFailed = Make(ErrorDomain::Codec, 0x02);
    }  // namespace codec

    namespace integrity {
      inline constexpr int kIntegrityViolation = Make(ErrorDomain::Integrity, 0x01);
      inline constexpr int kSignatureInvalid = Make(ErrorDomain::Integrity, 0x02);
    }  // namespace integrity

    namespace segment {
      inline constexpr int kSegmentMismatch = Make(ErrorDomain::Segment, 0x01);
    }  // namespace segment

    namespace io {
      inline constexpr int kOpenFailed = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kReadFailed = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kWriteFailed = Make(ErrorDomain::IO, 0x03);
    }  // namespace io

    namespace config {
      inline constexpr int kInvalidConfiguration = Make(ErrorDomain::Config, 0x01);
    }  // namespace config

    namespace internal {
      inline constexpr int kInvalidState = Make(ErrorDomain::Internal, 0x01);
    }  // namespace internal
  }  // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}

    // Outermost frame last. Used by the container layer to tag segment/chunk scope.
    Error& AddContext(std::string frame) {
      context.push_back(std::move(frame));
      return *this;
    }

    [[nodiscard]] std::string Describe() const {
      std::string out = what();
      for (auto it = context.rbegin(); it != context.rend(); ++it) {
        out.append(" [");
        out.append(*it);
        out.append("]");
      }
      return out;
    }
  };

  // Thrown by AEAD primitives when tag verification fails. Callers that know
  // which object failed translate it into errors::crypto::kDecryptionFailed.
  struct AuthenticationFailureError : public std::runtime_error {
    explicit AuthenticationFailureError(const std::string& msg) : std::runtime_error(msg) {}
  };
}  // namespace zf
