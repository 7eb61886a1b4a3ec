#pragma once
#include <optional>
#include <string>
#include <vector>

namespace poolhttp {

    /** @brief Enumeration of error codes. */
    enum class ErrorCode {
        InvalidUrl,           /**< The provided URL is malformed or invalid. */
        NameResolutionFailed, /**< DNS lookup for the host failed. */
        ConnectionFailed,     /**< Failed to establish a TCP connection. */
        ConnectTimeout,       /**< Connecting took longer than allowed. */
        TlsHandshakeFailed,   /**< Failed to perform TLS handshake. */
        ProxyError,           /**< The proxy refused or broke the tunnel. */
        SendFailed,           /**< Failed to send the request. */
        ReceiveFailed,        /**< Failed to receive the response. */
        ReadTimeout,          /**< The response did not arrive in time. */
        ProtocolError,        /**< Truncated or malformed response. */
        PoolExhausted,        /**< No connection could be acquired. */
        PoolClosed,           /**< The pool was closed while acquiring. */
        MaxRetryExceeded,     /**< A retry budget went negative. */
        TooManyRedirects,     /**< Redirect budget exhausted. */
        Cancelled,            /**< The caller's deadline or token fired. */
        Unknown,              /**< An unknown error occurred. */
    };

    /// @brief Convert ErrorCode to string for logging or diagnostics
    inline const char* to_string(ErrorCode code) {
        switch (code) {
            case ErrorCode::InvalidUrl:
                return "InvalidUrl";
            case ErrorCode::NameResolutionFailed:
                return "NameResolutionFailed";
            case ErrorCode::ConnectionFailed:
                return "ConnectionFailed";
            case ErrorCode::ConnectTimeout:
                return "ConnectTimeout";
            case ErrorCode::TlsHandshakeFailed:
                return "TlsHandshakeFailed";
            case ErrorCode::ProxyError:
                return "ProxyError";
            case ErrorCode::SendFailed:
                return "SendFailed";
            case ErrorCode::ReceiveFailed:
                return "ReceiveFailed";
            case ErrorCode::ReadTimeout:
                return "ReadTimeout";
            case ErrorCode::ProtocolError:
                return "ProtocolError";
            case ErrorCode::PoolExhausted:
                return "PoolExhausted";
            case ErrorCode::PoolClosed:
                return "PoolClosed";
            case ErrorCode::MaxRetryExceeded:
                return "MaxRetryExceeded";
            case ErrorCode::TooManyRedirects:
                return "TooManyRedirects";
            case ErrorCode::Cancelled:
                return "Cancelled";
            case ErrorCode::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }

    /// @brief Errors raised before any request bytes could reach the server.
    inline constexpr bool is_connect_error(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::NameResolutionFailed:
            case ErrorCode::ConnectionFailed:
            case ErrorCode::ConnectTimeout:
            case ErrorCode::ProxyError:
            case ErrorCode::PoolExhausted:
                return true;
            default:
                return false;
        }
    }

    /// @brief Errors raised after the request was (possibly partially) sent.
    inline constexpr bool is_read_error(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::SendFailed:
            case ErrorCode::ReceiveFailed:
            case ErrorCode::ReadTimeout:
            case ErrorCode::ProtocolError:
                return true;
            default:
                return false;
        }
    }

    /**
     * @brief One attempt recorded by the retry policy.
     */
    struct RequestHistory {
        std::string method;
        std::string url;
        /** @brief Error of the attempt, if it failed below HTTP. */
        std::optional<ErrorCode> error;
        std::string error_message;
        /** @brief Response status, if a response was received. */
        std::optional<int> status;
        std::optional<std::string> redirect_location;
    };

    /**
     * @brief Represents an error occurred during an HTTP operation.
     */
    struct Error {
        using Code = ErrorCode;

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
        /** @brief Attempt log, filled in for terminal retry failures. */
        std::vector<RequestHistory> history{};
        /** @brief Status of the last response seen, if any. */
        std::optional<int> status{};
    };

}  // namespace poolhttp
