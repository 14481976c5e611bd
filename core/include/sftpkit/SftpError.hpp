// Error types raised by the connector and the transfer layer.
#pragma once
#include <exception>
#include <stdexcept>
#include <string>

namespace sftpkit {

enum class SftpErrorKind {
    Configuration,  // no private key and no password
    Connection,     // failure while connecting, annotated with the host
    NotConnected,   // operation attempted without a live channel
    Operation       // failure raised by a remote operation
};

const char* toString(SftpErrorKind kind);

// Failure reported by a transport primitive (its "err" text).
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

// The single error type callers of the connector and transfers have to catch.
class SftpTransfersError : public std::runtime_error {
public:
    SftpTransfersError(SftpErrorKind kind,
                       const std::string& what,
                       std::exception_ptr cause = nullptr);

    SftpErrorKind kind() const noexcept { return kind_; }
    std::exception_ptr cause() const noexcept { return cause_; }

    // "what" of the cause and of its own causes, joined with "; caused by: ".
    std::string describeCause() const;

private:
    SftpErrorKind kind_;
    std::exception_ptr cause_;
};

// Turns a failed transport primitive into a TransportError. "action" names
// what was attempted, e.g. "cd /data".
inline void requireSuccess(bool ok, const std::string& action, const std::string& err) {
    if (!ok)
        throw TransportError(action + " failed: " + (err.empty() ? std::string("unknown error") : err));
}

// Message of an in-flight or stored exception; "unknown error" when it is not a std::exception.
std::string exceptionMessage(const std::exception_ptr& ex);

} // namespace sftpkit
