#include "sftpkit/SftpError.hpp"

#include <utility>

namespace sftpkit {

const char* toString(SftpErrorKind kind) {
    switch (kind) {
        case SftpErrorKind::Configuration: return "configuration";
        case SftpErrorKind::Connection: return "connection";
        case SftpErrorKind::NotConnected: return "not-connected";
        case SftpErrorKind::Operation: return "operation";
    }
    return "unknown";
}

SftpTransfersError::SftpTransfersError(SftpErrorKind kind,
                                       const std::string& what,
                                       std::exception_ptr cause)
    : std::runtime_error(what), kind_(kind), cause_(std::move(cause)) {}

std::string SftpTransfersError::describeCause() const {
    std::string out;
    std::exception_ptr next = cause_;
    while (next) {
        if (!out.empty())
            out += "; caused by: ";
        out += exceptionMessage(next);
        try {
            std::rethrow_exception(next);
        } catch (const SftpTransfersError& e) {
            next = e.cause();
        } catch (...) {
            next = nullptr;
        }
    }
    return out;
}

std::string exceptionMessage(const std::exception_ptr& ex) {
    if (!ex)
        return {};
    try {
        std::rethrow_exception(ex);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

} // namespace sftpkit
