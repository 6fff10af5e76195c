#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace coderun {
using namespace std;

coderun_exception::coderun_exception()
    : coderun_exception("") {}

coderun_exception::coderun_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *coderun_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const coderun_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : coderun_exception() {}

internal_error::internal_error(const string &message)
    : coderun_exception(message) {}

validation_error::validation_error()
    : coderun_exception() {}

validation_error::validation_error(const string &message)
    : coderun_exception(message) {}

network_error::network_error()
    : coderun_exception() {}

network_error::network_error(const string &message, bool unreachable)
    : coderun_exception(message), unreachable(unreachable) {}

const char *get_display_message(failure_cause cause) {
    switch (cause) {
        case failure_cause::unsupported_language:
            return "unsupported language";
        case failure_cause::request_format:
            return "request format error";
        case failure_cause::rate_limited:
            return "rate limited";
        case failure_cause::server_error:
            return "server error";
        case failure_cause::unreachable:
            return "unreachable";
        case failure_cause::http_error:
            return "http error";
        case failure_cause::malformed_response:
            return "malformed response";
    }
    return "unknown";
}

backend_error::backend_error(const string &backend, failure_cause cause, const string &message, int http_status, const string &body)
    : coderun_exception(message), backend(backend), cause(cause), http_status(http_status), body(body) {}

unsupported_language_error::unsupported_language_error()
    : coderun_exception() {}

unsupported_language_error::unsupported_language_error(const string &message)
    : coderun_exception(message) {}

execution_error::execution_error()
    : coderun_exception() {}

execution_error::execution_error(const string &message)
    : coderun_exception(message) {}

}  // namespace coderun
