#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace grader {
using namespace std;

grader_exception::grader_exception()
    : grader_exception("") {}

grader_exception::grader_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *grader_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const grader_exception &ex) {
    os << boost::diagnostic_information(ex) << endl
       << *ex.stacktrace;
    return os;
}

#define GRADER_EXCEPTION_IMPL(name)                             \
    name::name() : grader_exception() {}                        \
    name::name(const string &message) : grader_exception(message) {}

GRADER_EXCEPTION_IMPL(internal_error)
GRADER_EXCEPTION_IMPL(network_error)
GRADER_EXCEPTION_IMPL(database_error)
GRADER_EXCEPTION_IMPL(authentication_failed)
GRADER_EXCEPTION_IMPL(malformed_payload)
GRADER_EXCEPTION_IMPL(unsupported_test_kind)
GRADER_EXCEPTION_IMPL(malformed_test_config)

#undef GRADER_EXCEPTION_IMPL

}  // namespace grader
