#include "common/exceptions.hpp"

namespace harness {
using namespace std;

harness_exception::harness_exception()
    : harness_exception("") {}

harness_exception::harness_exception(const string &message)
    : message(message) {}

const char *harness_exception::what() const noexcept {
    return message.c_str();
}

internal_error::internal_error()
    : harness_exception() {}

internal_error::internal_error(const string &message)
    : harness_exception(message) {}

transport_error::transport_error()
    : harness_exception() {}

transport_error::transport_error(const string &message)
    : harness_exception(message) {}

}  // namespace harness
