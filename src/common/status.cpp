#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace harness {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::PASS, "pass")
    (status::FAIL, "fail")
    (status::ERROR, "error")
    (status::TIMEOUT, "timeout")
    (status::CRASHED, "crashed");

static const unordered_map<failure_kind, const char *> kind_string = boost::assign::map_list_of
    (failure_kind::NONE, "none")
    (failure_kind::NO_TESTS, "no_tests")
    (failure_kind::MISSING_ENTRY_POINT, "missing_entry_point")
    (failure_kind::ASSERTION_FAILURE, "assertion_failure")
    (failure_kind::CANDIDATE_RAISED, "candidate_raised")
    (failure_kind::TIMEOUT, "timeout")
    (failure_kind::CHILD_CRASHED, "child_crashed")
    (failure_kind::TRANSPORT_ERROR, "transport_error")
    (failure_kind::HARNESS_INTERNAL_ERROR, "harness_internal_error");
// clang-format on

const char *to_string(status stat) {
    return status_string.at(stat);
}

const char *to_string(failure_kind kind) {
    return kind_string.at(kind);
}

status parse_status(const string &name) {
    for (auto &[stat, str] : status_string)
        if (name == str) return stat;
    throw invalid_argument("unknown status " + name);
}

failure_kind parse_failure_kind(const string &name) {
    for (auto &[kind, str] : kind_string)
        if (name == str) return kind;
    throw invalid_argument("unknown failure kind " + name);
}

status status_of(failure_kind kind) {
    switch (kind) {
        case failure_kind::NONE:
        case failure_kind::NO_TESTS:
            return status::PASS;
        case failure_kind::ASSERTION_FAILURE:
            return status::FAIL;
        case failure_kind::TIMEOUT:
            return status::TIMEOUT;
        case failure_kind::CHILD_CRASHED:
            return status::CRASHED;
        case failure_kind::MISSING_ENTRY_POINT:
        case failure_kind::CANDIDATE_RAISED:
        case failure_kind::TRANSPORT_ERROR:
        case failure_kind::HARNESS_INTERNAL_ERROR:
            return status::ERROR;
    }
    throw invalid_argument("unknown failure kind");
}

}  // namespace harness
