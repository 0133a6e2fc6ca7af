#include "harness/protocol.hpp"
#include <boost/assign.hpp>
#include <map>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"

namespace harness::protocol {
using namespace std;
using namespace nlohmann;

// clang-format off
static const map<frame_type, string> type_string = boost::assign::map_list_of
    (frame_type::LOADED, "loaded")
    (frame_type::LOAD_ERROR, "load_error")
    (frame_type::TEST, "test")
    (frame_type::DONE, "done")
    (frame_type::FATAL, "fatal");
// clang-format on

frame make_loaded() {
    frame f;
    f.type = frame_type::LOADED;
    return f;
}

frame make_load_error(failure_kind kind, const string &message) {
    frame f;
    f.type = frame_type::LOAD_ERROR;
    f.kind = kind;
    f.message = message;
    return f;
}

frame make_test(size_t index, bool passed, failure_kind kind, optional<string> detail) {
    frame f;
    f.type = frame_type::TEST;
    f.index = index;
    f.passed = passed;
    f.kind = kind;
    f.detail = move(detail);
    return f;
}

frame make_done() {
    frame f;
    f.type = frame_type::DONE;
    return f;
}

frame make_fatal(const string &message) {
    frame f;
    f.type = frame_type::FATAL;
    f.message = message;
    return f;
}

string encode_frame(const frame &f) {
    json j = {{"type", type_string.at(f.type)}};
    switch (f.type) {
        case frame_type::TEST:
            j["index"] = f.index;
            j["passed"] = f.passed;
            j["kind"] = to_string(f.kind);
            j["detail"] = f.detail ? json(*f.detail) : json(nullptr);
            break;
        case frame_type::LOAD_ERROR:
            j["kind"] = to_string(f.kind);
            j["message"] = f.message;
            break;
        case frame_type::FATAL:
            j["message"] = f.message;
            break;
        default:
            break;
    }
    // 选手代码的输出可能不是合法的 UTF-8，替换掉非法字节以保证一定能编码
    return j.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

static frame_type parse_type(const string &name) {
    for (auto &[type, str] : type_string)
        if (name == str) return type;
    throw transport_error("unknown frame type " + name);
}

frame decode_frame(const string &line) {
    try {
        json j = json::parse(line);
        frame f;
        f.type = parse_type(j.at("type").get<string>());
        switch (f.type) {
            case frame_type::TEST:
                f.index = j.at("index").get<size_t>();
                f.passed = j.at("passed").get<bool>();
                f.kind = parse_failure_kind(j.at("kind").get<string>());
                if (!j.at("detail").is_null())
                    f.detail = j.at("detail").get<string>();
                if (f.passed != (f.kind == failure_kind::NONE))
                    throw transport_error("inconsistent test frame " + line);
                break;
            case frame_type::LOAD_ERROR:
                f.kind = parse_failure_kind(j.at("kind").get<string>());
                f.message = j.at("message").get<string>();
                break;
            case frame_type::FATAL:
                f.message = j.at("message").get<string>();
                break;
            default:
                break;
        }
        return f;
    } catch (json::exception &ex) {
        throw transport_error(string("malformed frame: ") + ex.what());
    } catch (invalid_argument &ex) {
        throw transport_error(string("malformed frame: ") + ex.what());
    }
}

}  // namespace harness::protocol
