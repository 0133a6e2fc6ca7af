#include "harness/normalize.hpp"

namespace harness {
using namespace std;

static bool is_trailing_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

string normalize_output(string_view text) {
    size_t end = text.size();
    while (end > 0 && is_trailing_space(text[end - 1])) --end;
    return string(text.substr(0, end));
}

bool outputs_equal(string_view actual, string_view expected) {
    return normalize_output(actual) == normalize_output(expected);
}

vector<string> split_input_lines(string_view input) {
    string normalized = normalize_output(input);
    vector<string> lines;
    size_t begin = 0;
    while (true) {
        size_t end = normalized.find('\n', begin);
        if (end == string::npos) {
            lines.push_back(normalized.substr(begin));
            break;
        }
        lines.push_back(normalized.substr(begin, end - begin));
        begin = end + 1;
    }
    return lines;
}

}  // namespace harness
