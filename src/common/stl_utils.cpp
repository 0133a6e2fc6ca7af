#include "common/stl_utils.hpp"

std::string truncate_text(const std::string &text, std::size_t limit) {
    if (text.size() <= limit) return text;
    return text.substr(0, limit) + "... (" + std::to_string(text.size() - limit) + " more bytes)";
}
