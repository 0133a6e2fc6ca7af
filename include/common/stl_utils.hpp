#pragma once

#include <string>

/**
 * @brief 截断过长的文本，用于日志和结果中的诊断信息
 * @param text 原文本
 * @param limit 最多保留的字节数
 * @return 若超出限制，返回前 limit 个字节并附加截断提示
 */
std::string truncate_text(const std::string &text, std::size_t limit);

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...)->overloaded<Ts...>;
