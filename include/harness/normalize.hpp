#pragma once

#include <string>
#include <string_view>
#include <vector>

/**
 * 输出比较的规范化规则
 *
 * 判定一个测试点是否通过时，实际输出与期望输出都先经过 normalize_output：
 * 去掉文本末尾所有的空白字符（空格、\t、\n、\r、\v、\f），其余字符（包括行首
 * 和行中间的空白）保持不变，然后进行精确的字符串比较。
 * 因此期望输出 "3\n" 与实际输出 "3" 相等，反之亦然。
 */
namespace harness {

/**
 * @brief 去掉文本末尾的空白字符
 */
std::string normalize_output(std::string_view text);

/**
 * @brief 规范化后比较实际输出和期望输出
 * @return true 若两者相等
 */
bool outputs_equal(std::string_view actual, std::string_view expected);

/**
 * @brief 将测试输入转换为 solve 函数的参数
 * 先按 normalize_output 去掉末尾空白，再按 '\n' 切分为行。
 * 比如 "1\n2\n" 会得到 {"1", "2"}，空输入得到 {""}。
 */
std::vector<std::string> split_input_lines(std::string_view input);

}  // namespace harness
