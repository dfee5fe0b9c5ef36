#ifndef UTF8_HPP
#define UTF8_HPP

#include <string>
#include <vector>
#include <cstdint>

// UTF-8 <-> Unicode scalar values，文本载体都在标量值上操作
namespace utf8 {

    // 严格解码：拒绝过长编码、代理项、> U+10FFFF、截断序列
    bool decode(const std::string& bytes, std::u32string& outScalars);

    bool decode(const std::vector<uint8_t>& bytes, std::u32string& outScalars);

    // 调用方保证输入都是合法标量值
    std::string encode(const std::u32string& scalars);

    bool isValid(const std::vector<uint8_t>& bytes);
}

#endif
