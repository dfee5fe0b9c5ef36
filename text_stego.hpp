#ifndef TEXT_STEGO_HPP
#define TEXT_STEGO_HPP

#include "stega_result.hpp"

#include <string>
#include <vector>
#include <cstdint>

// 零宽字符：把 bit 藏进普通文本，聊天软件一般不会删掉这些字符
namespace txtstego {

    constexpr char32_t ZERO  = 0x200B;  // ZERO WIDTH SPACE, bit 0
    constexpr char32_t ONE   = 0x200C;  // ZERO WIDTH NON-JOINER, bit 1
    constexpr char32_t START = 0xFEFF;  // payload 开始
    constexpr char32_t END   = 0x200D;  // payload 结束

    bool isInvisible(char32_t cp);

    // cover[0] + START + bits + END + cover[1:]
    stega::Result<std::u32string> embedFrameZW(const std::u32string& cover,
                                               const std::vector<uint8_t>& frame);

    // 取第一个 START 和第一个 END 之间的 ZERO/ONE，按 MSB-first 拼成字节
    stega::Result<std::vector<uint8_t>> extractFrameZW(const std::u32string& text);

    // 参数和返回值都是 UTF-8
    stega::Result<std::string> textEncode(const std::string& coverText,
                                          const std::string& secretText,
                                          const std::string& password);

    stega::Result<std::string> textDecode(const std::string& stegText,
                                          const std::string& password);

    // 只留下可见字符
    bool stripInvisible(const std::string& text, std::string& outVisible);

    bool hasHiddenMessage(const std::string& text);
}

#endif // TEXT_STEGO_HPP
