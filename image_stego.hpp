#ifndef IMAGE_STEGO_HPP
#define IMAGE_STEGO_HPP

#include "stega_result.hpp"

#include <string>
#include <vector>
#include <cstdint>

// 基础 LSB：扁平 RGB 缓冲区，每个通道 1 bit
namespace imgstego {

    // frame 的 bit 逐个写进 carrier 的最低位；容量不够时 carrier 不动
    stega::Status embedFrameLSB(std::vector<uint8_t>& carrier,
                                const std::vector<uint8_t>& frame);

    // 读 LSB 直到第一次出现 5 字节全零（按字节对齐），返回它之前的字节。
    // 掩码后的 payload 末尾如果是 0x00，会和终止符连成一段，末尾字节被吞掉且仍返回成功：
    // 有密码时，最后一个字符恰好等于对应的 key 字节就会发生（随机 ASCII 约 1/95）。
    // 掩码后中间出现 5 个连续 0x00 也会提前截断。图像路径没有校验和，检测不到。
    stega::Result<std::vector<uint8_t>> extractFrameLSB(const std::vector<uint8_t>& carrier);

    // pixels: width*height*3 字节，行优先 RGB
    stega::Result<std::vector<uint8_t>> imageEncode(const std::vector<uint8_t>& pixels,
                                                    int width, int height,
                                                    const std::string& secret,
                                                    const std::string& password);

    stega::Result<std::string> imageDecode(const std::vector<uint8_t>& pixels,
                                           const std::string& password);

}

#endif // IMAGE_STEGO_HPP
