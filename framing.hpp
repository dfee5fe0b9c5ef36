#ifndef FRAMING_HPP
#define FRAMING_HPP

#include "stega_result.hpp"

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

// 两条路径共用的帧层：掩码 + 终止符 / 校验和，容量计算，bit 展开
namespace stega {

    constexpr std::size_t TERMINATOR_SIZE = 5;
    constexpr uint8_t TERMINATOR[TERMINATOR_SIZE] = { 0, 0, 0, 0, 0 };

    // 每个像素 3 个通道，每通道 1 bit，再减去终止符
    // pixelCount 很小时结果为负，调用方按 0 处理
    int64_t imageCapacity(int64_t pixelCount);

    // max(imageCapacity, 0)
    int64_t clampedCapacity(int64_t pixelCount);

    std::vector<uint8_t> stringToBytes(const std::string& s);
    std::string bytesToString(const std::vector<uint8_t>& bytes);

    // MSB-first
    std::vector<uint8_t> bytesToBits(const std::vector<uint8_t>& bytes);
    std::vector<uint8_t> bitsToBytes(const std::vector<uint8_t>& bits);

    // 拒绝空秘密、非法 UTF-8；outScalarCount 是字符数
    Status validateSecret(const std::string& secret, size_t* outScalarCount = nullptr);

    // 图像帧: mask(payload) + TERMINATOR
    std::vector<uint8_t> buildImageFrame(const std::vector<uint8_t>& payload,
                                         const std::string& password);

    // 终止符之前的字节 -> 明文
    Result<std::string> parseImageFrame(std::vector<uint8_t> maskedPayload,
                                        const std::string& password);

    // 文本帧: checksum(payload) + mask(payload)
    Result<std::vector<uint8_t>> buildTextFrame(const std::vector<uint8_t>& payload,
                                                const std::string& password);

    Result<std::string> parseTextFrame(const std::vector<uint8_t>& frame,
                                       const std::string& password);
}

#endif // FRAMING_HPP
