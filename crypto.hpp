#ifndef CRYPTO_HPP
#define CRYPTO_HPP

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace crypto {

    // 校验和长度：MD5 摘要的前 2 个字节
    constexpr std::size_t CHECKSUM_SIZE = 2;

    // 用 password 的 UTF-8 字节循环 XOR。空 password = 恒等变换（不复制）
    void xorMaskInPlace(std::vector<uint8_t>& data, const std::string& key);

    // 同上，返回新的缓冲区；xorMask(xorMask(d, k), k) == d
    std::vector<uint8_t> xorMask(const std::vector<uint8_t>& data,
                                 const std::string& key);

    // MD5(data) 的前 CHECKSUM_SIZE 字节，写到 outChecksum
    bool checksum2(const std::vector<uint8_t>& data,
                   std::vector<uint8_t>& outChecksum);
}

#endif
