#ifndef IMAGE_IO_HPP
#define IMAGE_IO_HPP

#include "stega_result.hpp"

#include <string>
#include <vector>
#include <cstdint>

namespace imgstego {

    // 解码后的图像：扁平 RGB，行优先，没有 alpha
    struct RgbImage {
        std::vector<uint8_t> pixels;
        int width = 0;
        int height = 0;
    };

    stega::Result<RgbImage> loadRGB(const std::string& path);

    // 总是编码成 PNG 写出，逐字节保持；path 必须以 .png 结尾
    stega::Status saveRGB(const std::vector<uint8_t>& pixels, int width, int height,
                          const std::string& path);

    // 只接受 .png（不区分大小写），jpg / webp / avif 等会破坏 LSB
    bool isPngPath(const std::string& path);

    // 把 message 藏到 coverImage -> 生成 stegoImage
    stega::Status embedTextLSB(const std::string& coverImagePath,
                               const std::string& stegoImagePath,
                               const std::string& message,
                               const std::string& password);

    // 从 stegoImage 提取 message
    stega::Result<std::string> extractTextLSB(const std::string& stegoImagePath,
                                              const std::string& password);

    // 已经按 0 截断
    stega::Result<int64_t> imageCapacityOf(const std::string& imagePath);
}

#endif // IMAGE_IO_HPP
