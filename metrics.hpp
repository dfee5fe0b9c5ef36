#ifndef METRICS_HPP
#define METRICS_HPP

#include <vector>
#include <cstdint>

namespace metrics {

    // 两个等长的扁平 RGB 缓冲区；完全相同返回 100，长度不同或超过 INT_MAX 字节返回 -1
    double computePSNR(const std::vector<uint8_t>& original,
                       const std::vector<uint8_t>& modified);

    // 单个通道最大改变量，LSB 嵌入应该 <= 1；长度不同或超过 INT_MAX 字节返回 -1
    int maxChannelDelta(const std::vector<uint8_t>& original,
                        const std::vector<uint8_t>& modified);
}

#endif
