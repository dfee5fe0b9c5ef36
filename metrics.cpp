#include "metrics.hpp"

#include <opencv2/core.hpp>
#include <cmath>
#include <limits>

namespace metrics {

    // 包成 1 x N 的单通道 Mat，不拷贝；N 超过 int 范围时不能包
    static bool fitsMat(const std::vector<uint8_t>& buf)
    {
        return buf.size() <= static_cast<size_t>(std::numeric_limits<int>::max());
    }

    static cv::Mat wrapBuffer(const std::vector<uint8_t>& buf)
    {
        return cv::Mat(1, static_cast<int>(buf.size()), CV_8UC1,
                       const_cast<uint8_t*>(buf.data()));
    }

    // --- PSNR ---
    double computePSNR(const std::vector<uint8_t>& original,
                       const std::vector<uint8_t>& modified)
    {
        if (original.size() != modified.size() || !fitsMat(original)) {
            return -1.0;
        }
        if (original.empty()) {
            return 100;
        }

        cv::Mat s1;
        cv::absdiff(wrapBuffer(original), wrapBuffer(modified), s1);
        s1.convertTo(s1, CV_32F);
        s1 = s1.mul(s1);

        double sse = cv::sum(s1).val[0];

        if (sse <= 1e-10) return 100; // identical
        double mse = sse / (double)original.size();
        double psnr = 10.0 * log10((255 * 255) / mse);
        return psnr;
    }

    int maxChannelDelta(const std::vector<uint8_t>& original,
                        const std::vector<uint8_t>& modified)
    {
        if (original.size() != modified.size() || !fitsMat(original)) {
            return -1;
        }
        if (original.empty()) {
            return 0;
        }

        return static_cast<int>(cv::norm(wrapBuffer(original), wrapBuffer(modified), cv::NORM_INF));
    }

} // namespace metrics
