#include "image_io.hpp"
#include "image_stego.hpp"
#include "framing.hpp"

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace imgstego {

    stega::Result<RgbImage> loadRGB(const std::string& path)
    {
        typedef stega::Result<RgbImage> ImageResult;

        cv::Mat img;
        try {
            // IMREAD_COLOR 会去掉 alpha，调色板图也展开成 3 通道
            img = cv::imread(path, cv::IMREAD_COLOR);
        } catch (const cv::Exception& e) {
            return ImageResult::failure(stega::ErrorKind::Io,
                                        "Failed to load image: " + path + " (" + e.what() + ")");
        }

        if (img.empty()) {
            return ImageResult::failure(stega::ErrorKind::Io, "Failed to load image: " + path);
        }

        // OpenCV 是 BGR，这里统一成 RGB
        cv::Mat rgb;
        cv::cvtColor(img, rgb, cv::COLOR_BGR2RGB);
        if (!rgb.isContinuous()) {
            rgb = rgb.clone();
        }

        RgbImage out;
        out.width = rgb.cols;
        out.height = rgb.rows;
        out.pixels.assign(rgb.data, rgb.data + rgb.total() * rgb.channels());
        return ImageResult::success(std::move(out));
    }

    stega::Status saveRGB(const std::vector<uint8_t>& pixels, int width, int height,
                          const std::string& path)
    {
        if (width <= 0 || height <= 0 ||
            pixels.size() != static_cast<size_t>(width) * static_cast<size_t>(height) * 3)
        {
            return stega::Status::failure(stega::ErrorKind::Validation,
                                          "Pixel buffer does not match width*height*3.");
        }

        if (!isPngPath(path)) {
            return stega::Status::failure(stega::ErrorKind::Validation,
                                          "Output must be a .png file, other formats may destroy the hidden data: " + path);
        }

        // Mat 只是包一层，不拷贝
        cv::Mat rgb(height, width, CV_8UC3, const_cast<uint8_t*>(pixels.data()));
        cv::Mat bgr;
        cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);

        // 编码器固定为 PNG，不让 imwrite 按扩展名选
        std::vector<uchar> buf;
        bool encoded = false;
        try {
            encoded = cv::imencode(".png", bgr, buf);
        } catch (const cv::Exception& e) {
            return stega::Status::failure(stega::ErrorKind::Io,
                                          "Failed to encode PNG for " + path + " (" + e.what() + ")");
        }

        if (!encoded) {
            return stega::Status::failure(stega::ErrorKind::Io, "Failed to encode PNG for " + path);
        }

        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.write(reinterpret_cast<const char*>(buf.data()), static_cast<std::streamsize>(buf.size()))) {
            return stega::Status::failure(stega::ErrorKind::Io, "Failed to save image: " + path);
        }
        return stega::Status::success();
    }

    bool isPngPath(const std::string& path)
    {
        size_t dot = path.find_last_of('.');
        if (dot == std::string::npos) {
            return false;
        }

        std::string ext = path.substr(dot);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return ext == ".png";
    }

    stega::Status embedTextLSB(const std::string& coverImagePath,
                               const std::string& stegoImagePath,
                               const std::string& message,
                               const std::string& password)
    {
        if (!isPngPath(stegoImagePath)) {
            std::cerr << "[embed] Refusing non-PNG output: " << stegoImagePath << std::endl;
            return stega::Status::failure(stega::ErrorKind::Validation,
                                          "Output must be a .png file, other formats may destroy the hidden data: " + stegoImagePath);
        }

        stega::Result<RgbImage> cover = loadRGB(coverImagePath);
        if (!cover.ok) {
            std::cerr << "[embed] " << cover.message << std::endl;
            return cover.status();
        }

        const RgbImage& img = cover.value;
        stega::Result<std::vector<uint8_t>> stego =
            imageEncode(img.pixels, img.width, img.height, message, password);
        if (!stego.ok) {
            std::cerr << "[embed] " << stego.message << std::endl;
            return stego.status();
        }

        stega::Status saved = saveRGB(stego.value, img.width, img.height, stegoImagePath);
        if (!saved.ok) {
            std::cerr << "[embed] " << saved.message << std::endl;
            return saved;
        }

        std::cout << "[embed] Done. Saved: " << stegoImagePath << std::endl;
        return stega::Status::success(stego.message);
    }

    stega::Result<std::string> extractTextLSB(const std::string& stegoImagePath,
                                              const std::string& password)
    {
        stega::Result<RgbImage> img = loadRGB(stegoImagePath);
        if (!img.ok) {
            std::cerr << "[extract] " << img.message << std::endl;
            return stega::Result<std::string>::failure(img.kind, img.message);
        }

        stega::Result<std::string> msg = imageDecode(img.value.pixels, password);
        if (!msg.ok) {
            std::cerr << "[extract] " << msg.message << std::endl;
        }
        return msg;
    }

    stega::Result<int64_t> imageCapacityOf(const std::string& imagePath)
    {
        stega::Result<RgbImage> img = loadRGB(imagePath);
        if (!img.ok) {
            return stega::Result<int64_t>::failure(img.kind, img.message);
        }

        int64_t pixelCount = static_cast<int64_t>(img.value.width) * img.value.height;
        return stega::Result<int64_t>::success(stega::clampedCapacity(pixelCount));
    }

} // namespace imgstego
