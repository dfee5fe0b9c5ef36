#include "image_stego.hpp"
#include "framing.hpp"

#include <algorithm>
#include <sstream>

namespace imgstego {

    stega::Status embedFrameLSB(std::vector<uint8_t>& carrier,
                                const std::vector<uint8_t>& frame)
    {
        size_t totalBits = frame.size() * 8;
        if (totalBits > carrier.size()) {
            std::ostringstream oss;
            oss << "Message too long. Need " << totalBits
                << " bits, capacity = " << carrier.size() << " bits.";
            return stega::Status::failure(stega::ErrorKind::Validation, oss.str());
        }

        std::vector<uint8_t> bits = stega::bytesToBits(frame);
        for (size_t i = 0; i < bits.size(); ++i) {
            carrier[i] = (carrier[i] & 0xFE) | bits[i]; // 清 LSB 再写
        }
        return stega::Status::success();
    }

    stega::Result<std::vector<uint8_t>> extractFrameLSB(const std::vector<uint8_t>& carrier)
    {
        typedef stega::Result<std::vector<uint8_t>> BytesResult;

        std::vector<uint8_t> decoded;
        decoded.reserve(carrier.size() / 8);

        uint8_t curByte = 0;
        int nBits = 0;
        for (uint8_t value : carrier) {
            curByte = (curByte << 1) | (value & 1);
            if (++nBits < 8) {
                continue;
            }

            decoded.push_back(curByte);
            curByte = 0;
            nBits = 0;

            // 第一次出现 5 个全零字节就停
            if (decoded.size() >= stega::TERMINATOR_SIZE &&
                std::equal(decoded.end() - stega::TERMINATOR_SIZE, decoded.end(),
                           stega::TERMINATOR))
            {
                decoded.resize(decoded.size() - stega::TERMINATOR_SIZE);
                return BytesResult::success(std::move(decoded));
            }
        }

        return BytesResult::failure(stega::ErrorKind::Format,
                                    "No hidden message found in this image.");
    }

    stega::Result<std::vector<uint8_t>> imageEncode(const std::vector<uint8_t>& pixels,
                                                    int width, int height,
                                                    const std::string& secret,
                                                    const std::string& password)
    {
        typedef stega::Result<std::vector<uint8_t>> PixelResult;

        if (width <= 0 || height <= 0 ||
            pixels.size() != static_cast<size_t>(width) * static_cast<size_t>(height) * 3)
        {
            return PixelResult::failure(stega::ErrorKind::Validation,
                                        "Pixel buffer does not match width*height*3.");
        }

        size_t nChars = 0;
        stega::Status valid = stega::validateSecret(secret, &nChars);
        if (!valid.ok) {
            return PixelResult::failure(valid);
        }

        std::vector<uint8_t> frame = stega::buildImageFrame(stega::stringToBytes(secret), password);

        int64_t pixelCount = static_cast<int64_t>(width) * height;
        if (frame.size() * 8 > pixels.size()) {
            std::ostringstream oss;
            oss << "Message too long. This image can hold up to "
                << stega::clampedCapacity(pixelCount) << " bytes, but your message has "
                << secret.size() << ".";
            return PixelResult::failure(stega::ErrorKind::Validation, oss.str());
        }

        std::vector<uint8_t> out(pixels);
        stega::Status st = embedFrameLSB(out, frame);
        if (!st.ok) {
            return PixelResult::failure(st);
        }

        std::ostringstream info;
        info << "Encoded " << nChars << " characters into a "
             << width << "x" << height << " image.";
        return PixelResult::success(std::move(out), info.str());
    }

    stega::Result<std::string> imageDecode(const std::vector<uint8_t>& pixels,
                                           const std::string& password)
    {
        stega::Result<std::vector<uint8_t>> extracted = extractFrameLSB(pixels);
        if (!extracted.ok) {
            return stega::Result<std::string>::failure(extracted.kind, extracted.message);
        }
        return stega::parseImageFrame(std::move(extracted.value), password);
    }

} // namespace imgstego
