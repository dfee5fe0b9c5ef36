#include "framing.hpp"
#include "crypto.hpp"
#include "utf8.hpp"

#include <algorithm>

namespace stega {

    int64_t imageCapacity(int64_t pixelCount)
    {
        if (pixelCount < 0) {
            pixelCount = 0;
        }
        return (pixelCount * 3) / 8 - static_cast<int64_t>(TERMINATOR_SIZE);
    }

    int64_t clampedCapacity(int64_t pixelCount)
    {
        return std::max<int64_t>(imageCapacity(pixelCount), 0);
    }

    std::vector<uint8_t> stringToBytes(const std::string& s) {
        return std::vector<uint8_t>(s.begin(), s.end());
    }

    std::string bytesToString(const std::vector<uint8_t>& bytes) {
        return std::string(bytes.begin(), bytes.end());
    }

    std::vector<uint8_t> bytesToBits(const std::vector<uint8_t>& bytes)
    {
        std::vector<uint8_t> bits;
        bits.reserve(bytes.size() * 8);

        for (uint8_t byte : bytes) {
            for (int i = 7; i >= 0; --i) {
                bits.push_back((byte >> i) & 1);
            }
        }
        return bits;
    }

    std::vector<uint8_t> bitsToBytes(const std::vector<uint8_t>& bits)
    {
        std::vector<uint8_t> bytes;
        bytes.reserve(bits.size() / 8);

        // 不足 8 bit 的尾巴丢掉
        size_t bitPos = 0;
        while (bitPos + 8 <= bits.size()) {
            uint8_t curByte = 0;
            for (int i = 0; i < 8; ++i) {
                curByte = (curByte << 1) | (bits[bitPos++] & 1);
            }
            bytes.push_back(curByte);
        }
        return bytes;
    }

    Status validateSecret(const std::string& secret, size_t* outScalarCount)
    {
        if (secret.empty()) {
            return Status::failure(ErrorKind::Validation, "Secret message cannot be empty.");
        }

        std::u32string scalars;
        if (!utf8::decode(secret, scalars)) {
            return Status::failure(ErrorKind::Validation, "Secret message is not valid UTF-8.");
        }

        if (outScalarCount) {
            *outScalarCount = scalars.size();
        }
        return Status::success();
    }

    std::vector<uint8_t> buildImageFrame(const std::vector<uint8_t>& payload,
                                         const std::string& password)
    {
        std::vector<uint8_t> frame;
        frame.reserve(payload.size() + TERMINATOR_SIZE);
        frame.insert(frame.end(), payload.begin(), payload.end());
        crypto::xorMaskInPlace(frame, password);
        frame.insert(frame.end(), TERMINATOR, TERMINATOR + TERMINATOR_SIZE);
        return frame;
    }

    Result<std::string> parseImageFrame(std::vector<uint8_t> maskedPayload,
                                        const std::string& password)
    {
        crypto::xorMaskInPlace(maskedPayload, password);

        // 图像路径没有校验和，只能靠 UTF-8 解码失败来发现错误密码
        if (!utf8::isValid(maskedPayload)) {
            return Result<std::string>::failure(ErrorKind::Decode,
                "Could not decode the message. "
                "Possible causes: wrong password, or no message was encoded here.");
        }
        return Result<std::string>::success(bytesToString(maskedPayload));
    }

    Result<std::vector<uint8_t>> buildTextFrame(const std::vector<uint8_t>& payload,
                                                const std::string& password)
    {
        typedef Result<std::vector<uint8_t>> FrameResult;

        // 校验和算在明文上，掩码之前
        std::vector<uint8_t> frame;
        if (!crypto::checksum2(payload, frame)) {
            return FrameResult::failure(ErrorKind::Validation, "Checksum computation failed.");
        }

        std::vector<uint8_t> masked = crypto::xorMask(payload, password);
        frame.insert(frame.end(), masked.begin(), masked.end());
        return FrameResult::success(std::move(frame));
    }

    Result<std::string> parseTextFrame(const std::vector<uint8_t>& frame,
                                       const std::string& password)
    {
        if (frame.size() < crypto::CHECKSUM_SIZE + 1) {
            return Result<std::string>::failure(ErrorKind::Decode,
                "Hidden data is too short, possibly corrupted.");
        }

        std::vector<uint8_t> stored(frame.begin(), frame.begin() + crypto::CHECKSUM_SIZE);
        std::vector<uint8_t> raw(frame.begin() + crypto::CHECKSUM_SIZE, frame.end());
        crypto::xorMaskInPlace(raw, password);

        std::vector<uint8_t> actual;
        if (!crypto::checksum2(raw, actual)) {
            return Result<std::string>::failure(ErrorKind::Integrity, "Checksum computation failed.");
        }

        if (actual != stored) {
            return Result<std::string>::failure(ErrorKind::Integrity,
                "Wrong password: the message could not be unlocked. "
                "Make sure you're using the same password that was used to hide it.");
        }

        if (!utf8::isValid(raw)) {
            return Result<std::string>::failure(ErrorKind::Decode,
                "Could not decode: message may be corrupted.");
        }
        return Result<std::string>::success(bytesToString(raw));
    }

} // namespace stega
