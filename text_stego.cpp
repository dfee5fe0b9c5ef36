#include "text_stego.hpp"
#include "framing.hpp"
#include "utf8.hpp"

namespace txtstego {

    bool isInvisible(char32_t cp)
    {
        return cp == ZERO || cp == ONE || cp == START || cp == END;
    }

    stega::Result<std::u32string> embedFrameZW(const std::u32string& cover,
                                               const std::vector<uint8_t>& frame)
    {
        typedef stega::Result<std::u32string> TextResult;

        if (cover.empty()) {
            return TextResult::failure(stega::ErrorKind::Validation, "Cover text cannot be empty.");
        }

        std::u32string out;
        out.reserve(cover.size() + frame.size() * 8 + 2);

        // 插在第一个字符后面
        out.push_back(cover[0]);
        out.push_back(START);
        for (uint8_t bit : stega::bytesToBits(frame)) {
            out.push_back(bit ? ONE : ZERO);
        }
        out.push_back(END);
        out.append(cover, 1, std::u32string::npos);

        return TextResult::success(std::move(out));
    }

    stega::Result<std::vector<uint8_t>> extractFrameZW(const std::u32string& text)
    {
        typedef stega::Result<std::vector<uint8_t>> BytesResult;

        size_t startIdx = text.find(START);
        size_t endIdx = text.find(END);

        if (startIdx == std::u32string::npos || endIdx == std::u32string::npos ||
            endIdx <= startIdx)
        {
            return BytesResult::failure(stega::ErrorKind::Format,
                                        "No hidden message found in this text.");
        }

        // 中间混进来的其他字符直接忽略
        std::vector<uint8_t> bits;
        bits.reserve(endIdx - startIdx);
        for (size_t i = startIdx + 1; i < endIdx; ++i) {
            if (text[i] == ONE) {
                bits.push_back(1);
            } else if (text[i] == ZERO) {
                bits.push_back(0);
            }
        }

        if (bits.empty() || bits.size() % 8 != 0) {
            return BytesResult::failure(stega::ErrorKind::Decode,
                                        "Hidden data is corrupted or incomplete.");
        }

        return BytesResult::success(stega::bitsToBytes(bits));
    }

    stega::Result<std::string> textEncode(const std::string& coverText,
                                          const std::string& secretText,
                                          const std::string& password)
    {
        typedef stega::Result<std::string> StringResult;

        // 全部检查完再动载体
        if (coverText.empty()) {
            return StringResult::failure(stega::ErrorKind::Validation, "Cover text cannot be empty.");
        }

        stega::Status valid = stega::validateSecret(secretText);
        if (!valid.ok) {
            return StringResult::failure(valid);
        }

        std::u32string cover;
        if (!utf8::decode(coverText, cover)) {
            return StringResult::failure(stega::ErrorKind::Validation, "Cover text is not valid UTF-8.");
        }

        stega::Result<std::vector<uint8_t>> frame =
            stega::buildTextFrame(stega::stringToBytes(secretText), password);
        if (!frame.ok) {
            return StringResult::failure(frame.kind, frame.message);
        }

        stega::Result<std::u32string> steg = embedFrameZW(cover, frame.value);
        if (!steg.ok) {
            return StringResult::failure(steg.kind, steg.message);
        }

        return StringResult::success(utf8::encode(steg.value));
    }

    stega::Result<std::string> textDecode(const std::string& stegText,
                                          const std::string& password)
    {
        typedef stega::Result<std::string> StringResult;

        std::u32string text;
        if (!utf8::decode(stegText, text)) {
            return StringResult::failure(stega::ErrorKind::Format, "Input text is not valid UTF-8.");
        }

        stega::Result<std::vector<uint8_t>> frame = extractFrameZW(text);
        if (!frame.ok) {
            return StringResult::failure(frame.kind, frame.message);
        }

        return stega::parseTextFrame(frame.value, password);
    }

    bool stripInvisible(const std::string& text, std::string& outVisible)
    {
        outVisible.clear();

        std::u32string scalars;
        if (!utf8::decode(text, scalars)) {
            return false;
        }

        std::u32string visible;
        visible.reserve(scalars.size());
        for (char32_t cp : scalars) {
            if (!isInvisible(cp)) {
                visible.push_back(cp);
            }
        }

        outVisible = utf8::encode(visible);
        return true;
    }

    bool hasHiddenMessage(const std::string& text)
    {
        std::u32string scalars;
        if (!utf8::decode(text, scalars)) {
            return false;
        }
        return scalars.find(START) != std::u32string::npos &&
               scalars.find(END) != std::u32string::npos;
    }

} // namespace txtstego
