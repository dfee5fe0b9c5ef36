#include "utf8.hpp"

namespace utf8 {

    static bool decodeRange(const uint8_t* p, size_t n, std::u32string& out)
    {
        out.clear();
        out.reserve(n);

        size_t i = 0;
        while (i < n) {
            uint8_t lead = p[i];
            char32_t cp = 0;
            size_t len = 0;
            char32_t minValue = 0;

            if (lead < 0x80) {
                out.push_back(lead);
                ++i;
                continue;
            } else if ((lead & 0xE0) == 0xC0) {
                cp = lead & 0x1F; len = 2; minValue = 0x80;
            } else if ((lead & 0xF0) == 0xE0) {
                cp = lead & 0x0F; len = 3; minValue = 0x800;
            } else if ((lead & 0xF8) == 0xF0) {
                cp = lead & 0x07; len = 4; minValue = 0x10000;
            } else {
                return false; // 单独的续字节或 0xF8..0xFF
            }

            if (i + len > n) {
                return false;
            }

            for (size_t k = 1; k < len; ++k) {
                uint8_t c = p[i + k];
                if ((c & 0xC0) != 0x80) {
                    return false;
                }
                cp = (cp << 6) | (c & 0x3F);
            }

            if (cp < minValue || cp > 0x10FFFF ||
                (cp >= 0xD800 && cp <= 0xDFFF))
            {
                return false;
            }

            out.push_back(cp);
            i += len;
        }
        return true;
    }

    bool decode(const std::string& bytes, std::u32string& outScalars)
    {
        return decodeRange(reinterpret_cast<const uint8_t*>(bytes.data()),
                           bytes.size(), outScalars);
    }

    bool decode(const std::vector<uint8_t>& bytes, std::u32string& outScalars)
    {
        return decodeRange(bytes.data(), bytes.size(), outScalars);
    }

    std::string encode(const std::u32string& scalars)
    {
        std::string out;
        out.reserve(scalars.size());

        for (char32_t cp : scalars) {
            if (cp < 0x80) {
                out.push_back(static_cast<char>(cp));
            } else if (cp < 0x800) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp < 0x10000) {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }
        return out;
    }

    bool isValid(const std::vector<uint8_t>& bytes)
    {
        std::u32string tmp;
        return decode(bytes, tmp);
    }

} // namespace utf8
