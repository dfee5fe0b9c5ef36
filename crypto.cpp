#include "crypto.hpp"

#include <openssl/evp.h>

#include <iostream>

namespace crypto {

    void xorMaskInPlace(std::vector<uint8_t>& data, const std::string& key)
    {
        if (key.empty()) {
            return;
        }

        // std::string 本身就是 UTF-8 字节
        const size_t keyLen = key.size();
        for (size_t i = 0; i < data.size(); ++i) {
            data[i] ^= static_cast<uint8_t>(key[i % keyLen]);
        }
    }

    std::vector<uint8_t> xorMask(const std::vector<uint8_t>& data,
                                 const std::string& key)
    {
        std::vector<uint8_t> out(data);
        xorMaskInPlace(out, key);
        return out;
    }

    bool checksum2(const std::vector<uint8_t>& data,
                   std::vector<uint8_t>& outChecksum)
    {
        outChecksum.clear();

        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int mdLen = 0;
        if (EVP_Digest(data.data(), data.size(),
                       md, &mdLen,
                       EVP_md5(), nullptr) != 1)
        {
            std::cerr << "[crypto] EVP_Digest MD5 failed\n";
            return false;
        }

        if (mdLen < CHECKSUM_SIZE) {
            std::cerr << "[crypto] MD5 digest too short\n";
            return false;
        }

        outChecksum.assign(md, md + CHECKSUM_SIZE);
        return true;
    }

} // namespace crypto
