#include "image_io.hpp"
#include "metrics.hpp"
#include "text_stego.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

namespace {

    void printUsage(const char* prog)
    {
        std::cerr << "Usage:\n"
                  << "  " << prog << " capacity <image>\n"
                  << "  " << prog << " image-encode <cover> <out.png> <message> [password]\n"
                  << "  " << prog << " image-decode <stego> [password]\n"
                  << "  " << prog << " text-encode <cover.txt> <secret> [password]\n"
                  << "  " << prog << " text-decode <steg.txt> [password]\n"
                  << "  " << prog << " text-strip <steg.txt>\n";
    }

    bool readFile(const std::string& path, std::string& out)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return false;
        }
        out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        return true;
    }

    int reportFailure(const char* tag, const stega::Status& st)
    {
        std::cerr << "[" << tag << "] " << stega::errorKindName(st.kind)
                  << " error: " << st.message << std::endl;
        return 1;
    }

    int cmdCapacity(const std::string& imagePath)
    {
        stega::Result<int64_t> cap = imgstego::imageCapacityOf(imagePath);
        if (!cap.ok) {
            return reportFailure("capacity", cap.status());
        }
        std::cout << cap.value << std::endl;
        return 0;
    }

    int cmdImageEncode(const std::string& cover, const std::string& out,
                       const std::string& message, const std::string& password)
    {
        stega::Status st = imgstego::embedTextLSB(cover, out, message, password);
        if (!st.ok) {
            return reportFailure("embed", st);
        }
        std::cout << "[embed] " << st.message << std::endl;

        // 重新读回两张图，报告失真
        stega::Result<imgstego::RgbImage> before = imgstego::loadRGB(cover);
        stega::Result<imgstego::RgbImage> after = imgstego::loadRGB(out);
        if (before.ok && after.ok) {
            std::cout << "[embed] PSNR = "
                      << metrics::computePSNR(before.value.pixels, after.value.pixels)
                      << " dB, max channel delta = "
                      << metrics::maxChannelDelta(before.value.pixels, after.value.pixels)
                      << std::endl;
        }
        return 0;
    }

    int cmdImageDecode(const std::string& stego, const std::string& password)
    {
        stega::Result<std::string> msg = imgstego::extractTextLSB(stego, password);
        if (!msg.ok) {
            return reportFailure("extract", msg.status());
        }
        std::cout << msg.value << std::endl;
        return 0;
    }

    int cmdTextEncode(const std::string& coverPath, const std::string& secret,
                      const std::string& password)
    {
        std::string cover;
        if (!readFile(coverPath, cover)) {
            return reportFailure("text-embed",
                stega::Status::failure(stega::ErrorKind::Io, "Failed to read " + coverPath));
        }

        stega::Result<std::string> steg = txtstego::textEncode(cover, secret, password);
        if (!steg.ok) {
            return reportFailure("text-embed", steg.status());
        }
        std::cout << steg.value;
        return 0;
    }

    int cmdTextDecode(const std::string& stegPath, const std::string& password)
    {
        std::string text;
        if (!readFile(stegPath, text)) {
            return reportFailure("text-extract",
                stega::Status::failure(stega::ErrorKind::Io, "Failed to read " + stegPath));
        }

        stega::Result<std::string> msg = txtstego::textDecode(text, password);
        if (!msg.ok) {
            return reportFailure("text-extract", msg.status());
        }
        std::cout << msg.value << std::endl;
        return 0;
    }

    int cmdTextStrip(const std::string& stegPath)
    {
        std::string text;
        if (!readFile(stegPath, text)) {
            return reportFailure("text-strip",
                stega::Status::failure(stega::ErrorKind::Io, "Failed to read " + stegPath));
        }

        std::string visible;
        if (!txtstego::stripInvisible(text, visible)) {
            return reportFailure("text-strip",
                stega::Status::failure(stega::ErrorKind::Format, "Input text is not valid UTF-8."));
        }
        std::cout << visible;
        return 0;
    }

} // namespace

int main(int argc, char** argv)
{
    if (argc < 3) {
        printUsage(argv[0]);
        return 2;
    }

    const std::string cmd = argv[1];
    const int nArgs = argc - 2;
    auto arg = [&](int i) { return std::string(argv[2 + i]); };
    auto optional = [&](int i) { return i < nArgs ? arg(i) : std::string(); };

    if (cmd == "capacity" && nArgs == 1) {
        return cmdCapacity(arg(0));
    }
    if (cmd == "image-encode" && (nArgs == 3 || nArgs == 4)) {
        return cmdImageEncode(arg(0), arg(1), arg(2), optional(3));
    }
    if (cmd == "image-decode" && (nArgs == 1 || nArgs == 2)) {
        return cmdImageDecode(arg(0), optional(1));
    }
    if (cmd == "text-encode" && (nArgs == 2 || nArgs == 3)) {
        return cmdTextEncode(arg(0), arg(1), optional(2));
    }
    if (cmd == "text-decode" && (nArgs == 1 || nArgs == 2)) {
        return cmdTextDecode(arg(0), optional(1));
    }
    if (cmd == "text-strip" && nArgs == 1) {
        return cmdTextStrip(arg(0));
    }

    printUsage(argv[0]);
    return 2;
}
