#ifndef STEGA_RESULT_HPP
#define STEGA_RESULT_HPP

#include <string>
#include <utility>

namespace stega {

    // 失败分类：Validation 在修改载体之前检测
    enum class ErrorKind {
        None = 0,
        Validation,   // 空秘密 / 空封面 / 超出容量
        Format,       // 找不到终止符或哨兵
        Integrity,    // 校验和不符 (wrong password)
        Decode,       // 解出来的字节不是合法 UTF-8
        Io            // 图像文件读写失败
    };

    const char* errorKindName(ErrorKind kind);

    struct Status {
        bool ok = true;
        ErrorKind kind = ErrorKind::None;
        std::string message;

        static Status success(std::string info = std::string()) {
            Status s;
            s.message = std::move(info);
            return s;
        }

        static Status failure(ErrorKind k, std::string msg) {
            Status s;
            s.ok = false;
            s.kind = k;
            s.message = std::move(msg);
            return s;
        }
    };

    // value 只有在 ok == true 时才有意义
    template <typename T>
    struct Result {
        bool ok = false;
        T value{};
        ErrorKind kind = ErrorKind::None;
        std::string message;

        static Result success(T v, std::string info = std::string()) {
            Result r;
            r.ok = true;
            r.value = std::move(v);
            r.message = std::move(info);
            return r;
        }

        static Result failure(ErrorKind k, std::string msg) {
            Result r;
            r.kind = k;
            r.message = std::move(msg);
            return r;
        }

        static Result failure(const Status& s) {
            return failure(s.kind, s.message);
        }

        Status status() const {
            return ok ? Status::success(message) : Status::failure(kind, message);
        }
    };

}

#endif // STEGA_RESULT_HPP
