#include "stega_result.hpp"

namespace stega {

    const char* errorKindName(ErrorKind kind)
    {
        switch (kind) {
            case ErrorKind::None:       return "none";
            case ErrorKind::Validation: return "validation";
            case ErrorKind::Format:     return "format";
            case ErrorKind::Integrity:  return "integrity";
            case ErrorKind::Decode:     return "decode";
            case ErrorKind::Io:         return "io";
        }
        return "unknown";
    }

} // namespace stega
