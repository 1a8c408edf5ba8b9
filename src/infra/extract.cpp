#include "ds/extract.hpp"

namespace ds {

const char *extract_error_str(ExtractErrorKind kind)
{
    switch (kind)
    {
        case ExtractErrorKind::None: return "ok";
        case ExtractErrorKind::OpenFailed: return "open failed";
        case ExtractErrorKind::ReadFailed: return "read failed";
        case ExtractErrorKind::ParseFailed: return "parse failed";
        case ExtractErrorKind::BadStructure: return "bad structure";
    }
    return "unknown";
}

} // namespace ds
