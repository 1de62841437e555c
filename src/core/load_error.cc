#include "core/load_error.h"

#include "core/log.h"

#include <cctype>
#include <utility>

namespace voxscene::core {

const char* loadErrorKindName(LoadErrorKind kind) {
    switch (kind) {
    case LoadErrorKind::Parse:
        return "parse error";
    case LoadErrorKind::DanglingReference:
        return "dangling reference";
    case LoadErrorKind::AtlasOverflow:
        return "atlas overflow";
    default:
        return "load error";
    }
}

bool failLoad(LoadError* outError, LoadErrorKind kind, std::string message) {
    VOXSCENE_LOGE("vox") << loadErrorKindName(kind) << ": " << message;
    if (outError != nullptr) {
        outError->kind = kind;
        outError->message = std::move(message);
    }
    return false;
}

std::string tagToString(const std::array<char, 4>& tag) {
    std::string text;
    text.reserve(tag.size());
    for (const char c : tag) {
        const unsigned char value = static_cast<unsigned char>(c);
        text.push_back(std::isprint(value) != 0 ? c : '?');
    }
    return text;
}

} // namespace voxscene::core
