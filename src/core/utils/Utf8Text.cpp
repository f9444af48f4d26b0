#include "core/utils/Utf8Text.hpp"

namespace core::utils {

    namespace {
        size_t sequenceLength(unsigned char lead) {
            if (lead < 0x80) return 1;
            if ((lead & 0xE0) == 0xC0) return 2;
            if ((lead & 0xF0) == 0xE0) return 3;
            if ((lead & 0xF8) == 0xF0) return 4;
            return 1;
        }

        size_t nextBoundary(const std::string &text, size_t pos) {
            size_t len = sequenceLength(static_cast<unsigned char>(text[pos]));
            if (pos + len > text.size()) return pos + 1;
            for (size_t i = 1; i < len; ++i) {
                if ((static_cast<unsigned char>(text[pos + i]) & 0xC0) != 0x80) {
                    return pos + 1;
                }
            }
            return pos + len;
        }
    }

    size_t codePointCount(const std::string &text) {
        size_t count = 0;
        for (size_t pos = 0; pos < text.size(); pos = nextBoundary(text, pos)) {
            ++count;
        }
        return count;
    }

    std::string truncateCodePoints(const std::string &text, size_t maxCodePoints) {
        size_t pos = 0;
        size_t count = 0;
        while (pos < text.size() && count < maxCodePoints) {
            pos = nextBoundary(text, pos);
            ++count;
        }
        return text.substr(0, pos);
    }

    std::string padEnd(const std::string &text, size_t width, char fill) {
        size_t length = codePointCount(text);
        if (length >= width) return text;
        return text + std::string(width - length, fill);
    }

    std::string padStart(const std::string &text, size_t width, char fill) {
        size_t length = codePointCount(text);
        if (length >= width) return text;
        return std::string(width - length, fill) + text;
    }

    std::string fitColumn(const std::string &text, size_t width) {
        return padEnd(truncateCodePoints(text, width), width);
    }

} // namespace core::utils
