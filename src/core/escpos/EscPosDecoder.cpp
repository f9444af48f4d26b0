#include "core/escpos/EscPosDecoder.hpp"

#include <iomanip>
#include <sstream>

namespace core::escpos {

    namespace {
        bool isBlank(const std::string &text) {
            return text.find_first_not_of(" \t") == std::string::npos;
        }

        std::string alignmentName(uint8_t value) {
            switch (value) {
                case 0:
                case '0':
                    return "LEFT";
                case 1:
                case '1':
                    return "CENTER";
                default:
                    return "RIGHT";
            }
        }
    }

    std::vector<std::string> EscPosDecoder::decode(const Bytes &data) {
        std::vector<std::string> lines;
        std::string text;

        auto flushText = [&]() {
            if (!isBlank(text)) {
                lines.push_back(text);
            }
            text.clear();
        };

        for (size_t i = 0; i < data.size(); ++i) {
            uint8_t byte = data[i];

            if (byte == ESC && i + 1 < data.size()) {
                uint8_t cmd = data[i + 1];
                if (cmd == 0x40) {
                    flushText();
                    lines.emplace_back("[ESC @ - Initialize Printer]");
                    i += 1;
                } else if (cmd == 0x61 && i + 2 < data.size()) {
                    flushText();
                    lines.push_back("[ESC a - Alignment: " + alignmentName(data[i + 2]) + "]");
                    i += 2;
                } else if (cmd == 0x74 && i + 2 < data.size()) {
                    flushText();
                    lines.emplace_back("[ESC t - Set Code Table]");
                    i += 2;
                }
            } else if (byte == GS && i + 1 < data.size()) {
                if (data[i + 1] == 0x56 && i + 2 < data.size()) {
                    flushText();
                    lines.emplace_back("[GS V - Cut Paper]");
                    i += 2;
                }
            } else if (byte == LF) {
                flushText();
                lines.emplace_back("");
            } else if (byte >= 0x20 && byte != 0x7F) {
                text.push_back(static_cast<char>(byte));
            }
        }

        flushText();
        return lines;
    }

    std::string EscPosDecoder::hexDump(const Bytes &data, size_t bytesPerLine) {
        std::ostringstream out;
        out << std::hex << std::setfill('0');
        for (size_t i = 0; i < data.size(); ++i) {
            if (i > 0 && bytesPerLine > 0 && i % bytesPerLine == 0) out << '\n';
            out << std::setw(2) << static_cast<int>(data[i]);
        }
        return out.str();
    }

}
