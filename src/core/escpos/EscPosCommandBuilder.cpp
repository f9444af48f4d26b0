//
// Created by Andrea on 14/10/2025.
//

#include "core/escpos/EscPosCommandBuilder.hpp"

namespace core::escpos {

    Bytes EscPosCommandBuilder::initialize() {
        return Bytes(INITIALIZE.begin(), INITIALIZE.end());
    }

    Bytes EscPosCommandBuilder::selectCharacterTable(uint8_t table) {
        return {ESC, 0x74, table};
    }

    Bytes EscPosCommandBuilder::align(Alignment alignment) {
        return {ESC, 0x61, static_cast<uint8_t>(alignment)};
    }

    Bytes EscPosCommandBuilder::cut() {
        return Bytes(CUT.begin(), CUT.end());
    }

    Bytes EscPosCommandBuilder::feed(int lines) {
        return Bytes(lines > 0 ? static_cast<size_t>(lines) : 0, LF);
    }

    Bytes EscPosCommandBuilder::encode(const std::vector<std::string> &lines, const EncoderOptions &options) {
        size_t textSize = 0;
        for (const auto &line: lines) {
            textSize += line.size() + 1;
        }

        Bytes out;
        out.reserve(textSize + 16 + static_cast<size_t>(options.feedLines > 0 ? options.feedLines : 0));

        append(out, initialize());
        append(out, selectCharacterTable(options.characterTable));
        append(out, align(Alignment::Center));

        for (size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) out.push_back(LF);
            out.insert(out.end(), lines[i].begin(), lines[i].end());
        }

        append(out, align(Alignment::Left));
        append(out, feed(options.feedLines));
        append(out, cut());
        return out;
    }

    void EscPosCommandBuilder::append(Bytes &out, const Bytes &command) {
        out.insert(out.end(), command.begin(), command.end());
    }

} // namespace core::escpos
