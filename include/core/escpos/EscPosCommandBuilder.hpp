//
// Created by Andrea on 14/10/2025.
//

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace core::escpos {

    using Bytes = std::vector<uint8_t>;

    enum class Alignment : uint8_t {
        Left = 0,
        Center = 1,
        Right = 2
    };

    constexpr uint8_t ESC = 0x1B;
    constexpr uint8_t GS = 0x1D;
    constexpr uint8_t LF = 0x0A;

    /**
     * @brief Envelope parameters; defaults match the station's 80mm printers.
     */
    struct EncoderOptions {
        uint8_t characterTable = 2; // PC850 multilingual
        int feedLines = 4;
    };

    /**
     * @brief Builds the ESC/POS byte stream sent to the thermal printer.
     *
     * Only the subset the tickets need: ESC @, ESC t n, ESC a n, GS V 0.
     */
    class EscPosCommandBuilder {
    public:
        static constexpr std::array<uint8_t, 2> INITIALIZE{ESC, 0x40};
        static constexpr std::array<uint8_t, 3> CUT{GS, 0x56, 0x00};

        static Bytes initialize();

        static Bytes selectCharacterTable(uint8_t table);

        static Bytes align(Alignment alignment);

        static Bytes cut();

        static Bytes feed(int lines);

        /**
         * @brief Wraps the lines in the ticket envelope.
         *
         * init, character table, center, lines joined by LF, left,
         * `feedLines` LF, cut. The text is copied byte for byte.
         */
        static Bytes encode(const std::vector<std::string> &lines, const EncoderOptions &options = {});

    private:
        static void append(Bytes &out, const Bytes &command);
    };

}
