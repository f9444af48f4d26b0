#pragma once

#include "core/escpos/EscPosCommandBuilder.hpp"
#include <string>
#include <vector>

namespace core::escpos {

    /**
     * @brief Renders an ESC/POS stream as readable lines for the virtual printer.
     *
     * Known commands become bracketed markers ("[GS V - Cut Paper]"), each LF
     * closes the pending text line and adds an empty line, other control bytes
     * are dropped.
     */
    class EscPosDecoder {
    public:
        static std::vector<std::string> decode(const Bytes &data);

        static std::string hexDump(const Bytes &data, size_t bytesPerLine = 16);
    };

}
