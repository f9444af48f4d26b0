#pragma once

#include "core/network/PrinterEmulator.hpp"
#include <string>

namespace core {

    /**
     * @brief Writes jobs received by the emulator as human-readable files.
     *
     * One file per job, "print-job-<timestamp>-<sequence>.txt": a header, the
     * decoded ESC/POS lines and a hex dump of the raw bytes.
     */
    class PrintJobArchive {
    public:
        explicit PrintJobArchive(std::string directory);

        /**
         * @return Path of the written file
         * @throws types::StorageException when the file cannot be written
         */
        std::string save(const ReceivedJob &job) const;

        static std::string render(const ReceivedJob &job, const std::string &receivedAt);

        static std::string fileNameFor(const ReceivedJob &job, const std::string &receivedAt);

        const std::string &getDirectory() const { return directory_; }

    private:
        std::string directory_;
    };

} // namespace core
