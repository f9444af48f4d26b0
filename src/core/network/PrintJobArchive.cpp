#include "core/network/PrintJobArchive.hpp"
#include "core/escpos/EscPosDecoder.hpp"
#include "core/types/Error.hpp"
#include "core/utils/Timestamp.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace core {

    namespace {
        const std::string BANNER(60, '=');
    }

    PrintJobArchive::PrintJobArchive(std::string directory)
            : directory_(std::move(directory)) {
    }

    std::string PrintJobArchive::save(const ReceivedJob &job) const {
        const std::string receivedAt = utils::currentIsoTimestamp();

        std::error_code ec;
        fs::create_directories(directory_, ec);
        if (ec) {
            throw types::StorageException("cannot create " + directory_ + ": " + ec.message());
        }

        const fs::path path = fs::path(directory_) / fileNameFor(job, receivedAt);
        std::ofstream out(path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            throw types::StorageException("cannot open " + path.string());
        }
        out << render(job, receivedAt);
        if (!out) {
            throw types::StorageException("cannot write " + path.string());
        }
        return path.string();
    }

    std::string PrintJobArchive::render(const ReceivedJob &job, const std::string &receivedAt) {
        std::ostringstream out;
        out << BANNER << '\n'
            << "VIRTUAL PRINTER - Print Job #" << job.sequence << '\n'
            << "Time: " << receivedAt << '\n'
            << "Client: " << job.peer << '\n'
            << "Data Size: " << job.data.size() << " bytes" << '\n'
            << BANNER << '\n'
            << '\n'
            << "--- DECODED OUTPUT ---" << '\n'
            << '\n';

        for (const auto &line: escpos::EscPosDecoder::decode(job.data)) {
            out << line << '\n';
        }

        out << '\n'
            << BANNER << '\n'
            << '\n'
            << "--- RAW DATA (HEX) ---" << '\n'
            << '\n'
            << escpos::EscPosDecoder::hexDump(job.data) << '\n'
            << '\n'
            << BANNER;
        return out.str();
    }

    std::string PrintJobArchive::fileNameFor(const ReceivedJob &job, const std::string &receivedAt) {
        std::string stamp = receivedAt;
        std::replace(stamp.begin(), stamp.end(), ':', '-');
        std::replace(stamp.begin(), stamp.end(), '.', '-');
        return "print-job-" + stamp + "-" + std::to_string(job.sequence) + ".txt";
    }

} // namespace core
