#include "checkpoint.hpp"
#include "errors.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace prodsearch {

std::size_t CheckpointFile::load() const {
    std::error_code ec;
    if (!fs::exists(mPath, ec)) {
        return 0;
    }

    std::ifstream in(mPath);
    if (!in) {
        throw CheckpointError("Cannot open checkpoint '" + mPath + "'");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    std::string text = buffer.str();

    // Trim surrounding whitespace.
    const auto first = text.find_first_not_of(" \t\r\n");
    const auto last  = text.find_last_not_of(" \t\r\n");
    text = (first == std::string::npos) ? "" : text.substr(first, last - first + 1);

    if (text.empty()) {
        throw CheckpointError("Checkpoint '" + mPath + "' is empty");
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw CheckpointError("Checkpoint '" + mPath +
                                  "' does not hold a non-negative integer: '" +
                                  text + "'");
        }
    }

    try {
        return static_cast<std::size_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        throw CheckpointError("Checkpoint '" + mPath + "' is out of range: " + text);
    }
}

void CheckpointFile::save(std::size_t offset) {
    const fs::path target(mPath);
    const fs::path temp = target.string() + ".tmp";

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw CheckpointError("Cannot create directory for checkpoint '" +
                                  mPath + "': " + ec.message());
        }
    }

    {
        std::ofstream out(temp, std::ios::trunc);
        out << offset << "\n";
        out.flush();
        if (!out) {
            throw CheckpointError("Cannot write checkpoint '" + temp.string() + "'");
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        throw CheckpointError("Cannot replace checkpoint '" + mPath + "': " +
                              ec.message());
    }
}

} // namespace prodsearch
