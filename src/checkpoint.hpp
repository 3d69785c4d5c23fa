#pragma once

#include <cstddef>
#include <string>

namespace prodsearch {

/// Ingestion progress: the catalog offset up to which every record has been
/// stored.  Kept as a single decimal integer in a text file that is replaced
/// atomically on every save.  One writer per file.
class CheckpointFile {
public:
    explicit CheckpointFile(std::string path) : mPath(std::move(path)) {}

    /// 0 when the file does not exist yet.
    /// @throws CheckpointError if the file exists but is unreadable or malformed.
    std::size_t load() const;

    /// @throws CheckpointError if the file cannot be written.
    void save(std::size_t offset);

    const std::string& path() const { return mPath; }

private:
    std::string mPath;
};

} // namespace prodsearch
