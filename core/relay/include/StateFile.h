#pragma once

/**
 * @file StateFile.h
 * @brief SQLite snapshot of the channel store across restarts
 *
 * Written once at shutdown and read once at startup. Best effort: a crash
 * between the two loses queued data.
 */

#include "ChannelStore.h"
#include "Result.h"

#include <sqlite3.h>
#include <string>
#include <vector>

namespace RelayPipe {

class StateFile {
public:
    explicit StateFile(std::string path);
    ~StateFile();

    StateFile(const StateFile&) = delete;
    StateFile& operator=(const StateFile&) = delete;

    /**
     * @brief Replace the file's contents with these channels in one transaction
     */
    VoidResult save(const std::vector<ChannelSnapshot>& channels);

    /**
     * @brief Read every saved channel; a missing file yields an empty list
     */
    Result<std::vector<ChannelSnapshot>> load();

    /**
     * @brief Drop saved channels so that a later start does not replay them
     */
    VoidResult clear();

    const std::string& path() const { return path_; }

private:
    static constexpr int SCHEMA_VERSION = 1;

    VoidResult open();
    void close();
    VoidResult exec(const char* sql);
    VoidResult ensureSchema();
    Error storageError(const std::string& what) const;

    std::string path_;
    sqlite3* db_{nullptr};
};

} // namespace RelayPipe
