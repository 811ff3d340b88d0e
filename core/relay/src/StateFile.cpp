#include "StateFile.h"
#include "Logger.h"
#include "LoggerMacros.h"

#include <chrono>
#include <filesystem>
#include <memory>

namespace RelayPipe {

namespace {

const char* COMPONENT = "StateFile";

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return nullptr;
    }
    return Statement(stmt);
}

void bindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt* stmt, int index) {
    const unsigned char* text = sqlite3_column_text(stmt, index);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

} // namespace

StateFile::StateFile(std::string path) : path_(std::move(path)) {}

StateFile::~StateFile() {
    close();
}

Error StateFile::storageError(const std::string& what) const {
    std::string detail = db_ ? sqlite3_errmsg(db_) : "database not open";
    Logger::instance().error(what + ": " + detail, COMPONENT);
    return Err(ErrorCode::StorageError, what + ": " + detail);
}

VoidResult StateFile::open() {
    if (db_) {
        return Ok();
    }

    std::filesystem::path dir = std::filesystem::path(path_).parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            Logger::instance().error("Failed to create state directory " + dir.string() + " (" + ec.message() + ")", COMPONENT);
            return Err(ErrorCode::StorageError, "cannot create " + dir.string());
        }
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        auto err = storageError("Cannot open state file " + path_);
        close();
        return err;
    }

    char* errMsg = nullptr;
    if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &errMsg) != SQLITE_OK) {
        Logger::instance().warn("Failed to enable WAL mode: " + std::string(errMsg ? errMsg : "?"), COMPONENT);
        sqlite3_free(errMsg);
    }
    sqlite3_busy_timeout(db_, 5000);

    return ensureSchema();
}

void StateFile::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

VoidResult StateFile::exec(const char* sql) {
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string message = errMsg ? errMsg : "unknown error";
        sqlite3_free(errMsg);
        Logger::instance().error("SQL failed: " + message, COMPONENT);
        return Err(ErrorCode::StorageError, message);
    }
    return Ok();
}

VoidResult StateFile::ensureSchema() {
    int userVersion = 0;
    if (auto stmt = prepare(db_, "PRAGMA user_version;")) {
        if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            userVersion = sqlite3_column_int(stmt.get(), 0);
        }
    }
    if (userVersion > SCHEMA_VERSION) {
        return Err(ErrorCode::StorageError, "state file " + path_ + " was written by a newer relay (schema " +
                                            std::to_string(userVersion) + ")");
    }

    auto created = exec(
        "CREATE TABLE IF NOT EXISTS meta ("
        "key TEXT PRIMARY KEY,"
        "value TEXT);"

        "CREATE TABLE IF NOT EXISTS channels ("
        "name TEXT PRIMARY KEY,"
        "channel_id TEXT NOT NULL,"
        "credential_hash TEXT,"
        "ttl_sec INTEGER DEFAULT 0,"
        "age_sec INTEGER DEFAULT 0,"
        "idle_sec INTEGER DEFAULT 0,"
        "next_sequence INTEGER DEFAULT 0,"
        "final_queued INTEGER DEFAULT 0,"
        "producer_bound INTEGER DEFAULT 0,"
        "active_producer TEXT);"

        "CREATE TABLE IF NOT EXISTS producers ("
        "channel TEXT NOT NULL,"
        "producer_id TEXT NOT NULL,"
        "last_index INTEGER,"
        "sequence INTEGER,"
        "PRIMARY KEY (channel, producer_id));"

        "CREATE TABLE IF NOT EXISTS chunks ("
        "channel TEXT NOT NULL,"
        "sequence INTEGER NOT NULL,"
        "producer_id TEXT,"
        "frame BLOB NOT NULL,"
        "PRIMARY KEY (channel, sequence));");
    if (!created) {
        return created;
    }

    if (userVersion < SCHEMA_VERSION) {
        return exec("PRAGMA user_version = 1;");
    }
    return Ok();
}

VoidResult StateFile::save(const std::vector<ChannelSnapshot>& channels) {
    auto opened = open();
    if (!opened) {
        return opened;
    }

    auto began = exec("BEGIN IMMEDIATE;");
    if (!began) {
        return began;
    }

    auto fail = [this](const std::string& what) -> VoidResult {
        auto err = storageError(what);
        exec("ROLLBACK;");
        return err;
    };

    if (!exec("DELETE FROM chunks; DELETE FROM producers; DELETE FROM channels; DELETE FROM meta;")) {
        return fail("Failed to clear previous state");
    }

    auto channelStmt = prepare(db_,
        "INSERT INTO channels (name, channel_id, credential_hash, ttl_sec, age_sec, idle_sec, "
        "next_sequence, final_queued, producer_bound, active_producer) VALUES (?,?,?,?,?,?,?,?,?,?);");
    auto producerStmt = prepare(db_,
        "INSERT INTO producers (channel, producer_id, last_index, sequence) VALUES (?,?,?,?);");
    auto chunkStmt = prepare(db_,
        "INSERT INTO chunks (channel, sequence, producer_id, frame) VALUES (?,?,?,?);");
    auto metaStmt = prepare(db_, "INSERT INTO meta (key, value) VALUES ('saved_at', ?);");
    if (!channelStmt || !producerStmt || !chunkStmt || !metaStmt) {
        return fail("Failed to prepare state statements");
    }

    size_t chunkCount = 0;
    for (const auto& ch : channels) {
        sqlite3_stmt* s = channelStmt.get();
        sqlite3_reset(s);
        bindText(s, 1, ch.name);
        bindText(s, 2, ch.channelId);
        bindText(s, 3, ch.credentialHash);
        sqlite3_bind_int(s, 4, ch.ttlSec);
        sqlite3_bind_int64(s, 5, ch.ageSec);
        sqlite3_bind_int64(s, 6, ch.idleSec);
        sqlite3_bind_int64(s, 7, static_cast<sqlite3_int64>(ch.nextSequence));
        sqlite3_bind_int(s, 8, ch.finalQueued ? 1 : 0);
        sqlite3_bind_int(s, 9, ch.producerBound ? 1 : 0);
        bindText(s, 10, ch.activeProducer);
        if (sqlite3_step(s) != SQLITE_DONE) {
            return fail("Failed to save channel " + ch.name);
        }

        for (const auto& p : ch.producers) {
            sqlite3_stmt* ps = producerStmt.get();
            sqlite3_reset(ps);
            bindText(ps, 1, ch.name);
            bindText(ps, 2, p.id);
            sqlite3_bind_int64(ps, 3, static_cast<sqlite3_int64>(p.lastIndex));
            sqlite3_bind_int64(ps, 4, static_cast<sqlite3_int64>(p.sequence));
            if (sqlite3_step(ps) != SQLITE_DONE) {
                return fail("Failed to save producer of " + ch.name);
            }
        }

        for (const auto& chunk : ch.chunks) {
            auto frame = ChunkFrame::serialize(chunk);
            sqlite3_stmt* cs = chunkStmt.get();
            sqlite3_reset(cs);
            bindText(cs, 1, ch.name);
            sqlite3_bind_int64(cs, 2, static_cast<sqlite3_int64>(chunk.sequence));
            bindText(cs, 3, chunk.producerId);
            sqlite3_bind_blob(cs, 4, frame.data(), static_cast<int>(frame.size()), SQLITE_TRANSIENT);
            if (sqlite3_step(cs) != SQLITE_DONE) {
                return fail("Failed to save chunk of " + ch.name);
            }
            ++chunkCount;
        }
    }

    auto savedAt = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    bindText(metaStmt.get(), 1, std::to_string(savedAt));
    if (sqlite3_step(metaStmt.get()) != SQLITE_DONE) {
        return fail("Failed to record save time");
    }

    auto committed = exec("COMMIT;");
    if (!committed) {
        exec("ROLLBACK;");
        return committed;
    }

    Logger::instance().info("Saved " + std::to_string(channels.size()) + " channel(s), " +
                            std::to_string(chunkCount) + " chunk(s) to " + path_, COMPONENT);
    return Ok();
}

Result<std::vector<ChannelSnapshot>> StateFile::load() {
    std::vector<ChannelSnapshot> channels;

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        LOG_DEBUG_COMP_IF("No state file at " + path_, COMPONENT);
        return channels;
    }

    auto opened = open();
    if (!opened) {
        return opened.error();
    }

    auto channelStmt = prepare(db_,
        "SELECT name, channel_id, credential_hash, ttl_sec, age_sec, idle_sec, next_sequence, "
        "final_queued, producer_bound, active_producer FROM channels ORDER BY name;");
    auto producerStmt = prepare(db_,
        "SELECT producer_id, last_index, sequence FROM producers WHERE channel = ?;");
    auto chunkStmt = prepare(db_,
        "SELECT sequence, producer_id, frame FROM chunks WHERE channel = ? ORDER BY sequence;");
    if (!channelStmt || !producerStmt || !chunkStmt) {
        return storageError("Failed to prepare state queries");
    }

    int rc;
    while ((rc = sqlite3_step(channelStmt.get())) == SQLITE_ROW) {
        sqlite3_stmt* s = channelStmt.get();
        ChannelSnapshot snap;
        snap.name = columnText(s, 0);
        snap.channelId = columnText(s, 1);
        snap.credentialHash = columnText(s, 2);
        snap.ttlSec = sqlite3_column_int(s, 3);
        snap.ageSec = sqlite3_column_int64(s, 4);
        snap.idleSec = sqlite3_column_int64(s, 5);
        snap.nextSequence = static_cast<uint64_t>(sqlite3_column_int64(s, 6));
        snap.finalQueued = sqlite3_column_int(s, 7) != 0;
        snap.producerBound = sqlite3_column_int(s, 8) != 0;
        snap.activeProducer = columnText(s, 9);

        sqlite3_stmt* ps = producerStmt.get();
        sqlite3_reset(ps);
        bindText(ps, 1, snap.name);
        while (sqlite3_step(ps) == SQLITE_ROW) {
            ChannelSnapshot::Producer p;
            p.id = columnText(ps, 0);
            p.lastIndex = static_cast<uint64_t>(sqlite3_column_int64(ps, 1));
            p.sequence = static_cast<uint64_t>(sqlite3_column_int64(ps, 2));
            snap.producers.push_back(std::move(p));
        }

        sqlite3_stmt* cs = chunkStmt.get();
        sqlite3_reset(cs);
        bindText(cs, 1, snap.name);
        bool corrupt = false;
        while (sqlite3_step(cs) == SQLITE_ROW) {
            const auto* blob = static_cast<const uint8_t*>(sqlite3_column_blob(cs, 2));
            int size = sqlite3_column_bytes(cs, 2);
            std::vector<uint8_t> frame(blob, blob + size);
            auto chunk = ChunkFrame::parse(frame);
            if (!chunk) {
                Logger::instance().warn("Discarding channel " + snap.name + ": stored chunk is unreadable (" +
                                        chunk.error().message + ")", COMPONENT);
                corrupt = true;
                break;
            }
            chunk->sequence = static_cast<uint64_t>(sqlite3_column_int64(cs, 0));
            chunk->producerId = columnText(cs, 1);
            snap.chunks.push_back(std::move(chunk.value()));
        }

        if (!corrupt) {
            channels.push_back(std::move(snap));
        }
    }
    if (rc != SQLITE_DONE) {
        return storageError("Failed to read saved channels");
    }

    Logger::instance().info("Loaded " + std::to_string(channels.size()) + " channel(s) from " + path_, COMPONENT);
    return channels;
}

VoidResult StateFile::clear() {
    std::error_code ec;
    if (!db_ && !std::filesystem::exists(path_, ec)) {
        return Ok();
    }
    auto opened = open();
    if (!opened) {
        return opened;
    }
    return exec("DELETE FROM chunks; DELETE FROM producers; DELETE FROM channels; DELETE FROM meta;");
}

} // namespace RelayPipe
