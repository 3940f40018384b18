#include "tracking/checkpoint_store.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <sstream>

#include <sqlite3.h>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace nettrack {

namespace {

constexpr const char *kCreateCommitsTable =
    "CREATE TABLE IF NOT EXISTS commits ("
    "    id TEXT PRIMARY KEY,"
    "    parent_id TEXT,"
    "    sequence INTEGER NOT NULL UNIQUE,"
    "    timestamp INTEGER NOT NULL,"
    "    state TEXT NOT NULL"
    ");";

constexpr const char *kCreateCheckpointsTable =
    "CREATE TABLE IF NOT EXISTS checkpoints ("
    "    id TEXT PRIMARY KEY,"
    "    label TEXT,"
    "    commit_id TEXT NOT NULL,"
    "    parent_checkpoint_id TEXT,"
    "    created_at INTEGER NOT NULL"
    ");";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

constexpr const char *kBootIdPath = "/proc/sys/kernel/random/boot_id";

StoreError ioFailure(sqlite3 *db, const std::string &what)
{
    std::string message = what;
    if (db) {
        message += ": ";
        message += sqlite3_errmsg(db);
    }
    return StoreError(StoreError::Kind::StoreIOFailure, message);
}

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw ioFailure(db, "sqlite prepare failed");
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw StoreError(StoreError::Kind::StoreIOFailure, message);
    }
}

void stepDone(sqlite3 *db, const Statement &stmt, const char *what)
{
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw ioFailure(db, what);
    }
}

// Rolls back unless commit() was reached.
class Transaction {
public:
    explicit Transaction(sqlite3 *db)
        : m_db(db)
    {
        execOrThrow(m_db, "BEGIN IMMEDIATE;");
    }

    ~Transaction()
    {
        if (!m_done) {
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void commit()
    {
        execOrThrow(m_db, "COMMIT;");
        m_done = true;
    }

private:
    sqlite3 *m_db;
    bool m_done = false;
};

int64_t toEpochMillis(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               timestamp.time_since_epoch())
        .count();
}

std::chrono::system_clock::time_point fromEpochMillis(int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::milliseconds{value}};
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    if (value.empty()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, value);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

std::string generateId(const char *prefix)
{
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dist;

    const uint64_t part1 = dist(gen);
    const uint64_t part2 = dist(gen);

    std::ostringstream out;
    out << prefix << "-" << std::hex;
    out << (part1 >> 32);
    out << "-";
    out << ((part1 >> 16) & 0xFFFF);
    out << "-";
    out << (part1 & 0xFFFF);
    out << "-";
    out << (part2 >> 48);
    out << "-";
    out << (part2 & 0xFFFFFFFFFFFFULL);
    return out.str();
}

std::string readBootId()
{
    std::ifstream in(kBootIdPath);
    std::string value;
    std::getline(in, value);
    return value;
}

NetworkState parseState(const std::string &text)
{
    const auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        throw StoreError(StoreError::Kind::StoreIOFailure,
                         "stored network state is not valid JSON");
    }
    try {
        return parsed.get<NetworkState>();
    } catch (const nlohmann::json::exception &ex) {
        throw StoreError(StoreError::Kind::StoreIOFailure,
                         std::string("stored network state is malformed: ") + ex.what());
    }
}

Checkpoint readCheckpointRow(sqlite3_stmt *stmt)
{
    Checkpoint checkpoint;
    checkpoint.id = columnText(stmt, 0);
    checkpoint.label = columnText(stmt, 1);
    checkpoint.commitId = columnText(stmt, 2);
    checkpoint.parentCheckpointId = columnText(stmt, 3);
    checkpoint.createdAt = fromEpochMillis(sqlite3_column_int64(stmt, 4));
    return checkpoint;
}

struct LineageEntry {
    std::string parentId;
    int64_t sequence = 0;
};

} // namespace

struct CheckpointStore::Impl {
    sqlite3 *db = nullptr;
    CheckpointStoreOptions options;
    bool clearedAtOpen = false;
    std::mutex writeMutex;

    ~Impl()
    {
        if (db) {
            sqlite3_close(db);
        }
    }

    std::optional<std::string> getMeta(const std::string &key) const
    {
        Statement stmt(db, "SELECT value FROM meta WHERE key = ? LIMIT 1;");
        bindText(stmt.get(), 1, key);
        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_ROW) {
            return columnText(stmt.get(), 0);
        }
        if (rc != SQLITE_DONE) {
            throw ioFailure(db, "failed to read meta");
        }
        return std::nullopt;
    }

    void setMeta(const std::string &key, const std::string &value)
    {
        Statement stmt(db, "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
        bindText(stmt.get(), 1, key);
        bindText(stmt.get(), 2, value);
        stepDone(db, stmt, "failed to write meta");
    }

    void deleteMeta(const std::string &key)
    {
        Statement stmt(db, "DELETE FROM meta WHERE key = ?;");
        bindText(stmt.get(), 1, key);
        stepDone(db, stmt, "failed to delete meta");
    }

    bool commitExists(const std::string &id) const
    {
        Statement stmt(db, "SELECT 1 FROM commits WHERE id = ? LIMIT 1;");
        bindText(stmt.get(), 1, id);
        return sqlite3_step(stmt.get()) == SQLITE_ROW;
    }

    bool checkpointExists(const std::string &id) const
    {
        Statement stmt(db, "SELECT 1 FROM checkpoints WHERE id = ? LIMIT 1;");
        bindText(stmt.get(), 1, id);
        return sqlite3_step(stmt.get()) == SQLITE_ROW;
    }

    std::optional<std::string> resolve(const std::string &id) const
    {
        Statement stmt(db, "SELECT commit_id FROM checkpoints WHERE id = ? LIMIT 1;");
        bindText(stmt.get(), 1, id);
        if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            return columnText(stmt.get(), 0);
        }
        if (commitExists(id)) {
            return id;
        }
        return std::nullopt;
    }

    std::map<std::string, LineageEntry> loadLineage() const
    {
        std::map<std::string, LineageEntry> lineage;
        Statement stmt(db, "SELECT id, parent_id, sequence FROM commits;");
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            lineage[columnText(stmt.get(), 0)] =
                LineageEntry{columnText(stmt.get(), 1), sqlite3_column_int64(stmt.get(), 2)};
        }
        if (rc != SQLITE_DONE) {
            throw ioFailure(db, "failed to read commit lineage");
        }
        return lineage;
    }

    // Ids from `from` back to the root, newest first.
    static std::vector<std::string> ancestry(
        const std::map<std::string, LineageEntry> &lineage, const std::string &from)
    {
        std::vector<std::string> ids;
        std::string cursor = from;
        while (!cursor.empty() && ids.size() <= lineage.size()) {
            auto it = lineage.find(cursor);
            if (it == lineage.end()) {
                break;
            }
            ids.push_back(cursor);
            cursor = it->second.parentId;
        }
        return ids;
    }

    void wipe()
    {
        Transaction tx(db);
        execOrThrow(db, "DELETE FROM commits;");
        execOrThrow(db, "DELETE FROM checkpoints;");
        execOrThrow(db, "DELETE FROM meta;");
        tx.commit();
    }
};

CheckpointStore::CheckpointStore(const CheckpointStoreOptions &options)
    : impl(std::make_unique<Impl>())
{
    impl->options = options;

    const std::filesystem::path dbPath(options.path);
    if (dbPath.has_parent_path()) {
        std::error_code error;
        std::filesystem::create_directories(dbPath.parent_path(), error);
        if (error) {
            throw StoreError(StoreError::Kind::StoreIOFailure,
                             "cannot create store directory " + dbPath.parent_path().string()
                                 + ": " + error.message());
        }
    }

    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(options.path.c_str(), &impl->db, flags, nullptr) != SQLITE_OK) {
        const StoreError error = ioFailure(impl->db, "failed to open checkpoint store " + options.path);
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw error;
    }

    execOrThrow(impl->db, kCreateCommitsTable);
    execOrThrow(impl->db, kCreateCheckpointsTable);
    execOrThrow(impl->db, kCreateMetaTable);

    if (options.clearOnBoot) {
        const std::string bootId = options.bootId.empty() ? readBootId() : options.bootId;
        const auto storedBootId = impl->getMeta("boot_id");
        if (!bootId.empty() && storedBootId != bootId) {
            if (storedBootId.has_value()) {
                impl->wipe();
                impl->clearedAtOpen = true;
                NTLOG_INFO(QStringLiteral("CheckpointStore"),
                           QStringLiteral("CheckpointStore"),
                           QStringLiteral("store_cleared"),
                           QStringLiteral("new_boot"),
                           QStringLiteral("boot_id_mismatch"),
                           logging::defaultWho(),
                           QString(),
                           (nlohmann::json{{"track", toTrackString(options.track)},
                                          {"path", options.path}}));
            }
            impl->setMeta("boot_id", bootId);
        }
    }
}

CheckpointStore::~CheckpointStore() = default;

Track CheckpointStore::track() const
{
    return impl->options.track;
}

const std::string &CheckpointStore::path() const
{
    return impl->options.path;
}

bool CheckpointStore::wasClearedAtOpen() const
{
    return impl->clearedAtOpen;
}

std::string CheckpointStore::commit(const NetworkState &state,
                                    const std::optional<std::string> &parent)
{
    std::lock_guard<std::mutex> lock(impl->writeMutex);

    std::string parentId;
    if (parent.has_value()) {
        const auto resolved = impl->resolve(*parent);
        if (!resolved.has_value()) {
            throw StoreError(StoreError::Kind::ParentNotFound,
                             "parent " + *parent + " not found");
        }
        parentId = *resolved;
    }

    int64_t sequence = 1;
    {
        Statement seqStmt(impl->db, "SELECT COALESCE(MAX(sequence), 0) + 1 FROM commits;");
        if (sqlite3_step(seqStmt.get()) != SQLITE_ROW) {
            throw ioFailure(impl->db, "failed to read commit sequence");
        }
        sequence = sqlite3_column_int64(seqStmt.get(), 0);
    }

    const std::string id = generateId("c");
    const nlohmann::json stateJson = state;

    Transaction tx(impl->db);
    Statement stmt(impl->db,
                   "INSERT INTO commits (id, parent_id, sequence, timestamp, state) "
                   "VALUES (?, ?, ?, ?, ?);");
    bindText(stmt.get(), 1, id);
    bindOptionalText(stmt.get(), 2, parentId);
    sqlite3_bind_int64(stmt.get(), 3, sequence);
    sqlite3_bind_int64(stmt.get(), 4, toEpochMillis(std::chrono::system_clock::now()));
    bindText(stmt.get(), 5, dumpJson(stateJson));
    stepDone(impl->db, stmt, "failed to insert commit");
    impl->setMeta("head", id);
    tx.commit();

    return id;
}

std::string CheckpointStore::openCheckpoint(const std::string &label)
{
    std::lock_guard<std::mutex> lock(impl->writeMutex);

    const auto head = impl->getMeta("head");
    if (!head.has_value()) {
        throw StoreError(StoreError::Kind::EmptyHistory,
                         "cannot open a checkpoint on an empty history");
    }

    const std::string id = generateId("cp");
    Statement stmt(impl->db,
                   "INSERT INTO checkpoints (id, label, commit_id, parent_checkpoint_id, "
                   "created_at) VALUES (?, ?, ?, ?, ?);");
    bindText(stmt.get(), 1, id);
    bindOptionalText(stmt.get(), 2, label);
    bindText(stmt.get(), 3, *head);
    bindOptionalText(stmt.get(), 4, impl->getMeta("current").value_or(std::string()));
    sqlite3_bind_int64(stmt.get(), 5, toEpochMillis(std::chrono::system_clock::now()));
    stepDone(impl->db, stmt, "failed to insert checkpoint");
    return id;
}

NetworkState CheckpointStore::rollback(const std::string &id) const
{
    const auto resolved = impl->resolve(id);
    if (!resolved.has_value()) {
        throw StoreError(StoreError::Kind::CheckpointNotFound,
                         "checkpoint " + id + " not found");
    }
    const auto commit = getCommit(*resolved);
    if (!commit.has_value()) {
        throw StoreError(StoreError::Kind::CheckpointNotFound,
                         "commit " + *resolved + " not found");
    }
    return commit->state;
}

void CheckpointStore::commitCheckpoint(const std::string &checkpointId)
{
    std::lock_guard<std::mutex> lock(impl->writeMutex);
    if (!impl->checkpointExists(checkpointId)) {
        throw StoreError(StoreError::Kind::CheckpointNotFound,
                         "checkpoint " + checkpointId + " not found");
    }
    impl->setMeta("current", checkpointId);
}

void CheckpointStore::deleteCheckpoint(const std::string &checkpointId)
{
    std::lock_guard<std::mutex> lock(impl->writeMutex);

    Transaction tx(impl->db);
    Statement stmt(impl->db, "DELETE FROM checkpoints WHERE id = ?;");
    bindText(stmt.get(), 1, checkpointId);
    stepDone(impl->db, stmt, "failed to delete checkpoint");
    if (sqlite3_changes(impl->db) == 0) {
        throw StoreError(StoreError::Kind::CheckpointNotFound,
                         "checkpoint " + checkpointId + " not found");
    }
    if (impl->getMeta("current") == checkpointId) {
        impl->deleteMeta("current");
    }
    tx.commit();
}

std::vector<Commit> CheckpointStore::history(const std::optional<std::string> &since) const
{
    std::optional<std::string> sinceCommit;
    if (since.has_value()) {
        sinceCommit = impl->resolve(*since);
        if (!sinceCommit.has_value()) {
            throw StoreError(StoreError::Kind::CheckpointNotFound,
                             "checkpoint " + *since + " not found");
        }
    }

    const auto head = impl->getMeta("head");
    if (!head.has_value()) {
        return {};
    }

    const auto lineage = impl->loadLineage();
    std::vector<std::string> ids = Impl::ancestry(lineage, *head);
    std::reverse(ids.begin(), ids.end());

    if (sinceCommit.has_value()) {
        auto pos = std::find(ids.begin(), ids.end(), *sinceCommit);
        if (pos != ids.end()) {
            ids.erase(ids.begin(), pos + 1);
        } else {
            // Off the head lineage (a sibling branch): fall back to sequence order.
            const int64_t sinceSequence = lineage.at(*sinceCommit).sequence;
            ids.erase(std::remove_if(ids.begin(), ids.end(),
                                     [&](const std::string &id) {
                                         return lineage.at(id).sequence <= sinceSequence;
                                     }),
                      ids.end());
        }
    }

    std::vector<Commit> commits;
    commits.reserve(ids.size());
    for (const auto &id : ids) {
        if (auto commit = getCommit(id)) {
            commits.push_back(std::move(*commit));
        }
    }
    return commits;
}

std::vector<Checkpoint> CheckpointStore::listCheckpoints() const
{
    Statement stmt(impl->db,
                   "SELECT id, label, commit_id, parent_checkpoint_id, created_at "
                   "FROM checkpoints ORDER BY created_at ASC, rowid ASC;");
    std::vector<Checkpoint> checkpoints;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        checkpoints.push_back(readCheckpointRow(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        throw ioFailure(impl->db, "failed to list checkpoints");
    }
    return checkpoints;
}

std::optional<Checkpoint> CheckpointStore::getCheckpoint(const std::string &id) const
{
    Statement stmt(impl->db,
                   "SELECT id, label, commit_id, parent_checkpoint_id, created_at "
                   "FROM checkpoints WHERE id = ? LIMIT 1;");
    bindText(stmt.get(), 1, id);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return readCheckpointRow(stmt.get());
}

std::optional<Checkpoint> CheckpointStore::currentCheckpoint() const
{
    const auto current = impl->getMeta("current");
    if (!current.has_value()) {
        return std::nullopt;
    }
    return getCheckpoint(*current);
}

std::optional<std::string> CheckpointStore::head() const
{
    return impl->getMeta("head");
}

std::optional<Commit> CheckpointStore::getCommit(const std::string &id) const
{
    Statement stmt(impl->db,
                   "SELECT id, parent_id, sequence, timestamp, state FROM commits "
                   "WHERE id = ? LIMIT 1;");
    bindText(stmt.get(), 1, id);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    Commit commit;
    commit.id = columnText(stmt.get(), 0);
    commit.parentId = columnText(stmt.get(), 1);
    commit.sequence = sqlite3_column_int64(stmt.get(), 2);
    commit.timestamp = fromEpochMillis(sqlite3_column_int64(stmt.get(), 3));
    commit.state = parseState(columnText(stmt.get(), 4));
    return commit;
}

std::optional<std::string> CheckpointStore::resolve(const std::string &id) const
{
    return impl->resolve(id);
}

int CheckpointStore::collectGarbage()
{
    std::lock_guard<std::mutex> lock(impl->writeMutex);

    const auto lineage = impl->loadLineage();

    std::vector<std::string> roots;
    if (const auto head = impl->getMeta("head")) {
        roots.push_back(*head);
    }
    for (const auto &checkpoint : listCheckpoints()) {
        roots.push_back(checkpoint.commitId);
    }

    std::set<std::string> reachable;
    for (const auto &root : roots) {
        for (const auto &id : Impl::ancestry(lineage, root)) {
            if (!reachable.insert(id).second) {
                break;
            }
        }
    }

    int removed = 0;
    Transaction tx(impl->db);
    for (const auto &[id, entry] : lineage) {
        if (reachable.count(id) > 0) {
            continue;
        }
        Statement stmt(impl->db, "DELETE FROM commits WHERE id = ?;");
        bindText(stmt.get(), 1, id);
        stepDone(impl->db, stmt, "failed to delete commit");
        ++removed;
    }
    tx.commit();

    if (removed > 0) {
        NTLOG_INFO(QStringLiteral("CheckpointStore"),
                   QStringLiteral("collectGarbage"),
                   QStringLiteral("history_collected"),
                   QStringLiteral("unreferenced_commits"),
                   QStringLiteral("reachability"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"track", toTrackString(impl->options.track)},
                                  {"removed", removed}}));
    }
    return removed;
}

} // namespace nettrack
