/*
 * NovelForge C++ - SQLite Storage Backend Implementation
 */
#include <novelforge/storage/sqlite_backend.hpp>
#include <novelforge/core/logger.hpp>
#include <novelforge/core/utils.hpp>
#include <sqlite3.h>
#include <map>
#include <set>
#include <cstring>

namespace novelforge {

// ============================================================================
// Helpers
// ============================================================================

namespace {

const char* kMemoryColumns =
    "seq, id, project_id, kind, content, metadata, embedding, "
    "created_at, previous_id, root_id, version";

const char* kNodeColumns =
    "id, project_id, type, key, attributes, version, updated_at";

const char* kEdgeColumns =
    "id, project_id, source_id, target_id, relation, attributes, created_at";

// Finalizes the prepared statement when it goes out of scope
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql)
        : stmt_(nullptr)
    {
        rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
    }

    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    bool ok() const { return rc_ == SQLITE_OK; }
    int rc() const { return rc_; }

    void bind_text(int idx, const std::string& value) {
        sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT);
    }
    void bind_text_or_null(int idx, const std::string& value) {
        if (value.empty()) sqlite3_bind_null(stmt_, idx);
        else bind_text(idx, value);
    }
    void bind_int64(int idx, int64_t value) {
        sqlite3_bind_int64(stmt_, idx, value);
    }
    void bind_blob(int idx, const void* data, size_t size) {
        sqlite3_bind_blob(stmt_, idx, data, static_cast<int>(size), SQLITE_TRANSIENT);
    }
    void bind_null(int idx) {
        sqlite3_bind_null(stmt_, idx);
    }

    int step() { return sqlite3_step(stmt_); }

    std::string text(int col) const {
        const unsigned char* t = sqlite3_column_text(stmt_, col);
        if (!t) return std::string();
        return std::string(reinterpret_cast<const char*>(t),
                           static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
    }
    int64_t int64(int col) const {
        return sqlite3_column_int64(stmt_, col);
    }
    Embedding embedding(int col) const {
        Embedding vec;
        const void* blob = sqlite3_column_blob(stmt_, col);
        int bytes = sqlite3_column_bytes(stmt_, col);
        if (blob && bytes > 0) {
            vec.resize(static_cast<size_t>(bytes) / sizeof(float));
            std::memcpy(vec.data(), blob, vec.size() * sizeof(float));
        }
        return vec;
    }

private:
    Statement(const Statement&);
    Statement& operator=(const Statement&);

    sqlite3_stmt* stmt_;
    int rc_;
};

Status sqlite_status(sqlite3* db, int rc, const std::string& what) {
    std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    int primary = rc & 0xff;

    if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
        return Status::transient_failure(ErrorCode::STORAGE, msg);
    }
    if (primary == SQLITE_CORRUPT || primary == SQLITE_NOTADB) {
        LOG_ERROR("[SqliteBackend] Database corruption detected: %s", msg.c_str());
        return Status::fail(ErrorCode::CORRUPTION, msg);
    }
    return Status::fail(ErrorCode::STORAGE, msg);
}

Json parse_object(const std::string& text) {
    Json j = Json::parse(text, nullptr, false);
    return j.is_object() ? j : Json::object();
}

void read_memory_row(const Statement& stmt, MemoryEntry& entry) {
    entry.sequence = stmt.int64(0);
    entry.id = stmt.text(1);
    entry.project_id = stmt.text(2);
    if (!memory_kind_from_string(stmt.text(3), entry.kind)) {
        LOG_WARN("[SqliteBackend] Entry %s has unknown kind '%s'",
                 entry.id.c_str(), stmt.text(3).c_str());
    }
    entry.content = stmt.text(4);
    entry.metadata = parse_object(stmt.text(5));
    entry.embedding = stmt.embedding(6);
    entry.created_at = stmt.int64(7);
    entry.previous_id = stmt.text(8);
    entry.root_id = stmt.text(9);
    entry.version = static_cast<int>(stmt.int64(10));
}

void read_node_row(const Statement& stmt, KnowledgeNode& node) {
    node.id = stmt.text(0);
    node.project_id = stmt.text(1);
    if (!node_type_from_string(stmt.text(2), node.type)) {
        LOG_WARN("[SqliteBackend] Node %s has unknown type '%s'",
                 node.id.c_str(), stmt.text(2).c_str());
    }
    node.key = stmt.text(3);
    node.attributes = parse_object(stmt.text(4));
    node.version = static_cast<int>(stmt.int64(5));
    node.updated_at = stmt.int64(6);
}

void read_edge_row(const Statement& stmt, KnowledgeEdge& edge) {
    edge.id = stmt.text(0);
    edge.project_id = stmt.text(1);
    edge.source_id = stmt.text(2);
    edge.target_id = stmt.text(3);
    edge.relation = stmt.text(4);
    edge.attributes = parse_object(stmt.text(5));
    edge.created_at = stmt.int64(6);
}

} // namespace

// Picks the connection for a read: the writer when this thread owns the
// open transaction (so it sees its own writes), the reader otherwise.
class SqliteBackend::ReadScope {
public:
    explicit ReadScope(SqliteBackend& backend)
        : backend_(backend)
        , use_writer_(backend.read_db_ == nullptr || backend.owns_transaction())
    {
        if (use_writer_) backend_.write_mutex_.lock();
        else backend_.read_mutex_.lock();
    }

    ~ReadScope() {
        if (use_writer_) backend_.write_mutex_.unlock();
        else backend_.read_mutex_.unlock();
    }

    sqlite3* db() const { return use_writer_ ? backend_.write_db_ : backend_.read_db_; }
    bool on_reader() const { return !use_writer_; }

private:
    SqliteBackend& backend_;
    bool use_writer_;
};

// ============================================================================
// Lifecycle
// ============================================================================

SqliteBackend::SqliteBackend()
    : write_db_(nullptr)
    , read_db_(nullptr)
    , tx_owner_(std::thread::id())
    , tx_depth_(0)
    , tx_doomed_(false)
{}

SqliteBackend::~SqliteBackend() {
    close();
}

Status SqliteBackend::open(const std::string& db_path) {
    if (write_db_) {
        close();
    }

    bool in_memory = (db_path == ":memory:");
    if (!in_memory && !create_parent_directory(db_path)) {
        LOG_ERROR("[SqliteBackend] Failed to create parent directory for '%s'", db_path.c_str());
        return Status::fail(ErrorCode::STORAGE, "cannot create directory for " + db_path);
    }

    int rc = sqlite3_open_v2(db_path.c_str(), &write_db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        Status s = sqlite_status(write_db_, rc, "open " + db_path);
        sqlite3_close(write_db_);
        write_db_ = nullptr;
        return s;
    }
    sqlite3_busy_timeout(write_db_, 5000);

    Status s;
    if (!in_memory) {
        s = exec(write_db_, "PRAGMA journal_mode=WAL");
        if (s.ok()) s = exec(write_db_, "PRAGMA synchronous=NORMAL");
    }
    if (s.ok()) s = init_schema();
    if (!s.ok()) {
        LOG_ERROR("[SqliteBackend] Failed to initialize '%s': %s",
                  db_path.c_str(), s.to_string().c_str());
        close();
        return s;
    }

    if (!in_memory) {
        rc = sqlite3_open_v2(db_path.c_str(), &read_db_,
                             SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX, nullptr);
        if (rc != SQLITE_OK) {
            s = sqlite_status(read_db_, rc, "open reader " + db_path);
            sqlite3_close(read_db_);
            read_db_ = nullptr;
            close();
            return s;
        }
        sqlite3_busy_timeout(read_db_, 5000);
    }

    path_ = db_path;
    LOG_INFO("[SqliteBackend] Database opened: %s", db_path.c_str());
    return Status::ok_status();
}

void SqliteBackend::close() {
    if (read_db_) {
        sqlite3_close(read_db_);
        read_db_ = nullptr;
    }
    if (write_db_) {
        sqlite3_close(write_db_);
        write_db_ = nullptr;
    }
}

Status SqliteBackend::exec(sqlite3* db, const char* sql) {
    if (!db) return Status::fail(ErrorCode::STORAGE, "database not open");

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        LOG_DEBUG("[SqliteBackend] SQL error: %s\n  Query: %s",
                  err_msg ? err_msg : "unknown", sql);
        if (err_msg) sqlite3_free(err_msg);
        return sqlite_status(db, rc, "exec");
    }
    return Status::ok_status();
}

Status SqliteBackend::init_schema() {
    static const char* statements[] = {
        "CREATE TABLE IF NOT EXISTS projects ("
        "  project_id TEXT PRIMARY KEY,"
        "  embedding_dim INTEGER NOT NULL DEFAULT 0,"
        "  graph_version INTEGER NOT NULL DEFAULT 0"
        ")",

        "CREATE TABLE IF NOT EXISTS memory_entries ("
        "  seq INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  id TEXT NOT NULL UNIQUE,"
        "  project_id TEXT NOT NULL,"
        "  kind TEXT NOT NULL,"
        "  content TEXT NOT NULL,"
        "  metadata TEXT NOT NULL DEFAULT '{}',"
        "  embedding BLOB,"
        "  created_at INTEGER NOT NULL,"
        "  previous_id TEXT,"
        "  root_id TEXT NOT NULL,"
        "  version INTEGER NOT NULL"
        ")",
        "CREATE INDEX IF NOT EXISTS idx_memory_project ON memory_entries(project_id, created_at)",
        "CREATE INDEX IF NOT EXISTS idx_memory_previous ON memory_entries(previous_id)",
        "CREATE INDEX IF NOT EXISTS idx_memory_root ON memory_entries(root_id, version)",

        "CREATE TABLE IF NOT EXISTS kg_nodes ("
        "  id TEXT PRIMARY KEY,"
        "  project_id TEXT NOT NULL,"
        "  type TEXT NOT NULL,"
        "  key TEXT NOT NULL,"
        "  attributes TEXT NOT NULL DEFAULT '{}',"
        "  version INTEGER NOT NULL,"
        "  updated_at INTEGER NOT NULL,"
        "  UNIQUE(project_id, type, key)"
        ")",

        "CREATE TABLE IF NOT EXISTS kg_node_history ("
        "  node_id TEXT NOT NULL,"
        "  version INTEGER NOT NULL,"
        "  project_id TEXT NOT NULL,"
        "  type TEXT NOT NULL,"
        "  key TEXT NOT NULL,"
        "  attributes TEXT NOT NULL,"
        "  updated_at INTEGER NOT NULL,"
        "  PRIMARY KEY(node_id, version)"
        ")",
        "CREATE INDEX IF NOT EXISTS idx_history_project ON kg_node_history(project_id)",

        "CREATE TABLE IF NOT EXISTS kg_edges ("
        "  id TEXT PRIMARY KEY,"
        "  project_id TEXT NOT NULL,"
        "  source_id TEXT NOT NULL,"
        "  target_id TEXT NOT NULL,"
        "  relation TEXT NOT NULL,"
        "  attributes TEXT NOT NULL DEFAULT '{}',"
        "  created_at INTEGER NOT NULL,"
        "  UNIQUE(project_id, source_id, target_id, relation)"
        ")",

        "CREATE TABLE IF NOT EXISTS graph_snapshots ("
        "  id TEXT PRIMARY KEY,"
        "  project_id TEXT NOT NULL,"
        "  graph_version INTEGER NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  payload TEXT NOT NULL"
        ")",
        "CREATE INDEX IF NOT EXISTS idx_snapshots_project ON graph_snapshots(project_id, created_at)",

        "CREATE TABLE IF NOT EXISTS audit_log ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  project_id TEXT NOT NULL,"
        "  action TEXT NOT NULL,"
        "  detail TEXT NOT NULL DEFAULT '{}',"
        "  created_at INTEGER NOT NULL"
        ")"
    };

    for (size_t i = 0; i < sizeof(statements) / sizeof(statements[0]); ++i) {
        Status s = exec(write_db_, statements[i]);
        if (!s.ok()) return s;
    }
    return Status::ok_status();
}

// ============================================================================
// Transactions
// ============================================================================

bool SqliteBackend::owns_transaction() const {
    return tx_owner_.load() == std::this_thread::get_id();
}

Status SqliteBackend::begin() {
    write_mutex_.lock();

    if (tx_depth_ > 0) {
        ++tx_depth_;
        return Status::ok_status();
    }

    Status s = exec(write_db_, "BEGIN IMMEDIATE");
    if (!s.ok()) {
        write_mutex_.unlock();
        return s;
    }
    tx_depth_ = 1;
    tx_doomed_ = false;
    tx_owner_.store(std::this_thread::get_id());
    return Status::ok_status();
}

Status SqliteBackend::commit() {
    if (tx_depth_ == 0 || !owns_transaction()) {
        return Status::fail(ErrorCode::STORAGE, "commit without an open transaction");
    }

    if (tx_depth_ > 1) {
        --tx_depth_;
        write_mutex_.unlock();
        return Status::ok_status();
    }

    Status s;
    if (tx_doomed_) {
        Status rb = exec(write_db_, "ROLLBACK");
        if (!rb.ok()) {
            LOG_ERROR("[SqliteBackend] Rollback failed: %s", rb.to_string().c_str());
        }
        s = Status::fail(ErrorCode::STORAGE, "transaction was rolled back by an inner scope");
    } else {
        s = exec(write_db_, "COMMIT");
        if (!s.ok()) {
            LOG_ERROR("[SqliteBackend] Commit failed: %s", s.to_string().c_str());
            Status rb = exec(write_db_, "ROLLBACK");
            if (!rb.ok()) {
                LOG_ERROR("[SqliteBackend] Rollback failed: %s", rb.to_string().c_str());
            }
        }
    }

    tx_depth_ = 0;
    tx_doomed_ = false;
    tx_owner_.store(std::thread::id());
    write_mutex_.unlock();
    return s;
}

Status SqliteBackend::rollback() {
    if (tx_depth_ == 0 || !owns_transaction()) {
        return Status::fail(ErrorCode::STORAGE, "rollback without an open transaction");
    }

    if (tx_depth_ > 1) {
        --tx_depth_;
        tx_doomed_ = true;
        write_mutex_.unlock();
        return Status::ok_status();
    }

    Status s = exec(write_db_, "ROLLBACK");
    tx_depth_ = 0;
    tx_doomed_ = false;
    tx_owner_.store(std::thread::id());
    write_mutex_.unlock();
    return s;
}

// ============================================================================
// Project metadata
// ============================================================================

Status SqliteBackend::get_embedding_dimension(const std::string& project_id, int& dimension) {
    ReadScope scope(*this);
    Statement stmt(scope.db(), "SELECT embedding_dim FROM projects WHERE project_id = ?");
    if (!stmt.ok()) return sqlite_status(scope.db(), stmt.rc(), "get_embedding_dimension prepare");
    stmt.bind_text(1, project_id);

    int rc = stmt.step();
    if (rc == SQLITE_ROW) {
        dimension = static_cast<int>(stmt.int64(0));
        return Status::ok_status();
    }
    if (rc == SQLITE_DONE) {
        dimension = 0;
        return Status::ok_status();
    }
    return sqlite_status(scope.db(), rc, "get_embedding_dimension");
}

Status SqliteBackend::set_embedding_dimension(const std::string& project_id, int dimension) {
    std::lock_guard<std::recursive_mutex> lock(write_mutex_);

    Statement ensure(write_db_, "INSERT OR IGNORE INTO projects (project_id) VALUES (?)");
    if (!ensure.ok()) return sqlite_status(write_db_, ensure.rc(), "ensure project prepare");
    ensure.bind_text(1, project_id);
    int rc = ensure.step();
    if (rc != SQLITE_DONE) return sqlite_status(write_db_, rc, "ensure project");

    Statement stmt(write_db_, "UPDATE projects SET embedding_dim = ? WHERE project_id = ?");
    if (!stmt.ok()) return sqlite_status(write_db_, stmt.rc(), "set_embedding_dimension prepare");
    stmt.bind_int64(1, dimension);
    stmt.bind_text(2, project_id);
    rc = stmt.step();
    if (rc != SQLITE_DONE) return sqlite_status(write_db_, rc, "set_embedding_dimension");
    return Status::ok_status();
}

Status SqliteBackend::get_graph_version(const std::string& project_id, int64_t& version) {
    ReadScope scope(*this);
    Statement stmt(scope.db(), "SELECT graph_version FROM projects WHERE project_id = ?");
    if (!stmt.ok()) return sqlite_status(scope.db(), stmt.rc(), "get_graph_version prepare");
    stmt.bind_text(1, project_id);

    int rc = stmt.step();
    if (rc == SQLITE_ROW) {
        version = stmt.int64(0);
        return Status::ok_status();
    }
    if (rc == SQLITE_DONE) {
        version = 0;
        return Status::ok_status();
    }
    return sqlite_status(scope.db(), rc, "get_graph_version");
}

Status SqliteBackend::set_graph_version(const std::string& project_id, int64_t version) {
    std::lock_guard<std::recursive_mutex> lock(write_mutex_);

    Statement ensure(write_db_, "INSERT OR IGNORE INTO projects (project_id) VALUES (?)");
    if (!ensure.ok()) return sqlite_status(write_db_, ensure.rc(), "ensure project prepare");
    ensure.bind_text(1, project_id);
    int rc = ensure.step();
    if (rc != SQLITE_DONE) return sqlite_status(write_db_, rc, "ensure project");

    Statement stmt(write_db_, "UPDATE projects SET graph_version = ? WHERE project_id = ?");
    if (!stmt.ok()) return sqlite_status(write_db_, stmt.rc(), "set_graph_version prepare");
    stmt.bind_int64(1, version);
    stmt.bind_text(2, project_id);
    rc = stmt.step();
    if (rc != SQLITE_DONE) return sqlite_status(write_db_, rc, "set_graph_version");
    return Status::ok_status();
}

// ============================================================================
// Memory entries
// ============================================================================

Status SqliteBackend::insert_memory(MemoryEntry& entry) {
    std::lock_guard<std::recursive_mutex> lock(write_mutex_);

    Statement stmt(write_db_,
        "INSERT INTO memory_entries (id, project_id, kind, content, metadata, embedding, "
        "created_at, previous_id, root_id, version) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (!stmt.ok()) return sqlite_status(write_db_, stmt.rc(), "insert_memory prepare");

    stmt.bind_text(1, entry.id);
    stmt.bind_text(2, entry.project_id);
    stmt.bind_text(3, memory_kind_to_string(entry.kind));
    stmt.bind_text(4, entry.content);
    stmt.bind_text(5, entry.metadata.dump());
    if (entry.embedding.empty()) {
        stmt.bind_null(6);
    } else {
        stmt.bind_blob(6, entry.embedding.data(), entry.embedding.size() * sizeof(float));
    }
    stmt.bind_int64(7, entry.created_at);
    stmt.bind_text_or_null(8, entry.previous_id);
    stmt.bind_text(9, entry.root_id);
    stmt.bind_int64(10, entry.version);

    int rc = stmt.step();
    if (rc != SQLITE_DONE) return sqlite_status(write_db_, rc, "insert_memory");

    entry.sequence = sqlite3_last_insert_rowid(write_db_);
    return Status::ok_status();
}

Status SqliteBackend::load_memory(const std::string& id, MemoryEntry& out) {
    ReadScope scope(*this);
    Statement stmt(scope.db(),
        std::string("SELECT ") + kMemoryColumns + " FROM memory_entries WHERE id = ?");
    if (!stmt.ok()) return sqlite_status(scope.db(), stmt.rc(), "load_memory prepare");
    stmt.bind_text(1, id);

    int rc = stmt.step();
    if (rc == SQLITE_ROW) {
        read_memory_row(stmt, out);
        return Status::ok_status();
    }
    if (rc == SQLITE_DONE) {
        return Status::fail(ErrorCode::NOT_FOUND, "memory entry not found: " + id);
    }
    return sqlite_status(scope.db(), rc, "load_memory");
}

Status SqliteBackend::load_chain(const std::string& root_id, std::vector<MemoryEntry>& out) {
    ReadScope scope(*this);
    Statement stmt(scope.db(),
        std::string("SELECT ") + kMemoryColumns +
        " FROM memory_entries WHERE root_id = ? ORDER BY version ASC");
    if (!stmt.ok()) return sqlite_status(scope.db(), stmt.rc(), "load_chain prepare");
    stmt.bind_text(1, root_id);

    out.clear();
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        MemoryEntry entry;
        read_memory_row(stmt, entry);
        out.push_back(entry);
    }
    if (rc != SQLITE_DONE) return sqlite_status(scope.db(), rc, "load_chain");
    return Status::ok_status();
}

Status SqliteBackend::delete_memory(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(write_mutex_);

    Statement stmt(write_db_, "DELETE FROM memory_entries WHERE id = ?");
    if (!stmt.ok()) return sqlite_status(write_db_, stmt.rc(), "delete_memory prepare");
    stmt.bind_text(1, id);

    int rc = stmt.step();
    if (rc != SQLITE_DONE) return sqlite_status(write_db_, rc, "delete_memory");
    if (sqlite3_changes(write_db_) == 0) {
        return Status::fail(ErrorCode::NOT_FOUND, "memory entry not found: " + id);
    }
    return Status::ok_status();
}

Status SqliteBackend::load_latest_entries(sqlite3* db, const std::string& project_id,
                                          bool newest_first, std::vector<MemoryEntry>& out)
{
    std::string sql = std::string("SELECT ") + kMemoryColumns +
        " FROM memory_entries m WHERE m.project_id = ?"
        " AND NOT EXISTS (SELECT 1 FROM memory_entries n WHERE n.previous_id = m.id)";
    if (newest_first) {
        sql += " ORDER BY m.created_at DESC, m.seq DESC";
    }

    Statement stmt(db, sql);
    if (!stmt.ok()) return sqlite_status(db, stmt.rc(), "load_latest_entries prepare");
    stmt.bind_text(1, project_id);

    out.clear();
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        MemoryEntry entry;
        read_memory_row(stmt, entry);
        out.push_back(entry);
    }
    if (rc != SQLITE_DONE) return sqlite_status(db, rc, "load_latest_entries");
    return Status::ok_status();
}

Status SqliteBackend::search_nearest(const std::string& project_id,
                                     const Embedding& query,
                                     const MemoryFilter& filter,
                                     size_t top_k,
                                     double tie_epsilon,
                                     std::vector<MemoryHit>& out)
{
    std::vector<MemoryEntry> entries;
    {
        ReadScope scope(*this);
        Status s = load_latest_entries(scope.db(), project_id, false, entries);
        if (!s.ok()) return s;
    }

    out.clear();
    for (size_t i = 0; i < entries.size(); ++i) {
        if (!filter.matches(entries[i])) continue;
        if (entries[i].embedding.size() != query.size()) continue;

        MemoryHit hit;
        hit.similarity = cosine_similarity(query, entries[i].embedding);
        hit.entry = entries[i];
        out.push_back(hit);
    }

    rank_memory_hits(out, tie_epsilon);
    if (out.size() > top_k) {
        out.resize(top_k);
    }
    return Status::ok_status();
}

Status SqliteBackend::list_recent(const std::string& project_id,
                                  const MemoryFilter& filter,
                                  size_t limit,
                                  std::vector<MemoryEntry>& out)
{
    std::vector<MemoryEntry> entries;
    {
        ReadScope scope(*this);
        Status s = load_latest_entries(scope.db(), project_id, true, entries);
        if (!s.ok()) return s;
    }

    out.clear();
    for (size_t i = 0; i < entries.size() && out.size() < limit; ++i) {
        if (filter.matches(entries[i])) {
            out.push_back(entries[i]);
        }
    }
    return Status::ok_status();
}

// ============================================================================
// Knowledge graph
// ============================================================================

Status SqliteBackend::load_node(const std::string& project_id, NodeType type,
                                const std::string& key, KnowledgeNode& out)
{
    ReadScope scope(*this);
    Statement stmt(scope.db(),
        std::string("SELECT ") + kNodeColumns +
        " FROM kg_nodes WHERE project_id = ? AND type = ? AND key = ?");
    if (!stmt.ok()) return sqlite_status(scope.db(), stmt.rc(), "load_node prepare");
    stmt.bind_text(1, project_id);
    stmt.bind_text(2, node_type_to_string(type));
    stmt.bind_text(3, key);

    int rc = stmt.step();
    if (rc == SQLITE_ROW) {
        read_node_row(stmt, out);
        return Status::ok_status();
    }
    if (rc == SQLITE_DONE) {
        return Status::fail(ErrorCode::NOT_FOUND, "node not found: " + node_ref_string(type, key));
    }
    return sqlite_status(scope.db(), rc, "load_node");
}

Status SqliteBackend::load_node_by_id(const std::string& node_id, KnowledgeNode& out) {
    ReadScope scope(*this);
    Statement stmt(scope.db(),
        std::string("SELECT ") + kNodeColumns + " FROM kg_nodes WHERE id = ?");
    if (!stmt.ok()) return sqlite_status(scope.db(), stmt.rc(), "load_node_by_id prepare");
    stmt.bind_text(1, node_id);

    int rc = stmt.step();
    if (rc == SQLITE_ROW) {
        read_node_row(stmt, out);
        return Status::ok_status();
    }
    if (rc == SQLITE_DONE) {
        return Status::fail(ErrorCode::NOT_FOUND, "node not found: " + node_id);
    }
    return sqlite_status(scope.db(), rc, "load_node_by_id");
}

Status SqliteBackend::save_node(const KnowledgeNode& node) {
    std::lock_guard<std::recursive_mutex> lock(write_mutex_);

    Statement stmt(write_db_,
        std::string("INSERT OR REPLACE INTO kg_nodes (") + kNodeColumns +
        ") VALUES (?, ?, ?, ?, ?, ?, ?)");
    if (!stmt.ok()) return sqlite_status(write_db_, stmt.rc(), "save_node prepare");
    stmt.bind_text(1, node.id);
    stmt.bind_text(2, node.project_id);
    stmt.bind_text(3, node_type_to_string(node.type));
    stmt.bind_text(4, node.key);
    stmt.bind_text(5, node.attributes.dump());
    stmt.bind_int64(6, node.version);
    stmt.bind_int64(7, node.updated_at);

    int rc = stmt.step();
    if (rc != SQLITE_DONE) return sqlite_status(write_db_, rc, "save_node");
    return Status::ok_status();
}

Status SqliteBackend::append_node_history(const KnowledgeNode& node) {
    std::lock_guard<std::recursive_mutex> lock(write_mutex_);

    Statement stmt(write_db_,
        "INSERT OR REPLACE INTO kg_node_history "
        "(node_id, version, project_id, type, key, attributes, updated_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)");
    if (!stmt.ok()) return sqlite_status(write_db_, stmt.rc(), "append_node_history prepare");
    stmt.bind_text(1, node.id);
    stmt.bind_int64(2, node.version);
    stmt.bind_text(3, node.project_id);
    stmt.bind_text(4, node_type_to_string(node.type));
    stmt.bind_text(5, node.key);
    stmt.bind_text(6, node.attributes.dump());
    stmt.bind_int64(7, node.updated_at);

    int rc = stmt.step();
    if (rc != SQLITE_DONE) return sqlite_status(write_db_, rc, "append_node_history");
    return Status::ok_status();
}

Status SqliteBackend::load_node_history(const std::string& node_id,
                                        std::vector<KnowledgeNode>& out)
{
    ReadScope scope(*this);
    Statement stmt(scope.db(),
        "SELECT node_id, project_id, type, key, attributes, version, updated_at "
        "FROM kg_node_history WHERE node_id = ? ORDER BY version ASC");
    if (!stmt.ok()) return sqlite_status(scope.db(), stmt.rc(), "load_node_history prepare");
    stmt.bind_text(1, node_id);

    out.clear();
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        KnowledgeNode node;
        read_node_row(stmt, node);
        out.push_back(node);
    }
    if (rc != SQLITE_DONE) return sqlite_status(scope.db(), rc, "load_node_history");
    return Status::ok_status();
}

Status SqliteBackend::insert_edge(const KnowledgeEdge& edge) {
    std::lock_guard<std::recursive_mutex> lock(write_mutex_);

    Statement stmt(write_db_,
        std::string("INSERT INTO kg_edges (") + kEdgeColumns + ") VALUES (?, ?, ?, ?, ?, ?, ?)");
    if (!stmt.ok()) return sqlite_status(write_db_, stmt.rc(), "insert_edge prepare");
    stmt.bind_text(1, edge.id);
    stmt.bind_text(2, edge.project_id);
    stmt.bind_text(3, edge.source_id);
    stmt.bind_text(4, edge.target_id);
    stmt.bind_text(5, edge.relation);
    stmt.bind_text(6, edge.attributes.dump());
    stmt.bind_int64(7, edge.created_at);

    int rc = stmt.step();
    if (rc != SQLITE_DONE) return sqlite_status(write_db_, rc, "insert_edge");
    return Status::ok_status();
}

Status SqliteBackend::find_edge(const std::string& project_id,
                                const std::string& source_id,
                                const std::string& target_id,
                                const std::string& relation,
                                KnowledgeEdge& out)
{
    ReadScope scope(*this);
    Statement stmt(scope.db(),
        std::string("SELECT ") + kEdgeColumns + " FROM kg_edges "
        "WHERE project_id = ? AND source_id = ? AND target_id = ? AND relation = ?");
    if (!stmt.ok()) return sqlite_status(scope.db(), stmt.rc(), "find_edge prepare");
    stmt.bind_text(1, project_id);
    stmt.bind_text(2, source_id);
    stmt.bind_text(3, target_id);
    stmt.bind_text(4, relation);

    int rc = stmt.step();
    if (rc == SQLITE_ROW) {
        read_edge_row(stmt, out);
        return Status::ok_status();
    }
    if (rc == SQLITE_DONE) {
        return Status::fail(ErrorCode::NOT_FOUND, "edge not found");
    }
    return sqlite_status(scope.db(), rc, "find_edge");
}

Status SqliteBackend::load_graph(const std::string& project_id, GraphSnapshot& out) {
    ReadScope scope(*this);
    sqlite3* db = scope.db();

    // One read transaction on the reader so version, nodes and edges agree
    if (scope.on_reader()) {
        Status s = exec(db, "BEGIN");
        if (!s.ok()) return s;
    }

    Status result;
    out.project_id = project_id;
    out.graph_version = 0;
    out.nodes.clear();
    out.edges.clear();

    {
        Statement stmt(db, "SELECT graph_version FROM projects WHERE project_id = ?");
        if (!stmt.ok()) {
            result = sqlite_status(db, stmt.rc(), "load_graph version prepare");
        } else {
            stmt.bind_text(1, project_id);
            int rc = stmt.step();
            if (rc == SQLITE_ROW) out.graph_version = stmt.int64(0);
            else if (rc != SQLITE_DONE) result = sqlite_status(db, rc, "load_graph version");
        }
    }

    if (result.ok()) {
        Statement stmt(db, std::string("SELECT ") + kNodeColumns +
                       " FROM kg_nodes WHERE project_id = ? ORDER BY type, key");
        if (!stmt.ok()) {
            result = sqlite_status(db, stmt.rc(), "load_graph nodes prepare");
        } else {
            stmt.bind_text(1, project_id);
            int rc;
            while ((rc = stmt.step()) == SQLITE_ROW) {
                KnowledgeNode node;
                read_node_row(stmt, node);
                out.nodes.push_back(node);
            }
            if (rc != SQLITE_DONE) result = sqlite_status(db, rc, "load_graph nodes");
        }
    }

    if (result.ok()) {
        Statement stmt(db, std::string("SELECT ") + kEdgeColumns +
                       " FROM kg_edges WHERE project_id = ? ORDER BY created_at, id");
        if (!stmt.ok()) {
            result = sqlite_status(db, stmt.rc(), "load_graph edges prepare");
        } else {
            stmt.bind_text(1, project_id);
            int rc;
            while ((rc = stmt.step()) == SQLITE_ROW) {
                KnowledgeEdge edge;
                read_edge_row(stmt, edge);
                out.edges.push_back(edge);
            }
            if (rc != SQLITE_DONE) result = sqlite_status(db, rc, "load_graph edges");
        }
    }

    if (scope.on_reader()) {
        Status end = exec(db, "COMMIT");
        if (result.ok() && !end.ok()) result = end;
    }

    out.build_index();
    return result;
}

Status SqliteBackend::restore_graph(const std::string& project_id,
                                    const std::vector<KnowledgeNode>& nodes,
                                    const std::vector<KnowledgeEdge>& edges)
{
    TransactionGuard tx(*this);
    if (!tx.status().ok()) return tx.status();

    std::map<std::string, int> restored;
    for (size_t i = 0; i < nodes.size(); ++i) {
        restored[nodes[i].id] = nodes[i].version;
    }

    // Every node id that has current or historical rows in this project
    std::set<std::string> known;
    {
        Statement stmt(write_db_,
            "SELECT id FROM kg_nodes WHERE project_id = ?1 "
            "UNION SELECT node_id FROM kg_node_history WHERE project_id = ?1");
        if (!stmt.ok()) return sqlite_status(write_db_, stmt.rc(), "restore_graph list prepare");
        stmt.bind_text(1, project_id);
        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            known.insert(stmt.text(0));
        }
        if (rc != SQLITE_DONE) return sqlite_status(write_db_, rc, "restore_graph list");
    }

    for (std::set<std::string>::const_iterator it = known.begin(); it != known.end(); ++it) {
        std::map<std::string, int>::const_iterator keep = restored.find(*it);
        Statement stmt(write_db_, keep == restored.end()
            ? "DELETE FROM kg_node_history WHERE node_id = ?"
            : "DELETE FROM kg_node_history WHERE node_id = ? AND version > ?");
        if (!stmt.ok()) return sqlite_status(write_db_, stmt.rc(), "restore_graph history prepare");
        stmt.bind_text(1, *it);
        if (keep != restored.end()) stmt.bind_int64(2, keep->second);
        int rc = stmt.step();
        if (rc != SQLITE_DONE) return sqlite_status(write_db_, rc, "restore_graph history");
    }

    static const char* clear_sql[] = {
        "DELETE FROM kg_edges WHERE project_id = ?",
        "DELETE FROM kg_nodes WHERE project_id = ?"
    };
    for (size_t i = 0; i < 2; ++i) {
        Statement stmt(write_db_, clear_sql[i]);
        if (!stmt.ok()) return sqlite_status(write_db_, stmt.rc(), "restore_graph clear prepare");
        stmt.bind_text(1, project_id);
        int rc = stmt.step();
        if (rc != SQLITE_DONE) return sqlite_status(write_db_, rc, "restore_graph clear");
    }

    for (size_t i = 0; i < nodes.size(); ++i) {
        Status s = save_node(nodes[i]);
        if (!s.ok()) return s;
        s = append_node_history(nodes[i]);
        if (!s.ok()) return s;
    }
    for (size_t i = 0; i < edges.size(); ++i) {
        Status s = insert_edge(edges[i]);
        if (!s.ok()) return s;
    }

    return tx.commit();
}

// ============================================================================
// Snapshots
// ============================================================================

Status SqliteBackend::save_snapshot(const GraphSnapshot& snapshot) {
    std::lock_guard<std::recursive_mutex> lock(write_mutex_);

    Statement stmt(write_db_,
        "INSERT INTO graph_snapshots (id, project_id, graph_version, created_at, payload) "
        "VALUES (?, ?, ?, ?, ?)");
    if (!stmt.ok()) return sqlite_status(write_db_, stmt.rc(), "save_snapshot prepare");
    stmt.bind_text(1, snapshot.id);
    stmt.bind_text(2, snapshot.project_id);
    stmt.bind_int64(3, snapshot.graph_version);
    stmt.bind_int64(4, snapshot.created_at);
    stmt.bind_text(5, snapshot.to_json().dump());

    int rc = stmt.step();
    if (rc != SQLITE_DONE) return sqlite_status(write_db_, rc, "save_snapshot");
    return Status::ok_status();
}

Status SqliteBackend::load_snapshot(const std::string& snapshot_id, GraphSnapshot& out) {
    std::string payload;
    {
        ReadScope scope(*this);
        Statement stmt(scope.db(), "SELECT payload FROM graph_snapshots WHERE id = ?");
        if (!stmt.ok()) return sqlite_status(scope.db(), stmt.rc(), "load_snapshot prepare");
        stmt.bind_text(1, snapshot_id);

        int rc = stmt.step();
        if (rc == SQLITE_DONE) {
            return Status::fail(ErrorCode::NOT_FOUND, "snapshot not found: " + snapshot_id);
        }
        if (rc != SQLITE_ROW) return sqlite_status(scope.db(), rc, "load_snapshot");
        payload = stmt.text(0);
    }

    Json j = Json::parse(payload, nullptr, false);
    if (j.is_discarded() || !GraphSnapshot::from_json(j, out)) {
        LOG_ERROR("[SqliteBackend] Snapshot %s has an unreadable payload", snapshot_id.c_str());
        return Status::fail(ErrorCode::CORRUPTION, "snapshot payload unreadable: " + snapshot_id);
    }
    return Status::ok_status();
}

Status SqliteBackend::list_snapshots(const std::string& project_id,
                                     std::vector<SnapshotInfo>& out)
{
    ReadScope scope(*this);
    Statement stmt(scope.db(),
        "SELECT id, project_id, graph_version, created_at FROM graph_snapshots "
        "WHERE project_id = ? ORDER BY created_at ASC, graph_version ASC");
    if (!stmt.ok()) return sqlite_status(scope.db(), stmt.rc(), "list_snapshots prepare");
    stmt.bind_text(1, project_id);

    out.clear();
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        SnapshotInfo info;
        info.id = stmt.text(0);
        info.project_id = stmt.text(1);
        info.graph_version = stmt.int64(2);
        info.created_at = stmt.int64(3);
        out.push_back(info);
    }
    if (rc != SQLITE_DONE) return sqlite_status(scope.db(), rc, "list_snapshots");
    return Status::ok_status();
}

// ============================================================================
// Audit
// ============================================================================

Status SqliteBackend::append_audit(const AuditRecord& record) {
    std::lock_guard<std::recursive_mutex> lock(write_mutex_);

    Statement stmt(write_db_,
        "INSERT INTO audit_log (project_id, action, detail, created_at) VALUES (?, ?, ?, ?)");
    if (!stmt.ok()) return sqlite_status(write_db_, stmt.rc(), "append_audit prepare");
    stmt.bind_text(1, record.project_id);
    stmt.bind_text(2, record.action);
    stmt.bind_text(3, record.detail.dump());
    stmt.bind_int64(4, record.created_at > 0 ? record.created_at : current_timestamp_ms());

    int rc = stmt.step();
    if (rc != SQLITE_DONE) return sqlite_status(write_db_, rc, "append_audit");
    return Status::ok_status();
}

Status SqliteBackend::list_audit(const std::string& project_id, std::vector<AuditRecord>& out) {
    ReadScope scope(*this);
    Statement stmt(scope.db(),
        "SELECT id, project_id, action, detail, created_at FROM audit_log "
        "WHERE project_id = ? ORDER BY id ASC");
    if (!stmt.ok()) return sqlite_status(scope.db(), stmt.rc(), "list_audit prepare");
    stmt.bind_text(1, project_id);

    out.clear();
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        AuditRecord record;
        record.id = stmt.int64(0);
        record.project_id = stmt.text(1);
        record.action = stmt.text(2);
        record.detail = parse_object(stmt.text(3));
        record.created_at = stmt.int64(4);
        out.push_back(record);
    }
    if (rc != SQLITE_DONE) return sqlite_status(scope.db(), rc, "list_audit");
    return Status::ok_status();
}

} // namespace novelforge
