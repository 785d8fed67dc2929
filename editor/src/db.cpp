#include "folio/db.hpp"
#include "folio/ids.hpp"
#include <stdexcept>
#include <string>

namespace folio {

static void exec_or_throw(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown sqlite error";
        sqlite3_free(err);
        throw std::runtime_error(msg);
    }
}

namespace {

// Prepared statement that finalizes itself.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("prepare failed: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int i, const std::string& v) { sqlite3_bind_text(stmt_, i, v.c_str(), -1, SQLITE_TRANSIENT); }
    void bind(int i, int v) { sqlite3_bind_int(stmt_, i, v); }
    void bind(int i, const std::optional<std::string>& v) {
        if (v) bind(i, *v);
        else sqlite3_bind_null(stmt_, i);
    }

    bool row() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw std::runtime_error(std::string("sqlite step failed: ") + sqlite3_errmsg(db_));
    }
    void run() {
        if (sqlite3_step(stmt_) != SQLITE_DONE) {
            throw std::runtime_error(std::string("sqlite step failed: ") + sqlite3_errmsg(db_));
        }
    }

    std::string text(int col) const {
        const unsigned char* t = sqlite3_column_text(stmt_, col);
        return t ? reinterpret_cast<const char*>(t) : "";
    }
    std::optional<std::string> optText(int col) const {
        if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
        return text(col);
    }
    int integer(int col) const { return sqlite3_column_int(stmt_, col); }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ {nullptr};
};

} // namespace

static constexpr const char* kSchema =
    "CREATE TABLE IF NOT EXISTS slides("
    " id TEXT PRIMARY KEY, document_id TEXT NOT NULL, title TEXT NOT NULL, subtitle TEXT,"
    " layout_type TEXT NOT NULL, content TEXT NOT NULL, notes TEXT, background_color TEXT,"
    " text_color TEXT, font_family TEXT, order_index INTEGER NOT NULL, version INTEGER NOT NULL,"
    " created_at INTEGER, updated_at INTEGER);"
    "CREATE INDEX IF NOT EXISTS ix_slides_document_order ON slides(document_id, order_index);"
    "CREATE TABLE IF NOT EXISTS histories("
    " document_id TEXT PRIMARY KEY, history_json TEXT NOT NULL, updated_at INTEGER);";

static constexpr const char* kSlideColumns =
    "id, document_id, title, subtitle, layout_type, content, notes,"
    " background_color, text_color, font_family, order_index, version";

static Slide readSlide(const Statement& st) {
    Slide s;
    s.id = st.text(0);
    s.document_id = st.text(1);
    s.title = st.text(2);
    s.subtitle = st.optText(3);
    s.layout_type = st.text(4);
    s.content = json::parse(st.text(5));
    s.notes = st.optText(6);
    s.background_color = st.optText(7);
    s.text_color = st.optText(8);
    s.font_family = st.optText(9);
    s.order_index = st.integer(10);
    s.version = st.integer(11);
    return s;
}

SqliteStorage::SqliteStorage(const std::string& db_path) : db_path_(db_path) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("failed to open sqlite database " + db_path + ": " + msg);
    }
    try {
        exec_or_throw(db_, "PRAGMA journal_mode=WAL;");
        exec_or_throw(db_, "PRAGMA synchronous=NORMAL;");
        exec_or_throw(db_, kSchema);
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteStorage::~SqliteStorage() {
    if (db_) sqlite3_close(db_);
}

void SqliteStorage::begin() {
    mutex_.lock();
    if (in_tx_) {
        mutex_.unlock();
        throw std::logic_error("transaction already in progress");
    }
    try {
        exec_or_throw(db_, "BEGIN");
    } catch (...) {
        mutex_.unlock();
        throw;
    }
    in_tx_ = true;
}

void SqliteStorage::commit() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!in_tx_) throw std::logic_error("commit without an open transaction");
    exec_or_throw(db_, "COMMIT");
    in_tx_ = false;
    mutex_.unlock(); // taken in begin()
}

void SqliteStorage::rollback() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!in_tx_) throw std::logic_error("rollback without an open transaction");
    in_tx_ = false;
    mutex_.unlock(); // taken in begin()
    exec_or_throw(db_, "ROLLBACK");
}

std::optional<Slide> SqliteStorage::getById(const std::string& id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_, (std::string("SELECT ") + kSlideColumns + " FROM slides WHERE id = ?").c_str());
    st.bind(1, id);
    if (!st.row()) return std::nullopt;
    return readSlide(st);
}

Slide SqliteStorage::create(Slide slide) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (slide.id.empty()) slide.id = makeId();
    if (getById(slide.id)) throw std::runtime_error("slide already exists: " + slide.id);
    Statement st(db_,
                 "INSERT INTO slides(id, document_id, title, subtitle, layout_type, content, notes,"
                 " background_color, text_color, font_family, order_index, version, created_at, updated_at)"
                 " VALUES(?,?,?,?,?,?,?,?,?,?,?,?, CAST(strftime('%s','now') AS INTEGER),"
                 " CAST(strftime('%s','now') AS INTEGER))");
    st.bind(1, slide.id);
    st.bind(2, slide.document_id);
    st.bind(3, slide.title);
    st.bind(4, slide.subtitle);
    st.bind(5, slide.layout_type);
    st.bind(6, slide.content.dump());
    st.bind(7, slide.notes);
    st.bind(8, slide.background_color);
    st.bind(9, slide.text_color);
    st.bind(10, slide.font_family);
    st.bind(11, slide.order_index);
    st.bind(12, slide.version);
    st.run();
    return slide;
}

void SqliteStorage::update(const Slide& slide) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_,
                 "UPDATE slides SET document_id = ?, title = ?, subtitle = ?, layout_type = ?, content = ?,"
                 " notes = ?, background_color = ?, text_color = ?, font_family = ?, order_index = ?,"
                 " version = ?, updated_at = CAST(strftime('%s','now') AS INTEGER) WHERE id = ?");
    st.bind(1, slide.document_id);
    st.bind(2, slide.title);
    st.bind(3, slide.subtitle);
    st.bind(4, slide.layout_type);
    st.bind(5, slide.content.dump());
    st.bind(6, slide.notes);
    st.bind(7, slide.background_color);
    st.bind(8, slide.text_color);
    st.bind(9, slide.font_family);
    st.bind(10, slide.order_index);
    st.bind(11, slide.version);
    st.bind(12, slide.id);
    st.run();
    if (sqlite3_changes(db_) == 0) throw std::runtime_error("slide not found: " + slide.id);
}

void SqliteStorage::remove(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_, "DELETE FROM slides WHERE id = ?");
    st.bind(1, id);
    st.run();
    if (sqlite3_changes(db_) == 0) throw std::runtime_error("slide not found: " + id);
}

void SqliteStorage::setOrderIndex(const std::string& id, int order_index) {
    Statement st(db_, "UPDATE slides SET order_index = ? WHERE id = ?");
    st.bind(1, order_index);
    st.bind(2, id);
    st.run();
}

void SqliteStorage::reorder(const std::string& document_id, const std::string& slide_id, int new_order) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (const auto& s : reorderSiblings(listByDocument(document_id), slide_id, new_order)) {
        setOrderIndex(s.id, s.order_index);
    }
}

std::vector<Slide> SqliteStorage::listByDocument(const std::string& document_id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_, (std::string("SELECT ") + kSlideColumns +
                       " FROM slides WHERE document_id = ? ORDER BY order_index ASC, id ASC").c_str());
    st.bind(1, document_id);
    std::vector<Slide> out;
    while (st.row()) out.push_back(readSlide(st));
    return out;
}

void SqliteStorage::saveHistory(const std::string& document_id, const std::string& history_json) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_,
                 "INSERT INTO histories(document_id, history_json, updated_at)"
                 " VALUES(?, ?, CAST(strftime('%s','now') AS INTEGER))"
                 " ON CONFLICT(document_id) DO UPDATE SET history_json = excluded.history_json,"
                 " updated_at = excluded.updated_at");
    st.bind(1, document_id);
    st.bind(2, history_json);
    st.run();
}

std::optional<std::string> SqliteStorage::loadHistory(const std::string& document_id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_, "SELECT history_json FROM histories WHERE document_id = ?");
    st.bind(1, document_id);
    if (!st.row()) return std::nullopt;
    return st.text(0);
}

std::vector<std::string> SqliteStorage::documentIds() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Statement st(db_, "SELECT document_id FROM histories ORDER BY document_id ASC");
    std::vector<std::string> out;
    while (st.row()) out.push_back(st.text(0));
    return out;
}

} // namespace folio
