#include "storage/GraphStorage.hpp"
#include "server/Logger.hpp"
#include <sqlite3.h>
#include <stdexcept>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace storage {

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

/**
 * Get current UTC timestamp in ISO 8601 format
 */
std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

/**
 * RAII wrapper for SQLite prepared statements
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : m_stmt(nullptr) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error("Failed to prepare statement: " +
                                     std::string(sqlite3_errmsg(db)));
        }
    }

    ~Statement() {
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bindText(int index, const std::string& value) {
        sqlite3_bind_text(m_stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bindNull(int index) {
        sqlite3_bind_null(m_stmt, index);
    }

    bool step() {
        int result = sqlite3_step(m_stmt);
        if (result == SQLITE_ROW) return true;
        if (result == SQLITE_DONE) return false;
        throw std::runtime_error("Step failed: " +
                                 std::string(sqlite3_errmsg(sqlite3_db_handle(m_stmt))));
    }

    std::string getText(int col) {
        const char* text = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, col));
        return text ? text : "";
    }

    int64_t getInt64(int col) {
        return sqlite3_column_int64(m_stmt, col);
    }

    bool isNull(int col) {
        return sqlite3_column_type(m_stmt, col) == SQLITE_NULL;
    }

private:
    sqlite3_stmt* m_stmt;
};

GraphVersion readVersion(Statement& stmt) {
    return GraphVersion{
        .id = stmt.getInt64(0),
        .graphSlug = stmt.getText(1),
        .versionName = stmt.isNull(2) ? std::nullopt : std::optional<std::string>(stmt.getText(2)),
        .graphJson = stmt.getText(3),
        .createdAt = stmt.getText(4)
    };
}

} // anonymous namespace

// =============================================================================
// GraphStorage::Impl
// =============================================================================

class GraphStorage::Impl {
public:
    explicit Impl(const std::string& dbPath) : m_dbPath(dbPath), m_db(nullptr) {
        if (sqlite3_open(dbPath.c_str(), &m_db) != SQLITE_OK) {
            std::string error = m_db ? sqlite3_errmsg(m_db) : "out of memory";
            sqlite3_close(m_db);
            m_db = nullptr;
            throw std::runtime_error("Failed to open database: " + error);
        }

        try {
            exec("PRAGMA foreign_keys = ON");
            createTables();
        } catch (const std::exception&) {
            sqlite3_close(m_db);
            m_db = nullptr;
            throw;
        }

        LOG_INFO("Graph storage opened: " + dbPath);
    }

    ~Impl() {
        if (m_db) {
            sqlite3_close(m_db);
        }
    }

    void exec(const std::string& sql) {
        char* errMsg = nullptr;
        if (sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "Unknown error";
            sqlite3_free(errMsg);
            throw std::runtime_error("SQL error: " + error);
        }
    }

    void createTables() {
        exec(R"(
            CREATE TABLE IF NOT EXISTS graphs (
                slug TEXT PRIMARY KEY,
                name TEXT NOT NULL,
                created_at TEXT NOT NULL,
                updated_at TEXT NOT NULL
            )
        )");

        exec(R"(
            CREATE TABLE IF NOT EXISTS graph_versions (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                graph_slug TEXT NOT NULL,
                version_name TEXT,
                graph_json TEXT NOT NULL,
                created_at TEXT NOT NULL,
                FOREIGN KEY (graph_slug) REFERENCES graphs(slug) ON DELETE CASCADE
            )
        )");

        exec("CREATE INDEX IF NOT EXISTS idx_versions_graph ON graph_versions(graph_slug)");
    }

    // === Graph CRUD ===

    void createGraph(const GraphMetadata& metadata) {
        if (metadata.slug.empty()) {
            throw std::invalid_argument("Graph slug must not be empty");
        }

        Statement stmt(m_db,
            "INSERT INTO graphs (slug, name, created_at, updated_at) VALUES (?, ?, ?, ?)");

        std::string now = currentTimestamp();

        stmt.bindText(1, metadata.slug);
        stmt.bindText(2, metadata.name.empty() ? metadata.slug : metadata.name);
        stmt.bindText(3, now);
        stmt.bindText(4, now);

        stmt.step();
    }

    void deleteGraph(const std::string& slug) {
        Statement stmt(m_db, "DELETE FROM graphs WHERE slug = ?");
        stmt.bindText(1, slug);
        stmt.step();
    }

    std::optional<GraphMetadata> getGraph(const std::string& slug) {
        Statement stmt(m_db,
            "SELECT slug, name, created_at, updated_at FROM graphs WHERE slug = ?");

        stmt.bindText(1, slug);

        if (!stmt.step()) {
            return std::nullopt;
        }

        return GraphMetadata{
            .slug = stmt.getText(0),
            .name = stmt.getText(1),
            .createdAt = stmt.getText(2),
            .updatedAt = stmt.getText(3)
        };
    }

    std::vector<GraphMetadata> listGraphs() {
        Statement stmt(m_db,
            "SELECT slug, name, created_at, updated_at FROM graphs ORDER BY updated_at DESC, slug");

        std::vector<GraphMetadata> result;
        while (stmt.step()) {
            result.push_back({
                .slug = stmt.getText(0),
                .name = stmt.getText(1),
                .createdAt = stmt.getText(2),
                .updatedAt = stmt.getText(3)
            });
        }
        return result;
    }

    bool graphExists(const std::string& slug) {
        Statement stmt(m_db, "SELECT 1 FROM graphs WHERE slug = ?");
        stmt.bindText(1, slug);
        return stmt.step();
    }

    // === Version Management ===

    int64_t saveVersion(const std::string& slug,
                        const dag::GraphDocument& document,
                        const std::optional<std::string>& versionName) {
        if (!graphExists(slug)) {
            throw std::runtime_error("Graph not found: " + slug);
        }

        std::string graphJson = dag::GraphSerializer::toString(document, -1);
        std::string now = currentTimestamp();

        Statement stmt(m_db,
            "INSERT INTO graph_versions (graph_slug, version_name, graph_json, created_at) "
            "VALUES (?, ?, ?, ?)");

        stmt.bindText(1, slug);
        if (versionName) {
            stmt.bindText(2, *versionName);
        } else {
            stmt.bindNull(2);
        }
        stmt.bindText(3, graphJson);
        stmt.bindText(4, now);

        stmt.step();
        int64_t versionId = sqlite3_last_insert_rowid(m_db);

        // Update graph's updated_at
        Statement updateStmt(m_db, "UPDATE graphs SET updated_at = ? WHERE slug = ?");
        updateStmt.bindText(1, now);
        updateStmt.bindText(2, slug);
        updateStmt.step();

        return versionId;
    }

    // Newest first; ids break ties between versions saved in the same millisecond
    std::optional<GraphVersion> getLatestVersion(const std::string& slug) {
        Statement stmt(m_db,
            "SELECT id, graph_slug, version_name, graph_json, created_at "
            "FROM graph_versions WHERE graph_slug = ? "
            "ORDER BY id DESC LIMIT 1");

        stmt.bindText(1, slug);

        if (!stmt.step()) {
            return std::nullopt;
        }
        return readVersion(stmt);
    }

    std::vector<GraphVersion> listVersions(const std::string& slug) {
        Statement stmt(m_db,
            "SELECT id, graph_slug, version_name, graph_json, created_at "
            "FROM graph_versions WHERE graph_slug = ? "
            "ORDER BY id DESC");

        stmt.bindText(1, slug);

        std::vector<GraphVersion> result;
        while (stmt.step()) {
            result.push_back(readVersion(stmt));
        }
        return result;
    }

    dag::GraphDocument loadDocument(const std::string& slug) {
        auto version = getLatestVersion(slug);
        if (!version) {
            throw std::runtime_error("No version found for graph: " + slug);
        }
        return dag::GraphSerializer::fromString(version->graphJson);
    }

    const std::string& getDbPath() const { return m_dbPath; }

private:
    std::string m_dbPath;
    sqlite3* m_db;
};

// =============================================================================
// GraphStorage
// =============================================================================

GraphStorage::GraphStorage(const std::string& dbPath)
    : m_impl(std::make_unique<Impl>(dbPath))
{}

GraphStorage::~GraphStorage() = default;

GraphStorage::GraphStorage(GraphStorage&&) noexcept = default;
GraphStorage& GraphStorage::operator=(GraphStorage&&) noexcept = default;

void GraphStorage::createGraph(const GraphMetadata& metadata) {
    m_impl->createGraph(metadata);
}

void GraphStorage::deleteGraph(const std::string& slug) {
    m_impl->deleteGraph(slug);
}

std::optional<GraphMetadata> GraphStorage::getGraph(const std::string& slug) {
    return m_impl->getGraph(slug);
}

std::vector<GraphMetadata> GraphStorage::listGraphs() {
    return m_impl->listGraphs();
}

bool GraphStorage::graphExists(const std::string& slug) {
    return m_impl->graphExists(slug);
}

int64_t GraphStorage::saveVersion(const std::string& slug,
                                  const dag::GraphDocument& document,
                                  const std::optional<std::string>& versionName) {
    return m_impl->saveVersion(slug, document, versionName);
}

std::optional<GraphVersion> GraphStorage::getLatestVersion(const std::string& slug) {
    return m_impl->getLatestVersion(slug);
}

std::vector<GraphVersion> GraphStorage::listVersions(const std::string& slug) {
    return m_impl->listVersions(slug);
}

dag::GraphDocument GraphStorage::loadDocument(const std::string& slug) {
    return m_impl->loadDocument(slug);
}

const std::string& GraphStorage::getDbPath() const {
    return m_impl->getDbPath();
}

} // namespace storage
