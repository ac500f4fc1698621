#ifdef LANDGEM_HAS_SQLITE3

#include "io/SqliteWriter.h"
#include <sqlite3.h>
#include <sstream>
#include <stdexcept>

namespace landgem {

struct SqliteWriter::Impl {
    sqlite3* db = nullptr;
    sqlite3_stmt* stmtMeta = nullptr;
    sqlite3_stmt* stmtEmissions = nullptr;
    sqlite3_stmt* stmtStream = nullptr;
    bool inTransaction = false;

    ~Impl() {
        if (stmtMeta) sqlite3_finalize(stmtMeta);
        if (stmtEmissions) sqlite3_finalize(stmtEmissions);
        if (stmtStream) sqlite3_finalize(stmtStream);
        if (db) {
            if (inTransaction) sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
            sqlite3_close(db);
        }
    }

    void exec(const char* sql, const char* what) {
        char* errMsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            std::string err = errMsg ? errMsg : "unknown error";
            sqlite3_free(errMsg);
            throw std::runtime_error(std::string("SqliteWriter: ") + what + " failed: " + err);
        }
    }

    sqlite3_stmt* prepare(const char* sql) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("SqliteWriter: prepare failed: ") + sqlite3_errmsg(db));
        }
        return stmt;
    }

    void step(sqlite3_stmt* stmt) {
        int rc = sqlite3_step(stmt);
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        if (rc != SQLITE_DONE) {
            throw std::runtime_error(std::string("SqliteWriter: insert failed: ") + sqlite3_errmsg(db));
        }
    }
};

SqliteWriter::SqliteWriter(const std::string& filename)
    : impl_(std::make_unique<Impl>())
{
    int rc = sqlite3_open(filename.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("SqliteWriter: cannot open database: " + filename);
    }

    impl_->exec(
        "CREATE TABLE IF NOT EXISTS metadata ("
        "  key TEXT PRIMARY KEY, value TEXT);"
        "CREATE TABLE IF NOT EXISTS emissions ("
        "  year INTEGER, ch4 REAL, total_gas REAL, co2 REAL,"
        "  ch4_collected REAL, gas_collected REAL, nmoc REAL,"
        "  cumulative_ch4 REAL, cumulative_total_gas REAL);"
        "CREATE TABLE IF NOT EXISTS stream_emissions ("
        "  year INTEGER, stream TEXT, ch4 REAL);",
        "table creation");

    impl_->stmtMeta = impl_->prepare("INSERT OR REPLACE INTO metadata VALUES(?,?);");
    impl_->stmtEmissions = impl_->prepare("INSERT INTO emissions VALUES(?,?,?,?,?,?,?,?,?);");
    impl_->stmtStream = impl_->prepare("INSERT INTO stream_emissions VALUES(?,?,?);");

    impl_->exec("BEGIN TRANSACTION;", "begin");
    impl_->inTransaction = true;
}

SqliteWriter::~SqliteWriter() = default;

void SqliteWriter::writeMetadata(const std::string& key, const std::string& value) {
    sqlite3_bind_text(impl_->stmtMeta, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(impl_->stmtMeta, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    impl_->step(impl_->stmtMeta);
}

static std::string num(double v) {
    std::ostringstream oss;
    oss.precision(10);
    oss << v;
    return oss.str();
}

void SqliteWriter::writeModel(const SingleStreamModel& model) {
    writeMetadata("k", num(model.k()));
    writeMetadata("L0", num(model.L0()));
    writeMetadata("methane_content", num(model.methaneContent()));
    if (model.nmocConcentration()) {
        writeMetadata("nmoc_concentration", num(*model.nmocConcentration()));
    }
}

void SqliteWriter::writeModel(const MultiStreamModel& model) {
    writeMetadata("k", num(model.k()));
    writeMetadata("methane_content", num(model.compositionParameters().methaneContent));
    if (model.compositionParameters().nmocConcentration) {
        writeMetadata("nmoc_concentration", num(*model.compositionParameters().nmocConcentration));
    }
    for (const auto& name : model.streamNames()) {
        writeMetadata("stream." + name + ".L0", num(model.getStream(name).L0()));
    }
}

void SqliteWriter::writeSeries(const EmissionsSeries& series) {
    sqlite3_stmt* st = impl_->stmtEmissions;
    for (const auto& row : series.rows()) {
        const auto& e = row.emissions;
        sqlite3_bind_int(st, 1, row.year);
        sqlite3_bind_double(st, 2, e.ch4);
        sqlite3_bind_double(st, 3, e.totalGas);
        sqlite3_bind_double(st, 4, e.co2);
        if (series.hasCollection()) {
            sqlite3_bind_double(st, 5, e.ch4Collected);
            sqlite3_bind_double(st, 6, e.gasCollected);
        }
        if (e.nmoc) sqlite3_bind_double(st, 7, *e.nmoc);
        sqlite3_bind_double(st, 8, row.cumulativeCh4);
        sqlite3_bind_double(st, 9, row.cumulativeGas);
        impl_->step(st);  // unbound columns are stored as NULL
    }
}

void SqliteWriter::writeMultiStreamTable(const MultiStreamTable& table) {
    for (const auto& row : table.rows) {
        sqlite3_stmt* st = impl_->stmtEmissions;
        sqlite3_bind_int(st, 1, row.year);
        sqlite3_bind_double(st, 2, row.ch4);
        sqlite3_bind_double(st, 3, row.totalGas);
        sqlite3_bind_double(st, 4, row.co2);
        sqlite3_bind_double(st, 8, row.cumulativeCh4);
        impl_->step(st);

        for (const auto& [name, ch4] : row.streamCh4) {
            sqlite3_bind_int(impl_->stmtStream, 1, row.year);
            sqlite3_bind_text(impl_->stmtStream, 2, name.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(impl_->stmtStream, 3, ch4);
            impl_->step(impl_->stmtStream);
        }
    }
}

void SqliteWriter::finalize() {
    if (!impl_->inTransaction) return;
    impl_->exec("COMMIT;", "commit");
    impl_->inTransaction = false;
}

} // namespace landgem

#endif // LANDGEM_HAS_SQLITE3
