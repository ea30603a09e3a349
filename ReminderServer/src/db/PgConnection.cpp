#include "PgConnection.h"
#include "../observability/Logging.h"
#include <cstdlib>
#include <memory>
#include <stdexcept>

namespace db {

PgConnection::PgConnection(std::string conninfo) : conninfo_(std::move(conninfo)) {}

PgConnection::~PgConnection() {
    if (conn_) PQfinish(conn_);
}

PGconn* PgConnection::connect_one() {
    PGconn* c = PQconnectdb(conninfo_.c_str());
    if (c == nullptr) return nullptr;
    if (PQstatus(c) != CONNECTION_OK) {
        observability::log_warn("db.connect_failed", {{"err", std::string(PQerrorMessage(c))}});
        PQfinish(c);
        return nullptr;
    }
    return c;
}

bool PgConnection::connect() {
    if (conn_ && PQstatus(conn_) == CONNECTION_OK) return true;
    if (conn_) { PQfinish(conn_); conn_ = nullptr; }
    conn_ = connect_one();
    return conn_ != nullptr;
}

bool PgConnection::connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

DbResult PgConnection::to_result(PGresult* raw) {
    std::unique_ptr<PGresult, decltype(&PQclear)> pr(raw, &PQclear);
    DbResult r;
    ExecStatusType st = PQresultStatus(pr.get());
    r.ok = (st == PGRES_TUPLES_OK || st == PGRES_COMMAND_OK);
    const char* ss = PQresultErrorField(pr.get(), PG_DIAG_SQLSTATE);
    r.sqlstate = ss ? ss : std::string();
    const char* msg = PQresultErrorMessage(pr.get());
    r.message = msg ? msg : std::string();
    int nfields = PQnfields(pr.get());
    for (int i = 0; i < nfields; ++i) r.columns.emplace_back(PQfname(pr.get(), i) ? PQfname(pr.get(), i) : "");
    int ntuples = PQntuples(pr.get());
    r.rows.reserve(ntuples);
    for (int i = 0; i < ntuples; ++i) {
        std::vector<std::optional<std::string>> row; row.reserve(nfields);
        for (int j = 0; j < nfields; ++j) {
            if (PQgetisnull(pr.get(), i, j)) row.emplace_back(std::nullopt);
            else row.emplace_back(std::string(PQgetvalue(pr.get(), i, j)));
        }
        r.rows.emplace_back(std::move(row));
    }
    if (st == PGRES_COMMAND_OK) {
        char* ct = PQcmdTuples(pr.get());
        r.affected_rows = ct ? atoi(ct) : 0;
    } else {
        r.affected_rows = ntuples;
    }
    if (!r.ok) {
        observability::log_warn("db.exec_result_non_ok", {{"status", std::string(PQresStatus(st))}, {"sqlstate", r.sqlstate}, {"msg", r.message}});
    }
    return r;
}

DbResult PgConnection::exec(const std::string& sql) {
    return exec_params(sql, {});
}

DbResult PgConnection::exec_params(const std::string& sql, const std::vector<std::optional<std::string>>& params) {
    std::vector<const char*> cparams; cparams.reserve(params.size());
    for (const auto& p : params) cparams.push_back(p.has_value() ? p->c_str() : nullptr);

    for (int attempt = 0; attempt < 2; ++attempt) {
        if (!connect()) break;
        PGresult* r = PQexecParams(conn_, sql.c_str(), int(cparams.size()), nullptr, cparams.data(), nullptr, nullptr, 0);
        if (r) return to_result(r);
        // null result with a dead session: reconnect and retry once
        bool lost = PQstatus(conn_) != CONNECTION_OK;
        observability::log_warn("db.exec_null", {{"err", std::string(PQerrorMessage(conn_))}, {"attempt", int64_t(attempt)}});
        PQfinish(conn_); conn_ = nullptr;
        if (!lost) break;
    }
    throw std::runtime_error("database unreachable");
}

}
