#pragma once

#include <libpq-fe.h>
#include <optional>
#include <string>
#include <vector>

namespace db {

struct DbResult {
    bool ok = false;
    std::string sqlstate;
    std::string message;
    std::vector<std::string> columns;
    std::vector<std::vector<std::optional<std::string>>> rows;
    int affected_rows = 0;
};

// One blocking libpq session. A dropped session is re-established and the statement retried once.
class PgConnection {
public:
    explicit PgConnection(std::string conninfo);
    ~PgConnection();

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    // false when the server cannot be reached
    bool connect();
    bool connected() const;

    // throws std::runtime_error when no connection can be made
    DbResult exec(const std::string& sql);
    DbResult exec_params(const std::string& sql, const std::vector<std::optional<std::string>>& params);

private:
    PGconn* connect_one();
    DbResult to_result(PGresult* pr);

    std::string conninfo_;
    PGconn* conn_ = nullptr;
};

}
