#ifndef TASKLINE_STORAGE_CONNECTIONSCOPE_HPP
#define TASKLINE_STORAGE_CONNECTIONSCOPE_HPP

#include <QString>
#include <QtSql/QSqlDatabase>

#include "AppConfig.hpp"

// One database connection with an open transaction, alive for the duration
// of a single storage operation. Rolls back unless commit() succeeded, then
// closes and unregisters the connection. Throws PersistenceError when the
// connection or the transaction cannot be opened.
class ConnectionScope {
public:
    ConnectionScope(const QString &driver, const DatabaseConfig &config);
    ~ConnectionScope();

    ConnectionScope(const ConnectionScope &) = delete;
    ConnectionScope &operator=(const ConnectionScope &) = delete;

    QSqlDatabase &database() { return m_db; }

    void commit();

private:
    QString m_connectionName;
    QSqlDatabase m_db;
    bool m_committed = false;
};

#endif // TASKLINE_STORAGE_CONNECTIONSCOPE_HPP
