#include "ConnectionScope.hpp"

#include <QUuid>
#include <QtSql/QSqlError>

#include "ErrorHandler.hpp"
#include "Logger.hpp"

ConnectionScope::ConnectionScope(const QString &driver, const DatabaseConfig &config)
    : m_connectionName(QStringLiteral("taskline-%1")
                           .arg(QUuid::createUuid().toString(QUuid::WithoutBraces))) {
    m_db = QSqlDatabase::addDatabase(driver, m_connectionName);
    m_db.setHostName(config.host);
    m_db.setPort(config.port);
    m_db.setDatabaseName(config.name);
    m_db.setUserName(config.user);
    m_db.setPassword(config.password);

    if (!m_db.open()) {
        const QString cause = m_db.lastError().text();
        qCritical(appSql) << "Failed to open database:" << cause;
        m_db = QSqlDatabase();
        QSqlDatabase::removeDatabase(m_connectionName);
        throw PersistenceError(QStringLiteral("Database connection failed"), cause);
    }

    if (!m_db.transaction()) {
        const QString cause = m_db.lastError().text();
        qCritical(appSql) << "tx begin:" << cause;
        m_db.close();
        m_db = QSqlDatabase();
        QSqlDatabase::removeDatabase(m_connectionName);
        throw PersistenceError(QStringLiteral("Failed to begin transaction"), cause);
    }
}

ConnectionScope::~ConnectionScope() {
    if (!m_committed && !m_db.rollback()) {
        qWarning(appSql) << "tx rollback:" << m_db.lastError().text();
    }

    m_db.close();
    // the handle must be released before the connection is removed
    m_db = QSqlDatabase();
    QSqlDatabase::removeDatabase(m_connectionName);
}

void ConnectionScope::commit() {
    if (!m_db.commit()) {
        const QString cause = m_db.lastError().text();
        qCritical(appSql) << "tx commit:" << cause;
        throw PersistenceError(QStringLiteral("Failed to commit transaction"), cause);
    }
    m_committed = true;
}
