#include <QtCore/QFile>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QTextStream>

#include <cstdio>
#include <memory>

#include "Logger.hpp"

Q_LOGGING_CATEGORY(appCore, "taskline.core")
Q_LOGGING_CATEGORY(appSql,  "taskline.sql")
Q_LOGGING_CATEGORY(appFile, "taskline.file")
Q_LOGGING_CATEGORY(appUi,   "taskline.ui")

namespace {

struct LogSink {
    std::unique_ptr<QFile> file;
    std::unique_ptr<QTextStream> stream;
    bool echoToStderr = false;

    ~LogSink() { reset(); }

    // the stream flushes into the file on destruction, so it goes first
    void reset() {
        stream.reset();
        file.reset();
        echoToStderr = false;
    }
};

QMutex g_sinkMutex;
LogSink g_sink;

void writeLine(QtMsgType type, const QMessageLogContext &ctx, const QString &msg) {
    const QString line = qFormatLogMessage(type, ctx, msg);

    QMutexLocker lock(&g_sinkMutex);
    if (g_sink.stream) {
        *g_sink.stream << line << '\n';
        g_sink.stream->flush();
    }

    // without a file nothing else would record the message
    if (g_sink.echoToStderr || !g_sink.stream || type >= QtCriticalMsg) {
        fprintf(stderr, "%s\n", line.toLocal8Bit().constData());
    }
}

} // END NAMESPACE

void initLogging(const QString &filePath, bool echoToStderr) {
    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss} %{type} [%{category}] %{message}");

    QString openError;
    {
        QMutexLocker lock(&g_sinkMutex);
        g_sink.reset();
        g_sink.echoToStderr = echoToStderr;

        if (!filePath.isEmpty()) {
            auto file = std::make_unique<QFile>(filePath);
            if (file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                g_sink.stream = std::make_unique<QTextStream>(file.get());
                g_sink.file = std::move(file);
            } else {
                openError = file->errorString();
            }
        }
    }

    qInstallMessageHandler(writeLine);

    if (!openError.isEmpty()) {
        qWarning(appCore) << "Cannot open log file" << filePath << ":" << openError
                          << "- logging to stderr";
    }
    qInfo(appCore) << "Logging to" << (filePath.isEmpty() || !openError.isEmpty()
                                           ? QStringLiteral("stderr")
                                           : filePath);
}

void shutdownLogging() {
    qInstallMessageHandler(nullptr);

    QMutexLocker lock(&g_sinkMutex);
    g_sink.reset();
}
