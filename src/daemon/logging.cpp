#include "daemon/logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>

#include <cstdio>

namespace lantern::daemon {
namespace {

class FileLog {
public:
    void write(const QByteArray& bytes) {
        QMutexLocker lock(&mu_);
        if (!opened_) open();

        if (file_.isOpen()) {
            if (file_.size() >= kMaxLogFileBytes) {
                file_.close();
                rotate_if_needed(file_.fileName(), kMaxLogFileBytes);
                open();
            }
            if (file_.isOpen()) {
                file_.write(bytes);
                file_.flush();
            }
        }

        std::fwrite(bytes.constData(), 1, static_cast<size_t>(bytes.size()), stderr);
        std::fflush(stderr);
    }

private:
    void open() {
        opened_ = true;
        const auto path = default_log_file_path();
        if (path.isEmpty()) return;

        QDir().mkpath(QFileInfo(path).absolutePath());
        file_.setFileName(path);
        if (!file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            std::fprintf(stderr, "lanternd: cannot open log file %s: %s\n",
                         qPrintable(path), qPrintable(file_.errorString()));
        }
    }

    QMutex mu_;
    QFile file_;
    bool opened_ = false;
};

FileLog& file_log() {
    static FileLog log;
    return log;
}

void handle_message(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    const auto category = ctx.category ? QString::fromLatin1(ctx.category) : QString();
    file_log().write(format_log_line(type, category, msg, QDateTime::currentDateTimeUtc()).toUtf8());
}

} // namespace

QString format_log_line(QtMsgType type,
                        const QString& category,
                        const QString& message,
                        const QDateTime& when) {
    QChar level = QLatin1Char('?');
    switch (type) {
        case QtDebugMsg: level = QLatin1Char('D'); break;
        case QtInfoMsg: level = QLatin1Char('I'); break;
        case QtWarningMsg: level = QLatin1Char('W'); break;
        case QtCriticalMsg: level = QLatin1Char('C'); break;
        case QtFatalMsg: level = QLatin1Char('F'); break;
    }
    return QStringLiteral("%1 %2 %3 %4\n")
        .arg(when.toUTC().toString(Qt::ISODateWithMs), QString(level), category, message);
}

bool rotate_if_needed(const QString& path, qint64 max_bytes) {
    const QFileInfo info(path);
    if (!info.exists() || info.size() < max_bytes) return false;

    const auto backup = path + QStringLiteral(".1");
    QFile::remove(backup);
    return QFile::rename(path, backup);
}

void install_file_logging() {
    qInstallMessageHandler(handle_message);
}

QString default_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) return {};
    return QDir(base).filePath(QStringLiteral("logs/lantern.log"));
}

} // namespace lantern::daemon
