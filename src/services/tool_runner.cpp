module;
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>
#include <QStringList>
#include <QtGlobal>

module reel.services.tool_runner;

static constexpr int kStartTimeoutMs = 10000;
static constexpr int kPollIntervalMs = 200;
static constexpr int kKillWaitMs = 3000;

static QString executableName(const QString& name)
{
#if defined(Q_OS_WIN)
    if (!name.endsWith(QStringLiteral(".exe"), Qt::CaseInsensitive)) return name + QStringLiteral(".exe");
#endif
    return name;
}

static QString executableAt(const QString& path)
{
    QFileInfo info(path);
    if (info.exists() && info.isFile() && info.isExecutable()) return info.absoluteFilePath();
    return QString();
}

QString locateTool(const QString& name, const QString& configuredPath)
{
    const QString configured = configuredPath.trimmed();
    if (!configured.isEmpty()) {
        if (configured.contains('/') || configured.contains('\\')) {
            const QString found = executableAt(configured);
            if (!found.isEmpty()) {
                qInfo().noquote() << QStringLiteral("Setting %1 path to: %2").arg(name, found);
                return found;
            }
            qWarning() << "Configured" << name << "path is not executable:" << configured;
        } else {
            const QString found = QStandardPaths::findExecutable(configured);
            if (!found.isEmpty()) {
                qInfo().noquote() << QStringLiteral("Setting %1 path to: %2").arg(name, found);
                return found;
            }
            qWarning() << "Configured" << name << "program not found on PATH:" << configured;
        }
    }

    const QString onPath = QStandardPaths::findExecutable(name);
    if (!onPath.isEmpty()) {
        qInfo().noquote() << QStringLiteral("Setting %1 path to: %2").arg(name, onPath);
        return onPath;
    }

    QStringList bases;
    if (QCoreApplication::instance()) bases << QCoreApplication::applicationDirPath();
    bases << QDir::currentPath();
    for (const QString& base : bases) {
        const QString found = executableAt(QDir(base).filePath(executableName(name)));
        if (!found.isEmpty()) {
            qInfo().noquote() << QStringLiteral("Setting %1 path to: %2").arg(name, found);
            return found;
        }
    }

    qWarning().noquote() << QStringLiteral("%1 is not found! Please install %1.").arg(name);
    return QString();
}

QString ToolResult::failureReason() const
{
    if (!started) {
        return errorString.isEmpty() ? QStringLiteral("Process could not be started") : errorString;
    }
    if (canceled) return QStringLiteral("Canceled");
    if (timedOut) return QStringLiteral("Timed out");
    const QStringList lines = errorOutput.split('\n', Qt::SkipEmptyParts);
    for (auto it = lines.crbegin(); it != lines.crend(); ++it) {
        const QString line = it->trimmed();
        if (!line.isEmpty()) return line;
    }
    if (exitStatus == QProcess::CrashExit) return QStringLiteral("Process crashed");
    return QStringLiteral("Process exited with code %1").arg(exitCode);
}

ToolResult runTool(const QString& program,
                   const QStringList& arguments,
                   const LineHandler& onLine,
                   const CancelCheck& isCanceled,
                   int timeoutMs)
{
    ToolResult result;
    if (program.isEmpty()) {
        result.errorString = QStringLiteral("No program given");
        return result;
    }

    QProcess proc;
    proc.setProgram(program);
    proc.setArguments(arguments);
    proc.setProcessChannelMode(QProcess::SeparateChannels);
    qDebug() << "Running" << program << arguments;
    proc.start(QIODevice::ReadOnly);
    if (!proc.waitForStarted(kStartTimeoutMs)) {
        result.errorString = proc.errorString();
        qWarning() << "Cannot start" << program << ":" << result.errorString;
        return result;
    }
    result.started = true;

    QByteArray pending;
    auto drainStdout = [&]() {
        const QByteArray chunk = proc.readAllStandardOutput();
        if (chunk.isEmpty()) return;
        if (!onLine) {
            result.standardOutput.append(chunk);
            return;
        }
        pending.append(chunk);
        qsizetype newline = pending.indexOf('\n');
        while (newline >= 0) {
            QByteArray line = pending.left(newline);
            pending.remove(0, newline + 1);
            if (line.endsWith('\r')) line.chop(1);
            onLine(QString::fromUtf8(line));
            newline = pending.indexOf('\n');
        }
    };
    auto killProcess = [&]() {
        proc.kill();
        proc.waitForFinished(kKillWaitMs);
    };

    QElapsedTimer timer;
    timer.start();
    while (proc.state() != QProcess::NotRunning) {
        if (isCanceled && isCanceled()) {
            qDebug() << "Cancel requested for" << program;
            killProcess();
            result.canceled = true;
            result.errorOutput = QString::fromUtf8(proc.readAllStandardError());
            return result;
        }
        if (timeoutMs > 0 && timer.hasExpired(timeoutMs)) {
            qWarning() << program << "timed out after" << timeoutMs << "ms";
            killProcess();
            result.timedOut = true;
            result.errorOutput = QString::fromUtf8(proc.readAllStandardError());
            return result;
        }
        proc.waitForReadyRead(kPollIntervalMs);
        drainStdout();
    }
    proc.waitForFinished(kKillWaitMs);
    drainStdout();
    if (onLine && !pending.isEmpty()) {
        if (pending.endsWith('\r')) pending.chop(1);
        onLine(QString::fromUtf8(pending));
    }

    result.errorOutput = QString::fromUtf8(proc.readAllStandardError());
    result.exitStatus = proc.exitStatus();
    result.exitCode = proc.exitCode();
    if (!result.succeeded()) {
        qWarning() << program << "failed:" << result.failureReason();
    }
    return result;
}
