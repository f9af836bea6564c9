#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>
#include <QString>
#include <QTextStream>
#include <memory>
#include <optional>

#include "version.h"

#include "vical/core/AppContext.hpp"
#include "vical/core/Logging.hpp"
#include "vical/core/ModalInterpreter.hpp"
#include "vical/core/Settings.hpp"
#include "vical/ui/TerminalView.hpp"

namespace {
std::unique_ptr<QFile> logFile;

// The terminal belongs to curses while the session runs, so messages go to a file.
void writeLogMessage(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    if (!logFile || !logFile->isOpen()) {
        return;
    }
    QTextStream stream(logFile.get());
    stream << qFormatLogMessage(type, context, message) << '\n';
    stream.flush();
}

void openLogFile(const QString &storeFilePath)
{
    const QFileInfo storeInfo(storeFilePath);
    QDir().mkpath(storeInfo.absolutePath());
    logFile = std::make_unique<QFile>(storeInfo.absoluteDir().filePath(QStringLiteral("vical.log")));
    if (!logFile->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        QTextStream(stderr) << "Cannot open log file " << logFile->fileName() << ": "
                            << logFile->errorString() << '\n';
        logFile.reset();
        return;
    }
    qSetMessagePattern(QStringLiteral("%{time yyyy-MM-dd hh:mm:ss.zzz} %{type} %{category}: %{message}"));
    qInstallMessageHandler(writeLogMessage);
}

void closeLogFile()
{
    qInstallMessageHandler(nullptr);
    logFile.reset();
}
} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("vical"));
    QCoreApplication::setApplicationName(QStringLiteral("vical"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kVicalVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Modal terminal calendar with tasks"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption fileOption(QStringList{ QStringLiteral("f"), QStringLiteral("file") },
                                        QStringLiteral("Use <path> as the calendar store."),
                                        QStringLiteral("path"));
    parser.addOption(fileOption);
    parser.process(app);

    QSettings qsettings;
    vical::core::Settings settings = vical::core::Settings::fromQSettings(qsettings);
    if (qsettings.allKeys().isEmpty()) {
        settings.writeTo(qsettings);
    }
    if (parser.isSet(fileOption)) {
        settings.storeFile = parser.value(fileOption);
    }

    vical::core::AppContext context(settings);
    openLogFile(context.storeFilePath());
    qCInfo(lcApp) << "vical" << kVicalVersion << "using" << context.storeFilePath();

    QString loadError;
    const vical::data::LoadStatus status = context.loadModel(&loadError);
    if (status == vical::data::LoadStatus::Corrupt) {
        qCCritical(lcApp).noquote() << "Refusing to start:" << loadError;
        QTextStream(stderr) << "vical: " << loadError << '\n';
        closeLogFile();
        return 1;
    }

    vical::core::ModalInterpreter interpreter(context.model(), context.calendarStore(), context.undoStack(),
                                              context.settings());
    if (status == vical::data::LoadStatus::NotFound) {
        interpreter.flush();
    }

    {
        vical::ui::TerminalView view(settings.dimCompleted);
        view.render(interpreter.snapshot());
        while (!interpreter.shutdownRequested()) {
            const std::optional<vical::input::Key> key = view.readKey();
            if (!key) {
                interpreter.inputClosed();
                break;
            }
            interpreter.feed(*key);
            view.render(interpreter.snapshot());
        }
    }

    qCInfo(lcApp) << "Session ended with exit code" << interpreter.exitCode();
    closeLogFile();
    return interpreter.exitCode();
}
