#include <QCoreApplication>
#include "adbclient.h"
#include "adberror.h"
#include "adblogging.h"
#include "clioptions.h"
#include "rsasigner.h"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <stdio.h>
#include <vector>

static const char usage[] =
    "usage: adb-direct [options] <command> [args...]\n"
    "\n"
    "commands:\n"
    "  devices [--output-port-path]  list attached devices\n"
    "  shell <command...>            run a shell command and print its output\n"
    "  push <local> <remote>         copy a file or directory to the device\n"
    "  pull <remote> [local]         copy a file from the device (stdout without local)\n"
    "  ls <path>                     list a directory on the device\n"
    "  stat <path>                   print mode, size and mtime of a remote path\n"
    "  install <apk>                 push and install a package\n"
    "  uninstall [-k] <package>      remove a package, -k keeps its data\n"
    "  logcat [options...]           stream the device log\n"
    "  reboot [target]               reboot, optionally into bootloader or recovery\n"
    "  reboot-bootloader             reboot into the bootloader\n"
    "  remount                       remount system partitions read-write\n"
    "  root                          restart adbd with root permissions\n"
    "  help                          show this text\n";

static void writeOut(const QByteArray& data)
{
    fwrite(data.constData(), 1, data.size(), stdout);
    fflush(stdout);
}

static QString modeString(quint32 mode)
{
    QString s;
    s += S_ISDIR(mode) ? 'd' : (S_ISLNK(mode) ? 'l' : '-');
    const char* rwx = "rwxrwxrwx";
    for (int i = 0; i < 9; i++) {
        s += (mode & (0400 >> i)) ? QChar(rwx[i]) : QChar('-');
    }
    return s;
}

static QString timeString(quint32 mtime)
{
    return QDateTime::fromTime_t(mtime).toUTC().toString("yyyy-MM-dd hh:mm:ss");
}

static void needArgs(const QStringList& args, int minimum, int maximum, const char* command)
{
    if (args.size() < minimum || (maximum >= 0 && args.size() > maximum)) {
        usageError(QString("wrong number of arguments for '%1'").arg(command));
    }
}

static int doDevices(const QStringList& args)
{
    bool portPaths = args.contains("--output-port-path");
    foreach(const UsbDeviceInfo& d, AdbClient::devices()) {
        if (portPaths) {
            printf("%s\tdevice\t%s\n", qPrintable(d.serial), qPrintable(d.portPath));
        } else {
            printf("%s\tdevice\n", qPrintable(d.serial));
        }
    }
    return 0;
}

static int doList(AdbClient& adb, const QString& path)
{
    QList<SyncDirEntry> entries = adb.list(path);
    int sizeWidth = 1;
    foreach(const SyncDirEntry& e, entries) {
        sizeWidth = qMax(sizeWidth, QString::number(e.size).size());
    }
    foreach(const SyncDirEntry& e, entries) {
        printf("%s %*u %s %s\n", qPrintable(modeString(e.mode)), sizeWidth, e.size,
               qPrintable(timeString(e.mtime)), qPrintable(e.name));
    }
    return 0;
}

static int runCommand(AdbClient& adb, const QString& cmd, QStringList args)
{
    if (cmd == "shell") {
        needArgs(args, 1, -1, "shell");
        adb.streamingShell(args.join(" "), writeOut);
    } else if (cmd == "push") {
        needArgs(args, 2, 2, "push");
        adb.push(args[0], args[1]);
    } else if (cmd == "pull") {
        needArgs(args, 1, 2, "pull");
        if (args.size() == 2) {
            adb.pull(args[0], args[1]);
        } else {
            writeOut(adb.pull(args[0]));
        }
    } else if (cmd == "ls") {
        needArgs(args, 1, 1, "ls");
        return doList(adb, args[0]);
    } else if (cmd == "stat") {
        needArgs(args, 1, 1, "stat");
        SyncStat st = adb.stat(args[0]);
        printf("%s %u %s %s\n", qPrintable(modeString(st.mode)), st.size,
               qPrintable(timeString(st.mtime)), qPrintable(args[0]));
    } else if (cmd == "install") {
        needArgs(args, 1, 1, "install");
        writeOut(adb.install(args[0]).toUtf8());
    } else if (cmd == "uninstall") {
        bool keepData = args.removeAll("-k") > 0;
        needArgs(args, 1, 1, "uninstall");
        writeOut(adb.uninstall(args[0], keepData).toUtf8());
    } else if (cmd == "logcat") {
        adb.logcat(args.join(" "), writeOut);
    } else if (cmd == "reboot") {
        needArgs(args, 0, 1, "reboot");
        adb.reboot(args.value(0));
    } else if (cmd == "reboot-bootloader") {
        needArgs(args, 0, 0, "reboot-bootloader");
        adb.rebootBootloader();
    } else if (cmd == "remount") {
        needArgs(args, 0, 0, "remount");
        writeOut(adb.remount().toUtf8());
    } else if (cmd == "root") {
        needArgs(args, 0, 0, "root");
        writeOut(adb.root().toUtf8());
    } else {
        usageError(QString("unknown command '%1'").arg(cmd));
    }
    return 0;
}

int main(int argc, char *argv[])
{
    QCoreApplication a(argc, argv);
    QCoreApplication::setApplicationName("adb-direct");

    QCommandLineParser parser;
    parser.setApplicationDescription("Talks to adbd on a device directly, without an adb server.");
    QCommandLineOption help(QStringList() << "h" << "help", "Show this text.");
    parser.addOption(help);
    DeviceOptions device;
    device.addTo(&parser);
    QCommandLineOption maxPayload("max-payload", "Largest message payload to offer the device.",
                                  "bytes", QString::number(MAX_PAYLOAD_V1));
    QCommandLineOption keyPath("rsa-key-path", "Private key to authenticate with; may be repeated. "
                               "Defaults to ~/.android/adbkey.", "path");
    QCommandLineOption authTimeout("auth-timeout-s", "How long to wait for the user to accept a new key.",
                                   "seconds", "60");
    parser.addOption(maxPayload);
    parser.addOption(keyPath);
    parser.addOption(authTimeout);
    parser.addPositionalArgument("command", "Command to run, see 'help'.");

    parseCommandLine(&parser, a.arguments());

    QStringList args = parser.positionalArguments();
    if (parser.isSet(help) || (!args.isEmpty() && args[0] == "help")) {
        printf("%s\n%s", qPrintable(parser.helpText()), usage);
        return 0;
    }
    if (args.isEmpty()) {
        fputs(usage, stderr);
        return EXIT_USAGE;
    }

    setAdbVerboseLogging(parser.isSet(device.verbose));

    ConnectionOptions options;
    options.timeoutMs = device.timeoutFrom(parser);
    options.authTimeoutMs = intOption(parser, authTimeout, 0) * 1000;
    options.maxPayload = intOption(parser, maxPayload, 1);
    if (options.maxPayload > MAX_PAYLOAD) {
        usageError(QString("--max-payload may not exceed %1").arg(MAX_PAYLOAD));
    }

    QString cmd = args.takeFirst();
    static const QStringList commands = QStringList() << "devices" << "shell" << "push" << "pull"
        << "ls" << "stat" << "install" << "uninstall" << "logcat" << "reboot"
        << "reboot-bootloader" << "remount" << "root";
    if (!commands.contains(cmd)) {
        usageError(QString("unknown command '%1'").arg(cmd));
    }

    try {
        if (cmd == "devices") {
            return doDevices(args);
        }

        QStringList keyPaths = parser.values(keyPath);
        if (keyPaths.isEmpty()) {
            QString defaultKey = QDir::home().filePath(".android/adbkey");
            if (QFileInfo(defaultKey).exists()) {
                keyPaths << defaultKey;
            }
        }
        std::vector<std::unique_ptr<RsaKeySigner> > keys;
        QList<AuthSigner*> signers;
        foreach(const QString& path, keyPaths) {
            keys.push_back(RsaKeySigner::fromKeyFile(path));
            signers << keys.back().get();
        }

        std::unique_ptr<AdbConnection> connection =
            AdbClient::connectDevice(device.serialFrom(parser), parser.value(device.portPath), options, signers);
        AdbClient adb(connection.get());
        return runCommand(adb, cmd, args);
    } catch (const AdbError& e) {
        return reportError(e);
    }
}
