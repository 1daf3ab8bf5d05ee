#include <QCoreApplication>
#include "adberror.h"
#include "adblogging.h"
#include "clioptions.h"
#include "fastboot.h"
#include <stdio.h>

static const char usage[] =
    "usage: fastboot-direct [options] <command> [args...]\n"
    "\n"
    "commands:\n"
    "  devices                       list devices in fastboot mode\n"
    "  getvar <variable>             print a bootloader variable\n"
    "  download <file>               send a file to the bootloader\n"
    "  flash <partition> <file>      write a file to a partition\n"
    "  erase <partition>             erase a partition\n"
    "  oem <command...>              run a vendor specific command\n"
    "  continue                      leave the bootloader and boot\n"
    "  reboot [target]               reboot, optionally into another mode\n"
    "  reboot-bootloader             reboot into the bootloader again\n"
    "  help                          show this text\n";

static void printInfo(const FastbootMessage& message)
{
    if (message.header == "INFO" && !message.message.isEmpty()) {
        fprintf(stderr, "(bootloader) %s\n", qPrintable(message.message));
    }
}

static void needArgs(const QStringList& args, int minimum, int maximum, const char* command)
{
    if (args.size() < minimum || (maximum >= 0 && args.size() > maximum)) {
        usageError(QString("wrong number of arguments for '%1'").arg(command));
    }
}

static void printResult(const QString& result)
{
    if (!result.isEmpty()) {
        printf("%s\n", qPrintable(result));
    }
}

int main(int argc, char *argv[])
{
    QCoreApplication a(argc, argv);
    QCoreApplication::setApplicationName("fastboot-direct");

    QCommandLineParser parser;
    parser.setApplicationDescription("Talks to a device's bootloader over USB.");
    QCommandLineOption help(QStringList() << "h" << "help", "Show this text.");
    parser.addOption(help);
    DeviceOptions device;
    device.addTo(&parser);
    QCommandLineOption chunkKb("chunk-kb", "Size of each transfer while downloading; "
                               "some older bootloaders need 4.", "kb", "1024");
    parser.addOption(chunkKb);
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
    int timeoutMs = device.timeoutFrom(parser);
    int chunk = intOption(parser, chunkKb, 1);

    QString cmd = args.takeFirst();
    if (cmd == "getvar" || cmd == "erase") {
        needArgs(args, 1, 1, qPrintable(cmd));
    } else if (cmd == "download") {
        needArgs(args, 1, 1, "download");
    } else if (cmd == "flash") {
        needArgs(args, 2, 2, "flash");
    } else if (cmd == "oem") {
        needArgs(args, 1, -1, "oem");
    } else if (cmd == "reboot") {
        needArgs(args, 0, 1, "reboot");
    } else if (cmd == "devices" || cmd == "continue" || cmd == "reboot-bootloader") {
        needArgs(args, 0, 0, qPrintable(cmd));
    } else {
        usageError(QString("unknown command '%1'").arg(cmd));
    }

    try {
        if (cmd == "devices") {
            foreach(const UsbDeviceInfo& d, FastbootCommands::devices()) {
                printf("%s\tfastboot\n", qPrintable(d.serial));
            }
            return 0;
        }

        std::unique_ptr<FastbootCommands> fastboot =
            FastbootCommands::connectDevice(device.serialFrom(parser), parser.value(device.portPath),
                                            timeoutMs, chunk);
        fastboot->setInfoCallback(printInfo);

        if (cmd == "getvar") {
            printf("%s: %s\n", qPrintable(args[0]), qPrintable(fastboot->getvar(args[0])));
        } else if (cmd == "download") {
            printResult(fastboot->download(args[0]));
        } else if (cmd == "flash") {
            printResult(fastboot->flashFromFile(args[0], args[1]));
        } else if (cmd == "erase") {
            printResult(fastboot->erase(args[0]));
        } else if (cmd == "oem") {
            printResult(fastboot->oem(args.join(" ")));
        } else if (cmd == "continue") {
            printResult(fastboot->continueBoot());
        } else if (cmd == "reboot") {
            printResult(fastboot->reboot(args.value(0)));
        } else if (cmd == "reboot-bootloader") {
            printResult(fastboot->rebootBootloader());
        }
        return 0;
    } catch (const AdbError& e) {
        return reportError(e);
    }
}
