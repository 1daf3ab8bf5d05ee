#include "clioptions.h"
#include "adberror.h"
#include <QCoreApplication>
#include <stdio.h>
#include <stdlib.h>

DeviceOptions::DeviceOptions()
    : serial(QStringList() << "s" << "serial",
             "Serial number of the USB device, or host[:port] for TCP. "
             "Defaults to $ANDROID_SERIAL.", "serial"),
      portPath("port-path", "USB bus-port path of the device, e.g. 1-4.2.", "path"),
      timeoutMs("timeout-ms", "Timeout of every blocking operation.", "ms", "10000"),
      verbose("verbose", "Log protocol traffic to stderr.")
{
}

void DeviceOptions::addTo(QCommandLineParser* parser) const
{
    parser->addOption(serial);
    parser->addOption(portPath);
    parser->addOption(timeoutMs);
    parser->addOption(verbose);
}

QString DeviceOptions::serialFrom(const QCommandLineParser& parser) const
{
    if (parser.isSet(serial)) {
        return parser.value(serial);
    }
    return QString::fromLocal8Bit(qgetenv("ANDROID_SERIAL"));
}

int DeviceOptions::timeoutFrom(const QCommandLineParser& parser) const
{
    return intOption(parser, timeoutMs, 1);
}

void usageError(const QString& message)
{
    fprintf(stderr, "%s: %s\n", qPrintable(QCoreApplication::applicationName()), qPrintable(message));
    fprintf(stderr, "Try '%s help' for more information.\n", qPrintable(QCoreApplication::applicationName()));
    exit(EXIT_USAGE);
}

void parseCommandLine(QCommandLineParser* parser, const QStringList& arguments)
{
    parser->setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsPositionalArguments);
    if (!parser->parse(arguments)) {
        usageError(parser->errorText());
    }
}

int intOption(const QCommandLineParser& parser, const QCommandLineOption& option, int minimum)
{
    bool ok = false;
    int value = parser.value(option).toInt(&ok);
    if (!ok || value < minimum) {
        usageError(QString("invalid value for --%1: %2").arg(option.names().last()).arg(parser.value(option)));
    }
    return value;
}

int reportError(const AdbError& error)
{
    fprintf(stderr, "error: %s\n", qPrintable(error.message()));
    return EXIT_FAILURE;
}
