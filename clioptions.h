// -*- mode: c++ -*-
#ifndef CLIOPTIONS_H
#define CLIOPTIONS_H
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QStringList>

class AdbError;

const int EXIT_USAGE = 2;

/** Options both command line tools take. */
struct DeviceOptions
{
    QCommandLineOption serial;
    QCommandLineOption portPath;
    QCommandLineOption timeoutMs;
    QCommandLineOption verbose;

    DeviceOptions();

    void addTo(QCommandLineParser* parser) const;

    /** -s, or ANDROID_SERIAL when -s was not given. */
    QString serialFrom(const QCommandLineParser& parser) const;
    int timeoutFrom(const QCommandLineParser& parser) const;
};

/** Parses argv with everything after the first positional argument kept
positional, so "shell ls -l" reaches the subcommand intact. Prints the
parser's complaint and exits with EXIT_USAGE on bad options. */
void parseCommandLine(QCommandLineParser* parser, const QStringList& arguments);

/** Reads an integer option, exiting with EXIT_USAGE when it is not one. */
int intOption(const QCommandLineParser& parser, const QCommandLineOption& option, int minimum);

/** "error: <message>" on stderr; returns the exit code for failures. */
int reportError(const AdbError& error);

void usageError(const QString& message);

#endif // CLIOPTIONS_H
