// Command-line front end: parse the command, fill gaps from the last used
// settings, run it through DeployController and print progress.
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QMap>
#include <QSettings>
#include <QTextStream>
#include <QTimer>
#include <iostream>
#include <string>
#include <termios.h>
#include <unistd.h>
#include "DeployController.hpp"

namespace {

struct Field {
    const char* option;    // command-line option name
    const char* settingsKey;
    const char* description;
};

const Field kFields[] = {
    {"project", "Last/project",    "Project name."},
    {"env",     "Last/env",        "Environment (backup namespace)."},
    {"local",   "Last/localPath",  "Local project directory."},
    {"host",    "Last/host",       "Remote host, optionally host:port."},
    {"user",    "Last/user",       "SSH user name."},
    {"remote",  "Last/remotePath", "Remote target directory."},
};

// Password prompt with terminal echo disabled.
QString promptPassword() {
    QTextStream err(stderr);
    err << QCoreApplication::translate("main", "Password: ") << Qt::flush;
    termios oldt{};
    const bool tty = ::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &oldt) == 0;
    if (tty) {
        termios noecho = oldt;
        noecho.c_lflag &= ~ECHO;
        ::tcsetattr(STDIN_FILENO, TCSANOW, &noecho);
    }
    std::string line;
    std::getline(std::cin, line);
    if (tty) {
        ::tcsetattr(STDIN_FILENO, TCSANOW, &oldt);
        err << "\n" << Qt::flush;
    }
    return QString::fromStdString(line);
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("OpenDeploy");
    QCoreApplication::setOrganizationName("OpenDeploy");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QCoreApplication::translate("main", "Deploy a project tree over SFTP with automatic remote backup and rollback."));
    parser.addHelpOption();
    parser.addPositionalArgument("command", "deploy | rollback | backup | backup-dir | app-dir");
    for (const Field& f : kFields) {
        parser.addOption(QCommandLineOption(QString::fromLatin1(f.option),
                                            QCoreApplication::translate("main", f.description),
                                            QStringLiteral("value")));
    }
    QCommandLineOption passOpt("password",
                               QCoreApplication::translate("main", "SSH password (falls back to OPEN_DEPLOY_PASSWORD, then a prompt)."),
                               QStringLiteral("value"));
    parser.addOption(passOpt);
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        err << parser.helpText();
        return 2;
    }
    const QString command = args.first();

    if (command == "app-dir") {
        out << DeployController::getAppDir() << "\n";
        return 0;
    }

    // Non-secret fields persist between runs; the password never does.
    QSettings s("OpenDeploy", "OpenDeploy");
    QMap<QString, QString> v;
    for (const Field& f : kFields) {
        const QString name = QString::fromLatin1(f.option);
        v[name] = parser.isSet(name) ? parser.value(name) : s.value(f.settingsKey).toString();
        if (parser.isSet(name)) s.setValue(f.settingsKey, v[name]);
    }

    auto require = [&](std::initializer_list<const char*> names) -> bool {
        for (const char* n : names) {
            if (v.value(QString::fromLatin1(n)).isEmpty()) {
                err << QCoreApplication::translate("main", "Missing --%1").arg(QString::fromLatin1(n)) << "\n";
                return false;
            }
        }
        return true;
    };

    DeployController controller;

    if (command == "backup-dir") {
        if (!require({"project", "env"})) return 2;
        QString dir, e;
        if (!controller.getBackupDir(v["project"], v["env"], dir, e)) {
            err << e << "\n";
            return 1;
        }
        out << dir << "\n";
        return 0;
    }

    if (command != "deploy" && command != "rollback" && command != "backup") {
        err << QCoreApplication::translate("main", "Unknown command: %1").arg(command) << "\n";
        return 2;
    }
    if (command == "backup" ? !require({"project", "env", "host", "user", "remote"})
                            : !require({"project", "env", "local", "host", "user", "remote"})) {
        return 2;
    }

    QString password = parser.value(passOpt);
    if (password.isEmpty()) password = qEnvironmentVariable("OPEN_DEPLOY_PASSWORD");
    if (password.isEmpty()) password = promptPassword();

    QObject::connect(&controller, &DeployController::progress, &app,
                     [&out](int current, int total, double percentage) {
                         out << QString("[%1/%2] %3%").arg(current).arg(total).arg(percentage, 0, 'f', 1) << "\n";
                         out.flush();
                     });
    QObject::connect(&controller, &DeployController::finished, &app,
                     [&out, &err](bool ok, const QString& message) {
                         if (ok) out << message << "\n";
                         else err << QCoreApplication::translate("main", "Error: ") << message << "\n";
                         out.flush();
                         err.flush();
                         QCoreApplication::exit(ok ? 0 : 1);
                     });

    QTimer::singleShot(0, &app, [&] {
        if (command == "deploy") {
            controller.deploy(v["project"], v["local"], v["env"], v["host"], v["user"], password, v["remote"]);
        } else if (command == "rollback") {
            controller.rollback(v["project"], v["local"], v["env"], v["host"], v["user"], password, v["remote"]);
        } else {
            controller.backupRemoteFiles(v["project"], v["env"], v["host"], v["user"], password, v["remote"]);
        }
    });
    return app.exec();
}
