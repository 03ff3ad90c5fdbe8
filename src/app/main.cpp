#include "app/cli_app.h"

#include <QCoreApplication>
#include <QTextStream>

#include <cstdio>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("cdir"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QTextStream out(stdout);
    QTextStream err(stderr);

    cdir::CliApp cli(out, err);
    return cli.run(app.arguments());
}
