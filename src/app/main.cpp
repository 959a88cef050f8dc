#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QFile>

#include <KAboutData>
#include <KLocalizedString>

#include <cstdio>

#include "cmdpreprocessor.h"
#include "footnoteconfig.h"
#include "footnotepreprocessor.h"

static int handlePreprocessing(FootnotePreprocessor &preprocessor)
{
    QFile in;
    if (!in.open(stdin, QIODevice::ReadOnly)) {
        qCritical().noquote() << i18n("Unable to read standard input");
        return 1;
    }

    CmdPreprocessor::Input input = CmdPreprocessor::parseInput(in);
    if (!input.valid) {
        qCritical().noquote() << input.errorMessage;
        return 1;
    }

    if (!CmdPreprocessor::isCompatibleVersion(input.context.mdbookVersion)) {
        qWarning().noquote()
            << i18n("Warning: The %1 plugin was built against version %2 of mdbook, "
                    "but we're being called from version %3",
                    preprocessor.name(),
                    QString::fromLatin1(CmdPreprocessor::kMdBookVersion),
                    input.context.mdbookVersion);
    }

    preprocessor.setConfig(FootnoteConfig::fromContext(input.context));

    const BookModel::Book book =
        preprocessor.run(input.context, std::move(input.book));

    QFile out;
    if (!out.open(stdout, QIODevice::WriteOnly)) {
        qCritical().noquote() << i18n("Unable to write standard output");
        return 1;
    }

    QString error;
    if (!CmdPreprocessor::writeOutput(out, book, &error)) {
        qCritical().noquote() << error;
        return 1;
    }
    return 0;
}

// The answer is carried by the exit code: 0 supported, 1 not.
static int handleSupports(const FootnotePreprocessor &preprocessor,
                          const QString &renderer)
{
    return preprocessor.supportsRenderer(renderer) ? 0 : 1;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("footnoter");

    KAboutData aboutData(
        QStringLiteral("footnoter"),
        i18n("Footnoter"),
        QStringLiteral("0.1.0"),
        i18n("An mdbook preprocessor which expands footnote markers"),
        KAboutLicense::GPL_V3,
        i18n("(c) 2025-2026"),
        QString(),
        QString()
    );
    aboutData.setOrganizationDomain("footnoter.org");

    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);
    parser.addPositionalArgument(
        QStringLiteral("supports"),
        i18n("Check whether a renderer is supported by this preprocessor"),
        QStringLiteral("[supports <renderer>]"));
    parser.process(app);
    aboutData.processCommandLine(&parser);

    FootnotePreprocessor preprocessor;

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        return handlePreprocessing(preprocessor);

    if (args.first() == QLatin1String("supports") && args.size() == 2)
        return handleSupports(preprocessor, args.at(1));

    // Unknown subcommand or missing renderer name
    parser.showHelp(1);
}
