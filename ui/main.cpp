// Command-line entry point: queue local copies/moves and report until done.
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>
#include <QTimer>
#include <cstdio>
#include "ArchiveExtractBackend.hpp"
#include "TransferRegistry.hpp"
#include "TransferSettings.hpp"
#include "furman/BackendRouter.hpp"
#include "furman/Format.hpp"
#include "furman/LocalTransferBackend.hpp"

using namespace furman;

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("Furman");
    QCoreApplication::setOrganizationName("Furman");

    QCommandLineParser parser;
    parser.setApplicationDescription("Copy or move files with Furman's transfer engine.");
    parser.addHelpOption();
    QCommandLineOption moveOpt("move", "Move instead of copy.");
    QCommandLineOption splitOpt("split", "Queue one transfer per source.");
    QCommandLineOption concurrencyOpt("max-concurrent", "Transfers allowed to run at once.", "N");
    QCommandLineOption limitOpt("limit", "Bandwidth limit in bytes per second (0 = unlimited).", "BYTES");
    parser.addOption(moveOpt);
    parser.addOption(splitOpt);
    parser.addOption(concurrencyOpt);
    parser.addOption(limitOpt);
    parser.addPositionalArgument("sources", "Files or directories to transfer.", "SOURCE...");
    parser.addPositionalArgument("destination", "Target directory.", "DESTINATION");
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.size() < 2) {
        std::fprintf(stderr, "furman-transfer: need at least one source and a destination\n");
        parser.showHelp(2);
    }

    TransferSettings settings;
    LocalTransferBackend local;
    ArchiveExtractBackend extract;
    BackendRouter router;
    router.addRoute(BackendKind::Local, BackendKind::Local, &local);
    router.setExtractBackend(&extract);

    TransferRegistry registry(router);
    registry.useSettings(&settings);

    // Options given on the command line become the new defaults
    if (parser.isSet(concurrencyOpt)) {
        bool ok = false;
        const int n = parser.value(concurrencyOpt).toInt(&ok);
        if (!ok) {
            std::fprintf(stderr, "furman-transfer: invalid --max-concurrent value\n");
            return 2;
        }
        registry.setMaxConcurrent(n);
    }
    if (parser.isSet(limitOpt)) {
        bool ok = false;
        const quint64 limit = parser.value(limitOpt).toULongLong(&ok);
        if (!ok) {
            std::fprintf(stderr, "furman-transfer: invalid --limit value\n");
            return 2;
        }
        registry.setBandwidthLimit(limit);
    }

    QTextStream out(stdout);
    const QString destination = args.last();
    const QStringList sources = args.mid(0, args.size() - 1);
    const TransferType type = parser.isSet(moveOpt) ? TransferType::Move : TransferType::Copy;

    QObject::connect(&registry, &TransferRegistry::transferFinished, [&registry, &out, &app](quint64 id) {
        if (const TransferDescriptor* d = registry.find(id)) {
            out << "#" << id << " " << toString(d->status);
            if (!d->error.isEmpty()) out << ": " << d->error;
            out << "\n";
            out.flush();
        }
        for (const auto& t : registry.transfers())
            if (!t.isTerminal()) return;
        app.quit();
    });

    if (parser.isSet(splitOpt)) {
        for (const auto& s : sources) registry.submit(type, QStringList{s}, destination);
    } else {
        registry.submit(type, sources, destination);
    }

    auto report = [&registry, &out]() {
        const QString line = registry.aggregateSummary();
        if (line.isEmpty()) return;
        for (const auto& t : registry.active()) {
            const QString speed = QString::fromStdString(formatSpeed(t.speedBytesPerSec));
            const QString eta = QString::fromStdString(formatEta(registry.eta(t.id)));
            if (!speed.isEmpty()) out << "  #" << t.id << " " << speed << (eta.isEmpty() ? "" : " ") << eta << "\n";
        }
        out << line << "\n";
        out.flush();
    };

    QTimer ticker;
    ticker.setInterval(1000);
    QObject::connect(&ticker, &QTimer::timeout, report);
    ticker.start();

    // Everything may already have failed to start
    bool pending = false;
    for (const auto& t : registry.transfers())
        if (!t.isTerminal()) pending = true;
    if (pending) app.exec();

    for (const auto& t : registry.transfers())
        if (t.status != TransferDescriptor::Status::Completed) return 1;
    return registry.transfers().isEmpty() ? 1 : 0;
}
