#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDate>
#include <QDateTime>
#include <QString>
#include <QTextStream>
#include <QTime>

#include <memory>

#include "version.h"

#include "pawpal/app/DemoHousehold.hpp"
#include "pawpal/app/ScheduleReport.hpp"
#include "pawpal/core/AppContext.hpp"
#include "pawpal/core/Clock.hpp"
#include "pawpal/core/Scheduler.hpp"
#include "pawpal/core/Settings.hpp"
#include "pawpal/data/ValidationError.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("PawPal"));
    QCoreApplication::setApplicationName(QStringLiteral("PawPal"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kPawPalVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Pet-care schedule for a single owner"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption ownerOption(QStringLiteral("owner"), QStringLiteral("Owner name."), QStringLiteral("name"));
    const QCommandLineOption emailOption(QStringLiteral("email"), QStringLiteral("Owner email."), QStringLiteral("address"));
    const QCommandLineOption dateOption(QStringLiteral("date"),
                                        QStringLiteral("Treat this day (yyyy-MM-dd) as today."),
                                        QStringLiteral("date"));
    const QCommandLineOption sectionOption(QStringLiteral("section"),
                                           QStringLiteral("One of: %1, all.")
                                               .arg(pawpal::app::ScheduleReport::sectionNames().join(QStringLiteral(", "))),
                                           QStringLiteral("name"),
                                           QStringLiteral("all"));
    parser.addOption(ownerOption);
    parser.addOption(emailOption);
    parser.addOption(dateOption);
    parser.addOption(sectionOption);
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    std::unique_ptr<pawpal::core::Clock> clock;
    if (parser.isSet(dateOption)) {
        const QDate day = QDate::fromString(parser.value(dateOption), Qt::ISODate);
        if (!day.isValid()) {
            err << QObject::tr("Invalid date '%1', expected yyyy-MM-dd").arg(parser.value(dateOption)) << '\n';
            return 1;
        }
        clock = std::make_unique<pawpal::core::FixedClock>(QDateTime(day, QTime::currentTime()));
    } else {
        clock = std::make_unique<pawpal::core::SystemClock>();
    }

    pawpal::core::OwnerOverrides overrides;
    overrides.name = parser.value(ownerOption);
    overrides.email = parser.value(emailOption);

    try {
        pawpal::core::AppContext context(std::make_unique<pawpal::core::Settings>(), std::move(clock), overrides);
        pawpal::app::seedDemoHousehold(context.scheduler(),
                                       context.clock().today(),
                                       context.settings().defaultWalkDurationMinutes());

        pawpal::app::ScheduleReport report(context.scheduler());
        const QString requested = parser.value(sectionOption);
        const QStringList sections = requested == QLatin1String("all")
                                         ? pawpal::app::ScheduleReport::sectionNames()
                                         : QStringList{requested};
        for (const auto &name : sections) {
            for (const auto &line : report.section(name)) {
                out << line << '\n';
            }
            out << '\n';
        }
    } catch (const pawpal::data::ValidationError &error) {
        out.flush();
        err << QString::fromUtf8(error.what()) << '\n';
        return 1;
    }
    return 0;
}
