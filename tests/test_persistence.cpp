// test_persistence.cpp
#include <QtTest>
#include <QTemporaryDir>

#include <fstream>

#include "../src/core/persistence.hpp"
#include "manual_clock.hpp"

using namespace std::chrono_literals;
using recurrent::Duration;
namespace persistence = recurrent::persistence;

class PersistenceTest : public QObject {
    Q_OBJECT

private slots:
    void init();
    void saveThenLoad();
    void defaultsForOptionalFields();
    void nullThrottleMeansUnthrottled();
    void throttleLongerThanIntervalWarns();
    void rejectsMissingFile();
    void rejectsMalformedJson();
    void rejectsBadDurations_data();
    void rejectsBadDurations();
    void optionsConfigureScheduler();

private:
    std::string write(const char* name, const std::string& text);

    std::unique_ptr<QTemporaryDir> m_dir;
};

void PersistenceTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

std::string PersistenceTest::write(const char* name, const std::string& text)
{
    std::string path = m_dir->filePath(name).toStdString();
    std::ofstream(path) << text;
    return path;
}

void PersistenceTest::saveThenLoad()
{
    persistence::ScheduleDocument doc;
    doc.name     = "backup";
    doc.comment  = "nightly";
    doc.interval = 60s;
    doc.throttle = 5s;
    doc.command  = {"/usr/bin/rsync", "-a", "src/", "dst/"};

    std::string err;
    const std::string path = m_dir->filePath("backup.schedule.json").toStdString();
    QVERIFY(persistence::saveFile(doc, path, true, &err));

    persistence::ScheduleDocument back;
    QVERIFY2(persistence::loadFile(path, back, &err), err.c_str());
    QVERIFY(err.empty());
    QCOMPARE(back.name, doc.name);
    QCOMPARE(back.comment, doc.comment);
    QCOMPARE(back.interval, Duration(60000));
    QVERIFY(back.throttle);
    QCOMPARE(*back.throttle, Duration(5000));
    QVERIFY(back.command == doc.command);
}

void PersistenceTest::defaultsForOptionalFields()
{
    auto path = write("min.json", R"({"name": "minimal"})");

    persistence::ScheduleDocument doc;
    std::string err;
    QVERIFY(persistence::loadFile(path, doc, &err));
    QCOMPARE(doc.name, std::string("minimal"));
    QCOMPARE(doc.interval, Duration(1000));
    QVERIFY(!doc.throttle);
    QVERIFY(doc.command.empty());
}

void PersistenceTest::nullThrottleMeansUnthrottled()
{
    auto path = write("null.json", R"({"name": "n", "interval_ms": 250, "throttle_ms": null})");

    persistence::ScheduleDocument doc;
    QVERIFY(persistence::loadFile(path, doc));
    QCOMPARE(doc.interval, Duration(250));
    QVERIFY(!doc.throttle);
}

void PersistenceTest::throttleLongerThanIntervalWarns()
{
    auto path = write("slow.json", R"({"name": "slow", "interval_ms": 100, "throttle_ms": 500})");

    persistence::ScheduleDocument doc;
    std::string err;
    QVERIFY(persistence::loadFile(path, doc, &err));
    QVERIFY(!err.empty());
    QVERIFY(err.find("slow") != std::string::npos);
    QCOMPARE(*doc.throttle, Duration(500));
}

void PersistenceTest::rejectsMissingFile()
{
    persistence::ScheduleDocument doc;
    std::string err;
    QVERIFY(!persistence::loadFile(m_dir->filePath("absent.json").toStdString(), doc, &err));
    QVERIFY(err.rfind("Failed to open file", 0) == 0);
}

void PersistenceTest::rejectsMalformedJson()
{
    auto path = write("broken.json", R"({"name": "broken", )");

    persistence::ScheduleDocument doc;
    std::string err;
    QVERIFY(!persistence::loadFile(path, doc, &err));
    QVERIFY(err.rfind("JSON parse error", 0) == 0);
}

void PersistenceTest::rejectsBadDurations_data()
{
    QTest::addColumn<QString>("json");

    QTest::newRow("no name")          << R"({"interval_ms": 100})";
    QTest::newRow("zero interval")    << R"({"name": "x", "interval_ms": 0})";
    QTest::newRow("negative throttle")<< R"({"name": "x", "throttle_ms": -10})";
    QTest::newRow("string interval")  << R"({"name": "x", "interval_ms": "1s"})";
    QTest::newRow("float throttle")   << R"({"name": "x", "throttle_ms": 2.5})";
    QTest::newRow("command not list") << R"({"name": "x", "command": "ls -l"})";
}

void PersistenceTest::rejectsBadDurations()
{
    QFETCH(QString, json);
    auto path = write("bad.json", json.toStdString());

    persistence::ScheduleDocument doc;
    std::string err;
    QVERIFY(!persistence::loadFile(path, doc, &err));
    QVERIFY2(err.rfind("Schedule schema error", 0) == 0, err.c_str());
}

void PersistenceTest::optionsConfigureScheduler()
{
    persistence::ScheduleDocument doc;
    doc.name     = "opts";
    doc.interval = 750ms;
    doc.throttle = 50ms;

    auto opts = persistence::optionsFrom(doc);
    opts.push_back(recurrent::withClock(std::make_shared<recurrent::testing::ManualClock>()));
    recurrent::Scheduler s([]{}, opts);

    QCOMPARE(s.interval(), Duration(750));
    QVERIFY(s.throttle());
    QCOMPARE(*s.throttle(), Duration(50));

    doc.throttle.reset();
    recurrent::Scheduler plain([]{}, persistence::optionsFrom(doc));
    QVERIFY(!plain.throttle());
}

QTEST_GUILESS_MAIN(PersistenceTest)
#include "test_persistence.moc"
