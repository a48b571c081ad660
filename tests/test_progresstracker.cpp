#include <QtTest>

#include "furman/Format.hpp"
#include "furman/ProgressTracker.hpp"
#include "furman/Throttle.hpp"

using namespace furman;
using namespace std::chrono_literals;

class TestProgressTracker : public QObject
{
    Q_OBJECT

private:
    ProgressTracker::Clock::time_point t0 = ProgressTracker::Clock::now();

private slots:
    void testFirstSampleHasNoRate()
    {
        ProgressTracker t;
        QCOMPARE(t.update(500, t0), 0.0);
        QCOMPARE(t.bytesPerSec(), 0.0);
    }

    void testFirstIntervalSetsRate()
    {
        ProgressTracker t;
        t.update(0, t0);
        QCOMPARE(t.update(1000, t0 + 1s), 1000.0);
    }

    void testLaterIntervalsAreSmoothed()
    {
        ProgressTracker t;
        t.update(0, t0);
        t.update(1000, t0 + 1s);          // 1000 B/s
        const double r = t.update(3000, t0 + 2s); // instant 2000 B/s
        QVERIFY(qFuzzyCompare(r, 0.3 * 2000.0 + 0.7 * 1000.0));
    }

    void testSameInputsGiveSameRate()
    {
        ProgressTracker a;
        ProgressTracker b;
        for (ProgressTracker* t : {&a, &b}) {
            t->update(0, t0);
            t->update(4096, t0 + 500ms);
            t->update(9000, t0 + 1200ms);
        }
        QCOMPARE(a.bytesPerSec(), b.bytesPerSec());
    }

    void testRegressionKeepsRate()
    {
        ProgressTracker t;
        t.update(0, t0);
        t.update(2000, t0 + 1s);
        QCOMPARE(t.update(100, t0 + 2s), 2000.0);
        // New baseline: 100 -> 1100 over one second
        const double r = t.update(1100, t0 + 3s);
        QVERIFY(qFuzzyCompare(r, 0.3 * 1000.0 + 0.7 * 2000.0));
    }

    void testIdleDecay()
    {
        ProgressTracker t;
        t.update(0, t0);
        t.update(1000, t0 + 1s);
        QVERIFY(!t.decayIfIdle(t0 + 2s));
        QCOMPARE(t.bytesPerSec(), 1000.0);
        QVERIFY(t.decayIfIdle(t0 + 3s));
        QVERIFY(qFuzzyCompare(t.bytesPerSec(), 700.0));
        for (int i = 0; i < 30; ++i) t.decayIfIdle(t0 + 3s + std::chrono::seconds(i));
        QCOMPARE(t.bytesPerSec(), 0.0);
        QVERIFY(!t.decayIfIdle(t0 + 60s));
    }

    void testReset()
    {
        ProgressTracker t;
        t.update(0, t0);
        t.update(1000, t0 + 1s);
        t.reset();
        QCOMPARE(t.bytesPerSec(), 0.0);
        QCOMPARE(t.update(5000, t0 + 2s), 0.0);
    }

    void testEta()
    {
        QVERIFY(!etaSeconds(0, 1000, 0.0).has_value());
        const auto eta = etaSeconds(250, 1000, 250.0);
        QVERIFY(eta.has_value());
        QCOMPARE(*eta, 3.0);
        QCOMPARE(*etaSeconds(1000, 1000, 10.0), 0.0);
    }

    void testFormatSize()
    {
        QCOMPARE(formatSize(0), std::string("0"));
        QCOMPARE(formatSize(512), std::string("512"));
        QCOMPARE(formatSize(1536), std::string("1.5K"));
        QCOMPARE(formatSize(3355443), std::string("3.2M"));
        QCOMPARE(formatSize(1073741824ULL), std::string("1.0G"));
    }

    void testFormatSpeed()
    {
        QCOMPARE(formatSpeed(0.0), std::string());
        QCOMPARE(formatSpeed(512.0), std::string("512 B/s"));
        QCOMPARE(formatSpeed(12.3 * 1024 * 1024), std::string("12.3 MB/s"));
    }

    void testFormatEta()
    {
        QCOMPARE(formatEta(std::nullopt), std::string());
        QCOMPARE(formatEta(42.0), std::string("42s"));
        QCOMPARE(formatEta(185.0), std::string("3m 5s"));
        QCOMPARE(formatEta(3720.0), std::string("1h 2m"));
    }

    void testThrottleDelay()
    {
        QCOMPARE(Throttle::delayFor(1000, 0.1, 0).count(), 0.0);
        // 1000 bytes at 1000 B/s should take one second
        QVERIFY(qFuzzyCompare(Throttle::delayFor(1000, 0.25, 1000).count(), 0.75));
        QCOMPARE(Throttle::delayFor(1000, 2.0, 1000).count(), 0.0);
    }
};

QTEST_GUILESS_MAIN(TestProgressTracker)
#include "test_progresstracker.moc"
