#include <QtTest/QtTest>
#include <QSignalSpy>

#include "services/ProcessLockService.h"

class ProcessLockServiceTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
#if defined(Q_OS_WIN)
        QSKIP("Lock command tests use /bin/sh");
#endif
    }

    void init() {
        m_service = new ProcessLockService();
    }

    void cleanup() {
        delete m_service;
    }

    void testDefaultCommands() {
        QVERIFY(!ProcessLockService::defaultLockCommands().isEmpty());
        QCOMPARE(m_service->lockCommands().size(), ProcessLockService::defaultLockCommands().size());
    }

    void testFirstSuccessfulCommandWins() {
        QSignalSpy finishedSpy(m_service, &LockService::lockFinished);
        m_service->setLockCommands({ shell("exit 1"), shell("exit 0"), shell("exit 3") });

        m_service->lock(7);

        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(finishedSpy.at(0).at(0).toULongLong(), quint64(7));
        QCOMPARE(finishedSpy.at(0).at(1).toBool(), true);

        QTest::qWait(50);
        QCOMPARE(finishedSpy.count(), 1);
    }

    void testMissingProgramIsSkipped() {
        QSignalSpy finishedSpy(m_service, &LockService::lockFinished);
        m_service->setLockCommands({ LockCommand{ "/nonexistent/snaplock-lock", {} }, shell("exit 0") });

        m_service->lock(1);

        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(finishedSpy.at(0).at(1).toBool(), true);
    }

    void testAllCommandsFail() {
        QSignalSpy finishedSpy(m_service, &LockService::lockFinished);
        m_service->setLockCommands({ shell("exit 1"), shell("exit 2") });

        m_service->lock(2);

        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(finishedSpy.at(0).at(1).toBool(), false);
        const QString error = finishedSpy.at(0).at(2).toString();
        QVERIFY(error.contains("exited with code 1"));
        QVERIFY(error.contains("exited with code 2"));
    }

    void testNoCommands() {
        QSignalSpy finishedSpy(m_service, &LockService::lockFinished);
        m_service->setLockCommands({});

        m_service->lock(3);
        // Reported from the event loop, never from inside lock()
        QCOMPARE(finishedSpy.count(), 0);

        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(finishedSpy.at(0).at(1).toBool(), false);
    }

    void testHangingCommandTimesOut() {
        QSignalSpy finishedSpy(m_service, &LockService::lockFinished);
        m_service->setCommandTimeout(100);
        m_service->setLockCommands({ shell("sleep 10"), shell("exit 0") });

        m_service->lock(4);

        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(finishedSpy.at(0).at(1).toBool(), true);
    }

    void testAbortStopsRunningCommand() {
        QSignalSpy finishedSpy(m_service, &LockService::lockFinished);
        m_service->setLockCommands({ shell("sleep 10"), shell("exit 0") });

        m_service->lock(5);
        QVERIFY(m_service->isLocking());

        // Other ids are ignored
        m_service->abort(4);
        QVERIFY(m_service->isLocking());

        m_service->abort(5);
        QVERIFY(!m_service->isLocking());

        QTest::qWait(100);
        QCOMPARE(finishedSpy.count(), 0);
        QVERIFY(!m_service->findChild<QProcess*>());
    }

    void testTotalTimeoutBoundsFallbacks() {
        QSignalSpy finishedSpy(m_service, &LockService::lockFinished);
        m_service->setCommandTimeout(2000);
        m_service->setTotalTimeout(300);
        m_service->setLockCommands({ shell("sleep 10"), shell("sleep 10"), shell("sleep 10") });

        QElapsedTimer elapsed;
        elapsed.start();
        m_service->lock(6);

        QTRY_COMPARE(finishedSpy.count(), 1);
        QVERIFY(elapsed.elapsed() < 2000);
        QCOMPARE(finishedSpy.at(0).at(0).toULongLong(), quint64(6));
        QCOMPARE(finishedSpy.at(0).at(1).toBool(), false);
        QVERIFY(finishedSpy.at(0).at(2).toString().contains("exceeded 300 ms"));
        QVERIFY(!m_service->isLocking());
    }

    void testNewRequestSupersedesRunningOne() {
        QSignalSpy finishedSpy(m_service, &LockService::lockFinished);
        m_service->setLockCommands({ shell("sleep 0.3; exit 0") });

        m_service->lock(10);
        m_service->lock(11);

        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(finishedSpy.at(0).at(0).toULongLong(), quint64(11));
    }

private:
    static LockCommand shell(const QString& script) {
        return LockCommand{ "/bin/sh", { "-c", script } };
    }

    ProcessLockService* m_service;
};

QTEST_MAIN(ProcessLockServiceTest)
#include "ProcessLockServiceTest.moc"
