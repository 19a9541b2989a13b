#include <QtTest>
#include "core/YamlConfig.hpp"

class TestYamlConfig : public QObject {
    Q_OBJECT
private slots:
    void testLoadDefaults();
    void testLoadFromFile();
    void testSaveAndReload();
    void testToTaskQueueConfig();
    void testProtocolLogFormat();
    void testValueByPath();
    void testValueByPathMissing();
    void testSetValueByPath();
    void testSetValueByPathRejectsUnknown();
    void testLoadMissingFileThrows();
};

void TestYamlConfig::testLoadDefaults()
{
    mdq::YamlConfig config;
    QVERIFY(config.queuePath().endsWith("/.mdsync/task-queue.bin"));
    QCOMPARE(config.backoffInitialMs(), 500);
    QCOMPARE(config.backoffMaxMs(), 8000);
    QCOMPARE(config.maxRetries(), 5);
    QCOMPARE(config.reflectAckTimeoutMs(), 20000);
    QCOMPARE(config.protocolLogEnabled(), false);
    QCOMPARE(config.protocolLogPath(), QString("/tmp/mdsync-protocol.log"));
    QCOMPARE(config.protocolLogFormat(), QString("tsv"));
}

void TestYamlConfig::testLoadFromFile()
{
    mdq::YamlConfig config;
    config.load(QString(TEST_DATA_DIR) + "/test_config.yaml");

    QCOMPARE(config.queuePath(), QString("/var/lib/mdsync/queue.bin"));
    QCOMPARE(config.backoffMaxMs(), 4000);
    QCOMPARE(config.maxRetries(), 3);
    QCOMPARE(config.protocolLogEnabled(), true);

    // Keys missing from the file keep their defaults
    QCOMPARE(config.backoffInitialMs(), 500);
    QCOMPARE(config.reflectAckTimeoutMs(), 20000);
    QCOMPARE(config.protocolLogPath(), QString("/tmp/mdsync-protocol.log"));
}

void TestYamlConfig::testSaveAndReload()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("nested/config.yaml");

    mdq::YamlConfig config;
    config.setQueuePath("/srv/queue.bin");
    config.setBackoffInitialMs(250);
    config.setProtocolLogEnabled(true);
    QVERIFY(config.save(path));

    mdq::YamlConfig loaded;
    loaded.load(path);
    QCOMPARE(loaded.queuePath(), QString("/srv/queue.bin"));
    QCOMPARE(loaded.backoffInitialMs(), 250);
    QCOMPARE(loaded.protocolLogEnabled(), true);
}

void TestYamlConfig::testToTaskQueueConfig()
{
    mdq::YamlConfig config;
    config.load(QString(TEST_DATA_DIR) + "/test_config.yaml");
    config.setReflectAckTimeoutMs(1500);

    const mdsync::TaskQueueConfig queue = config.toTaskQueueConfig();
    QCOMPARE(queue.path, QString("/var/lib/mdsync/queue.bin"));
    QCOMPARE(queue.backoffInitialMs, 500);
    QCOMPARE(queue.backoffMaxMs, 4000);
    QCOMPARE(queue.maxRetries, 3);
    QCOMPARE(queue.reflectAckTimeoutMs, 1500);
}

void TestYamlConfig::testProtocolLogFormat()
{
    mdq::YamlConfig config;
    QVERIFY(config.protocolLogOutputFormat() == mdsync::ProtocolLogger::OutputFormat::Tsv);

    config.load(QString(TEST_DATA_DIR) + "/test_config.yaml");
    QVERIFY(config.protocolLogOutputFormat() == mdsync::ProtocolLogger::OutputFormat::Jsonl);

    config.setProtocolLogFormat("csv");
    QVERIFY(config.protocolLogOutputFormat() == mdsync::ProtocolLogger::OutputFormat::Tsv);
}

void TestYamlConfig::testValueByPath()
{
    mdq::YamlConfig config;
    QCOMPARE(config.valueByPath("queue.max_retries").toInt(), 5);
    QCOMPARE(config.valueByPath("queue.backoff.initial_ms").toInt(), 500);
    QCOMPARE(config.valueByPath("mediator.reflect_ack_timeout_ms").toInt(), 20000);
    QCOMPARE(config.valueByPath("protocol_log.enabled").toBool(), false);
    QCOMPARE(config.valueByPath("protocol_log.format").toString(), QString("tsv"));
}

void TestYamlConfig::testValueByPathMissing()
{
    mdq::YamlConfig config;
    QVERIFY(!config.valueByPath("nonexistent").isValid());
    QVERIFY(!config.valueByPath("queue.nonexistent").isValid());
    QVERIFY(!config.valueByPath("queue.backoff").isValid());
    QVERIFY(!config.valueByPath("").isValid());
}

void TestYamlConfig::testSetValueByPath()
{
    mdq::YamlConfig config;
    QVERIFY(config.setValueByPath("queue.backoff.max_ms", 16000));
    QCOMPARE(config.backoffMaxMs(), 16000);
    QCOMPARE(config.valueByPath("queue.backoff.max_ms").toInt(), 16000);

    QVERIFY(config.setValueByPath("protocol_log.enabled", true));
    QCOMPARE(config.protocolLogEnabled(), true);

    QVERIFY(config.setValueByPath("protocol_log.format", QString("jsonl")));
    QCOMPARE(config.protocolLogFormat(), QString("jsonl"));
}

void TestYamlConfig::testSetValueByPathRejectsUnknown()
{
    mdq::YamlConfig config;
    QVERIFY(!config.setValueByPath("bogus.key", 42));
    QVERIFY(!config.setValueByPath("queue.bogus", 42));
    QVERIFY(!config.valueByPath("bogus.key").isValid());
    // Subtrees are not writable
    QVERIFY(!config.setValueByPath("queue", QString("x")));
    QVERIFY(!config.setValueByPath("queue.backoff", QString("x")));
    QVERIFY(!config.setValueByPath("", 1));
}

void TestYamlConfig::testLoadMissingFileThrows()
{
    mdq::YamlConfig config;
    bool threw = false;
    try {
        config.load(QString(TEST_DATA_DIR) + "/does_not_exist.yaml");
    } catch (const YAML::Exception&) {
        threw = true;
    }
    QVERIFY(threw);
    QCOMPARE(config.maxRetries(), 5);
}

QTEST_MAIN(TestYamlConfig)
#include "test_yaml_config.moc"
