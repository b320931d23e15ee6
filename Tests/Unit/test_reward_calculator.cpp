#include <QtTest/QtTest>

#include "core/learning/reward_calculator.h"

#include <limits>

class TestRewardCalculator : public QObject {
    Q_OBJECT

private slots:
    void testCompletedRequest_data();
    void testCompletedRequest();
    void testPerformanceUpdate_data();
    void testPerformanceUpdate();
    void testExplicitFeedbackIsClamped();
    void testThresholdsAreExclusive();
};

void TestRewardCalculator::testCompletedRequest_data()
{
    QTest::addColumn<bool>("success");
    QTest::addColumn<double>("roas");
    QTest::addColumn<double>("ctr");
    QTest::addColumn<qint64>("conversions");
    QTest::addColumn<double>("expected");

    QTest::newRow("strong success clamps") << true << 4.0 << 3.0 << qint64(40) << 1.0;
    QTest::newRow("weak failure clamps") << false << 0.5 << 0.5 << qint64(0) << -1.0;
    QTest::newRow("neutral success") << true << 2.0 << 1.5 << qint64(10) << 0.5;
    QTest::newRow("missing metrics on success") << true << 0.0 << 0.0 << qint64(0) << 0.0;
    QTest::newRow("failure with good ctr") << false << 2.0 << 3.0 << qint64(31) << -0.2;
    QTest::newRow("success high roas only") << true << 3.5 << 1.0 << qint64(5) << 0.8;
    QTest::newRow("saturated conversions keep bonus")
        << true << 2.0 << 1.5 << std::numeric_limits<qint64>::max() << 0.6;
}

void TestRewardCalculator::testCompletedRequest()
{
    QFETCH(bool, success);
    QFETCH(double, roas);
    QFETCH(double, ctr);
    QFETCH(qint64, conversions);
    QFETCH(double, expected);

    crl::RewardSignals rewardSignals;
    rewardSignals.roas = roas;
    rewardSignals.ctr = ctr;
    rewardSignals.conversions = conversions;

    const double reward = crl::RewardCalculator::forCompletedRequest(success, rewardSignals);
    QVERIFY2(qAbs(reward - expected) < 1e-9,
             qPrintable(QStringLiteral("reward=%1 expected=%2").arg(reward).arg(expected)));
}

void TestRewardCalculator::testPerformanceUpdate_data()
{
    QTest::addColumn<bool>("improvement");
    QTest::addColumn<double>("roas");
    QTest::addColumn<double>("expected");

    QTest::newRow("improved, high roas") << true << 4.0 << 0.8;
    QTest::newRow("improved, mid roas") << true << 2.0 << 0.5;
    QTest::newRow("not improved, low roas") << false << 0.5 << -0.6;
    QTest::newRow("not improved, high roas") << false << 3.2 << 0.0;
}

void TestRewardCalculator::testPerformanceUpdate()
{
    QFETCH(bool, improvement);
    QFETCH(double, roas);
    QFETCH(double, expected);

    crl::RewardSignals rewardSignals;
    rewardSignals.roas = roas;
    // CTR and conversions do not shape performance rewards.
    rewardSignals.ctr = 10.0;
    rewardSignals.conversions = 500;

    const double reward = crl::RewardCalculator::forPerformanceUpdate(improvement, rewardSignals);
    QVERIFY(qAbs(reward - expected) < 1e-9);
}

void TestRewardCalculator::testExplicitFeedbackIsClamped()
{
    QCOMPARE(crl::RewardCalculator::forExplicitFeedback(1.7), 1.0);
    QCOMPARE(crl::RewardCalculator::forExplicitFeedback(-3.0), -1.0);
    QCOMPARE(crl::RewardCalculator::forExplicitFeedback(0.25), 0.25);
    QCOMPARE(crl::RewardCalculator::forExplicitFeedback(
                 std::numeric_limits<double>::quiet_NaN()), 0.0);
    QCOMPARE(crl::RewardCalculator::forExplicitFeedback(
                 std::numeric_limits<double>::infinity()), 1.0);
}

void TestRewardCalculator::testThresholdsAreExclusive()
{
    crl::RewardSignals atBoundary;
    atBoundary.roas = crl::RewardCalculator::kRoasHigh;
    atBoundary.ctr = crl::RewardCalculator::kCtrHigh;
    atBoundary.conversions = crl::RewardCalculator::kConversionsBonusThreshold;
    QVERIFY(qAbs(crl::RewardCalculator::forCompletedRequest(true, atBoundary) - 0.5) < 1e-9);

    atBoundary.roas = crl::RewardCalculator::kRoasLow;
    atBoundary.ctr = crl::RewardCalculator::kCtrLow;
    QVERIFY(qAbs(crl::RewardCalculator::forCompletedRequest(false, atBoundary) + 0.5) < 1e-9);
}

QTEST_MAIN(TestRewardCalculator)
#include "test_reward_calculator.moc"
