#include <QtTest/QtTest>

#include "core/learning/q_learning_engine.h"

#include <limits>

namespace {

crl::EngineConfig deterministicConfig(double epsilon = 0.0)
{
    crl::EngineConfig config;
    config.explorationRate = epsilon;
    config.randomSeed = 42;
    return config;
}

} // namespace

class TestQLearningEngine : public QObject {
    Q_OBJECT

private slots:
    void testPositiveRewardRaisesQValue();
    void testNegativeRewardLowersQValue();
    void testEndToEndBatchMatchesHandComputedValues();
    void testSecondBatchIsNoOp();
    void testOutOfRangeRewardLeavesBufferUntouched();
    void testInvalidContextAndActionRejected();
    void testActionNameIsCanonicalized();
    void testOverflowDropsOldestWithoutLearning();
    void testAutoProcessAtThreshold();
    void testBatchStatsCountContextsNotExperiences();
    void testExploitationAfterLearning();
    void testHeuristicForUnknownContext();
    void testHeuristicFallsBackToFirstCandidate();
    void testExploitationRespectsCandidates();
    void testExplorationFrequency();
    void testEmptyContextRejectedForAction();
    void testStrategyLookupNormalizesKey();
    void testPersistenceDeltaHandsOffOnce();
    void testRestoreStateRebuildsQValuesFromDetails();
    void testMalformedRestoredExperienceDroppedInBatch();
    void testMetricsReportHyperparameters();
};

void TestQLearningEngine::testPositiveRewardRaisesQValue()
{
    crl::QLearningEngine engine(deterministicConfig());
    QVERIFY(engine.addExperience(QStringLiteral("MAXIMIZE_ROAS"),
                                 QStringLiteral("focus_high_value_audiences"), 0.8).has_value());
    engine.processExperiences();

    QVERIFY(engine.qValue(QStringLiteral("MAXIMIZE_ROAS"),
                          crl::ActionType::FocusHighValueAudiences) > 0.0);
}

void TestQLearningEngine::testNegativeRewardLowersQValue()
{
    crl::QLearningEngine engine(deterministicConfig());
    engine.addExperience(QStringLiteral("MINIMIZE_CPA"), QStringLiteral("pause_campaign"), -0.6);
    engine.processExperiences();

    QVERIFY(engine.qValue(QStringLiteral("MINIMIZE_CPA"), crl::ActionType::PauseCampaign) < 0.0);
}

void TestQLearningEngine::testEndToEndBatchMatchesHandComputedValues()
{
    crl::QLearningEngine engine(deterministicConfig());
    for (double reward : {0.8, 0.6, 0.9}) {
        QVERIFY(engine.addExperience(QStringLiteral("maximize roas"),
                                     QStringLiteral("focus_high_value_audiences"),
                                     reward).has_value());
    }
    QCOMPARE(engine.bufferStatus().activeSize, 3);

    const crl::BatchStats stats = engine.processExperiences();
    QCOMPARE(stats.experiencesProcessed, 3);
    QCOMPARE(stats.strategiesCreated, 1);
    QCOMPARE(stats.strategiesUpdated, 0);
    QCOMPARE(stats.touchedContexts, QStringList{QStringLiteral("MAXIMIZE_ROAS")});

    const double q = engine.qValue(QStringLiteral("MAXIMIZE_ROAS"),
                                   crl::ActionType::FocusHighValueAudiences);
    QVERIFY(qAbs(q - 0.228902) < 1e-9);

    const auto strategy = engine.strategy(QStringLiteral("MAXIMIZE_ROAS"));
    QVERIFY(strategy.has_value());
    QCOMPARE(strategy->bestAction, crl::ActionType::FocusHighValueAudiences);
    QCOMPARE(strategy->totalExperiences, 3);
    QVERIFY(qFuzzyCompare(strategy->confidence(), 3.0 / 13.0));

    const crl::BufferStatus buffer = engine.bufferStatus();
    QCOMPARE(buffer.activeSize, 0);
    QCOMPARE(buffer.historySize, 3);
    for (const crl::Experience& experience : engine.historySnapshot()) {
        QCOMPARE(experience.state, crl::ExperienceState::Processed);
        QVERIFY(experience.processedAt.isValid());
    }
}

void TestQLearningEngine::testSecondBatchIsNoOp()
{
    crl::QLearningEngine engine(deterministicConfig());
    engine.addExperience(QStringLiteral("MAXIMIZE_ROAS"),
                         QStringLiteral("focus_high_value_audiences"), 0.8);
    engine.processExperiences();
    const double before = engine.qValue(QStringLiteral("MAXIMIZE_ROAS"),
                                        crl::ActionType::FocusHighValueAudiences);

    const crl::BatchStats second = engine.processExperiences();
    QVERIFY(second.isEmpty());
    QCOMPARE(second.totalStrategies, 1);
    QCOMPARE(engine.qValue(QStringLiteral("MAXIMIZE_ROAS"),
                           crl::ActionType::FocusHighValueAudiences), before);
    QCOMPARE(engine.learningMetrics().totalLearningBatches, qint64(1));
}

void TestQLearningEngine::testOutOfRangeRewardLeavesBufferUntouched()
{
    crl::QLearningEngine engine(deterministicConfig());
    crl::LearningError error;

    QVERIFY(!engine.addExperience(QStringLiteral("MAXIMIZE_ROAS"),
                                  QStringLiteral("focus_high_value_audiences"),
                                  1.5, QJsonObject(), &error).has_value());
    QCOMPARE(error.code, crl::LearningErrorCode::InvalidReward);

    QVERIFY(!engine.addExperience(QStringLiteral("MAXIMIZE_ROAS"),
                                  QStringLiteral("focus_high_value_audiences"),
                                  std::numeric_limits<double>::quiet_NaN(),
                                  QJsonObject(), &error).has_value());
    QCOMPARE(error.code, crl::LearningErrorCode::InvalidReward);

    QCOMPARE(engine.bufferStatus().activeSize, 0);
    QCOMPARE(engine.bufferStatus().historySize, 0);
}

void TestQLearningEngine::testInvalidContextAndActionRejected()
{
    crl::QLearningEngine engine(deterministicConfig());
    crl::LearningError error;

    QVERIFY(!engine.addExperience(QStringLiteral("   "), QStringLiteral("pause_campaign"),
                                  0.1, QJsonObject(), &error).has_value());
    QCOMPARE(error.code, crl::LearningErrorCode::InvalidContext);

    QVERIFY(!engine.addExperience(QStringLiteral("MAXIMIZE_ROAS"), QStringLiteral("launch_rocket"),
                                  0.1, QJsonObject(), &error).has_value());
    QCOMPARE(error.code, crl::LearningErrorCode::InvalidAction);
    QVERIFY(error.message.contains(QStringLiteral("launch_rocket")));

    QVERIFY(!engine.addExperience(QStringLiteral("MAXIMIZE_ROAS"), QString(),
                                  0.1, QJsonObject(), &error).has_value());
    QCOMPARE(error.code, crl::LearningErrorCode::InvalidAction);

    QCOMPARE(engine.bufferStatus().activeSize, 0);
}

void TestQLearningEngine::testActionNameIsCanonicalized()
{
    crl::QLearningEngine engine(deterministicConfig());
    const auto added = engine.addExperience(QStringLiteral("MAXIMIZE_ROAS"),
                                            QStringLiteral("Focus-High-Value-Audiences"), 0.4);
    QVERIFY(added.has_value());
    QCOMPARE(added->experience.action, QStringLiteral("focus_high_value_audiences"));
    QVERIFY(!added->experience.id.isEmpty());
    QCOMPARE(added->experience.state, crl::ExperienceState::Unprocessed);
}

void TestQLearningEngine::testOverflowDropsOldestWithoutLearning()
{
    crl::EngineConfig config = deterministicConfig();
    config.autoProcessThreshold = 0;
    crl::QLearningEngine engine(config);

    QString firstId;
    for (int i = 0; i < 25; ++i) {
        const auto added = engine.addExperience(QStringLiteral("MAXIMIZE_REACH"),
                                                QStringLiteral("expand_reach_campaigns"), 0.5);
        QVERIFY(added.has_value());
        QVERIFY(!added->overflowDropped.has_value());
        QVERIFY(!added->batch.has_value());
        if (i == 0) {
            firstId = added->experience.id;
        }
    }

    const auto overflow = engine.addExperience(QStringLiteral("MAXIMIZE_REACH"),
                                               QStringLiteral("expand_reach_campaigns"), 0.5);
    QVERIFY(overflow.has_value());
    QVERIFY(overflow->overflowDropped.has_value());
    QCOMPARE(overflow->overflowDropped->id, firstId);

    QCOMPARE(engine.bufferStatus().activeSize, 25);
    const QVector<crl::Experience> history = engine.historySnapshot();
    QCOMPARE(history.size(), 1);
    QCOMPARE(history.front().id, firstId);
    QCOMPARE(history.front().state, crl::ExperienceState::Dropped);
    QCOMPARE(history.front().dropReason, QStringLiteral("dropped: overflow"));

    QCOMPARE(engine.qValue(QStringLiteral("MAXIMIZE_REACH"),
                           crl::ActionType::ExpandReachCampaigns), 0.0);
    QVERIFY(!engine.strategy(QStringLiteral("MAXIMIZE_REACH")).has_value());
    QCOMPARE(engine.learningMetrics().totalExperiencesDropped, qint64(1));
}

void TestQLearningEngine::testAutoProcessAtThreshold()
{
    crl::EngineConfig config = deterministicConfig();
    config.autoProcessThreshold = 3;
    crl::QLearningEngine engine(config);

    QVERIFY(!engine.addExperience(QStringLiteral("MAXIMIZE_CTR"),
                                  QStringLiteral("optimize_for_ctr"), 0.3)->batch.has_value());
    QVERIFY(!engine.addExperience(QStringLiteral("MAXIMIZE_CTR"),
                                  QStringLiteral("optimize_for_ctr"), 0.3)->batch.has_value());

    const auto third = engine.addExperience(QStringLiteral("MAXIMIZE_CTR"),
                                            QStringLiteral("optimize_for_ctr"), 0.3);
    QVERIFY(third.has_value());
    QVERIFY(third->batch.has_value());
    QCOMPARE(third->batch->experiencesProcessed, 3);
    QCOMPARE(engine.bufferStatus().activeSize, 0);
    QVERIFY(engine.strategy(QStringLiteral("MAXIMIZE_CTR")).has_value());
}

void TestQLearningEngine::testBatchStatsCountContextsNotExperiences()
{
    crl::QLearningEngine engine(deterministicConfig());
    engine.addExperience(QStringLiteral("MAXIMIZE_ROAS"), QStringLiteral("pause_campaign"), 0.2);
    engine.processExperiences();

    engine.addExperience(QStringLiteral("MAXIMIZE_ROAS"), QStringLiteral("pause_campaign"), 0.2);
    engine.addExperience(QStringLiteral("MAXIMIZE_ROAS"), QStringLiteral("optimize_for_ctr"), 0.1);
    engine.addExperience(QStringLiteral("MINIMIZE_CPA"), QStringLiteral("reduce_bid_conservative"), 0.4);
    engine.addExperience(QStringLiteral("MINIMIZE_CPA"), QStringLiteral("reduce_bid_conservative"), 0.4);

    const crl::BatchStats stats = engine.processExperiences();
    QCOMPARE(stats.experiencesProcessed, 4);
    QCOMPARE(stats.strategiesCreated, 1);
    QCOMPARE(stats.strategiesUpdated, 1);
    QCOMPARE(stats.totalStrategies, 2);
    QCOMPARE(stats.touchedContexts,
             (QStringList{QStringLiteral("MAXIMIZE_ROAS"), QStringLiteral("MINIMIZE_CPA")}));
}

void TestQLearningEngine::testExploitationAfterLearning()
{
    crl::QLearningEngine engine(deterministicConfig());
    engine.addExperience(QStringLiteral("MAXIMIZE_ROAS"), QStringLiteral("pause_campaign"), -0.4);
    engine.addExperience(QStringLiteral("MAXIMIZE_ROAS"),
                         QStringLiteral("focus_high_value_audiences"), 0.9);
    engine.processExperiences();

    const auto decision = engine.generateAction(QStringLiteral("maximize roas"));
    QVERIFY(decision.has_value());
    QCOMPARE(decision->path, crl::DecisionPath::Exploitation);
    QCOMPARE(decision->action, crl::ActionType::FocusHighValueAudiences);
    QCOMPARE(decision->normalizedContext, QStringLiteral("MAXIMIZE_ROAS"));
    QVERIFY(qFuzzyCompare(decision->confidence, 2.0 / 12.0));
    QVERIFY(decision->reasoning.startsWith(QStringLiteral("exploitation")));
}

void TestQLearningEngine::testHeuristicForUnknownContext()
{
    crl::QLearningEngine engine(deterministicConfig());

    crl::CampaignContext context;
    context.strategicContext = QStringLiteral("minimize cpa");
    crl::CampaignMetrics weak;
    weak.roas = 1.2;
    crl::CampaignMetrics strong;
    strong.roas = 3.5;

    for (int i = 0; i < 5; ++i) {
        const auto weakDecision = engine.generateAction(context, weak);
        QVERIFY(weakDecision.has_value());
        QCOMPARE(weakDecision->path, crl::DecisionPath::Heuristic);
        QCOMPARE(weakDecision->action, crl::ActionType::FocusHighValueAudiences);
        QCOMPARE(weakDecision->confidence, 0.0);

        const auto strongDecision = engine.generateAction(context, strong);
        QVERIFY(strongDecision.has_value());
        QCOMPARE(strongDecision->action, crl::ActionType::ReduceBidConservative);
    }

    QCOMPARE(crl::QLearningEngine::heuristicAction(QStringLiteral("BRAND_AWARENESS"),
                                                   crl::CampaignMetrics(), {}),
             crl::ActionType::ExpandReachCampaigns);
    QCOMPARE(crl::QLearningEngine::heuristicAction(QStringLiteral("MAXIMIZE_CONVERSIONS"),
                                                   crl::CampaignMetrics(), {}),
             crl::ActionType::IncreaseBidConversionKeywords);
    QCOMPARE(crl::QLearningEngine::heuristicAction(QStringLiteral("HOLIDAY_PUSH"),
                                                   crl::CampaignMetrics(), {}),
             crl::ActionType::OptimizeBiddingStrategy);
}

void TestQLearningEngine::testHeuristicFallsBackToFirstCandidate()
{
    const QVector<crl::ActionType> candidates = {crl::ActionType::AdjustTargetingNarrow,
                                                 crl::ActionType::PauseCampaign};
    QCOMPARE(crl::QLearningEngine::heuristicAction(QStringLiteral("MAXIMIZE_ROAS"),
                                                   crl::CampaignMetrics(), candidates),
             crl::ActionType::AdjustTargetingNarrow);
}

void TestQLearningEngine::testExploitationRespectsCandidates()
{
    crl::QLearningEngine engine(deterministicConfig());
    engine.addExperience(QStringLiteral("MAXIMIZE_ROAS"),
                         QStringLiteral("focus_high_value_audiences"), 0.9);
    engine.addExperience(QStringLiteral("MAXIMIZE_ROAS"), QStringLiteral("pause_campaign"), 0.1);
    engine.processExperiences();

    const auto restricted = engine.generateAction(QStringLiteral("MAXIMIZE_ROAS"),
                                                  {crl::ActionType::PauseCampaign});
    QVERIFY(restricted.has_value());
    QCOMPARE(restricted->path, crl::DecisionPath::Exploitation);
    QCOMPARE(restricted->action, crl::ActionType::PauseCampaign);

    const auto unseen = engine.generateAction(QStringLiteral("MAXIMIZE_ROAS"),
                                              {crl::ActionType::AdjustTargetingBroad});
    QVERIFY(unseen.has_value());
    QCOMPARE(unseen->path, crl::DecisionPath::Heuristic);
    QCOMPARE(unseen->action, crl::ActionType::AdjustTargetingBroad);
}

void TestQLearningEngine::testExplorationFrequency()
{
    crl::QLearningEngine engine(deterministicConfig(0.15));
    engine.addExperience(QStringLiteral("MAXIMIZE_ROAS"),
                         QStringLiteral("focus_high_value_audiences"), 0.9);
    engine.processExperiences();

    const int draws = 20000;
    int explored = 0;
    for (int i = 0; i < draws; ++i) {
        const auto decision = engine.generateAction(QStringLiteral("MAXIMIZE_ROAS"));
        QVERIFY(decision.has_value());
        if (decision->path == crl::DecisionPath::Exploration) {
            ++explored;
        } else {
            QCOMPARE(decision->path, crl::DecisionPath::Exploitation);
        }
    }

    const double rate = static_cast<double>(explored) / draws;
    QVERIFY2(qAbs(rate - 0.15) <= 0.02, qPrintable(QStringLiteral("rate=%1").arg(rate)));
    QCOMPARE(engine.learningMetrics().totalActionsGenerated, qint64(draws));
}

void TestQLearningEngine::testEmptyContextRejectedForAction()
{
    crl::QLearningEngine engine(deterministicConfig());
    crl::LearningError error;
    QVERIFY(!engine.generateAction(QStringLiteral("  "), {}, &error).has_value());
    QCOMPARE(error.code, crl::LearningErrorCode::InvalidContext);
    QCOMPARE(engine.learningMetrics().totalActionsGenerated, qint64(0));
}

void TestQLearningEngine::testStrategyLookupNormalizesKey()
{
    crl::QLearningEngine engine(deterministicConfig());
    engine.addExperience(QStringLiteral("brand awareness"),
                         QStringLiteral("expand_reach_campaigns"), 0.5);
    engine.processExperiences();

    QVERIFY(engine.strategy(QStringLiteral("BRAND_AWARENESS")).has_value());
    QVERIFY(engine.strategy(QStringLiteral("  Brand   Awareness ")).has_value());
    QVERIFY(!engine.strategy(QStringLiteral("MAXIMIZE_ROAS")).has_value());
    QVERIFY(!engine.strategy(QString()).has_value());
    QCOMPARE(engine.strategies().size(), 1);
}

void TestQLearningEngine::testPersistenceDeltaHandsOffOnce()
{
    crl::QLearningEngine engine(deterministicConfig());
    for (double reward : {0.8, 0.6, 0.9}) {
        engine.addExperience(QStringLiteral("MAXIMIZE_ROAS"),
                             QStringLiteral("focus_high_value_audiences"), reward);
    }
    engine.processExperiences();

    const crl::PersistenceDelta delta = engine.takePersistenceDelta();
    QCOMPARE(delta.strategies.size(), 1);
    QCOMPARE(delta.strategies.front().context, QStringLiteral("MAXIMIZE_ROAS"));
    QCOMPARE(delta.qEntries.size(), 1);
    QCOMPARE(delta.archived.size(), 3);
    QVERIFY(delta.hasActiveBuffer);
    QVERIFY(delta.activeBuffer.isEmpty());
    QCOMPARE(delta.historyCapacity, engine.config().maxHistoryBuffer);
    QVERIFY(delta.historyCutoff < QDateTime::currentDateTimeUtc());

    const crl::PersistenceDelta second = engine.takePersistenceDelta();
    QVERIFY(second.strategies.isEmpty());
    QVERIFY(second.qEntries.isEmpty());
    QVERIFY(second.archived.isEmpty());
    QVERIFY(!second.hasActiveBuffer);
    QVERIFY(second.sequence > delta.sequence);
}

void TestQLearningEngine::testRestoreStateRebuildsQValuesFromDetails()
{
    const QDateTime now = QDateTime::currentDateTimeUtc();
    crl::Strategy strategy;
    strategy.context = QStringLiteral("MINIMIZE_CPA");
    strategy.createdAt = now;
    strategy.recordOutcome(crl::ActionType::ReduceBidConservative, 0.12, 0.6, now);
    strategy.recordOutcome(crl::ActionType::PauseCampaign, -0.04, -0.4, now);

    crl::Experience pending;
    pending.id = QStringLiteral("pending-1");
    pending.context = QStringLiteral("MINIMIZE_CPA");
    pending.action = QStringLiteral("pause_campaign");
    pending.reward = 0.2;
    pending.timestamp = now;

    crl::QLearningEngine engine(deterministicConfig());
    engine.restoreState({strategy}, {}, {pending}, {});

    QVERIFY(qFuzzyCompare(engine.qValue(QStringLiteral("MINIMIZE_CPA"),
                                        crl::ActionType::ReduceBidConservative), 0.12));
    const auto restored = engine.strategy(QStringLiteral("MINIMIZE_CPA"));
    QVERIFY(restored.has_value());
    QCOMPARE(restored->bestAction, crl::ActionType::ReduceBidConservative);
    QCOMPARE(restored->totalExperiences, 2);
    QCOMPARE(engine.bufferStatus().activeSize, 1);

    const auto decision = engine.generateAction(QStringLiteral("MINIMIZE_CPA"));
    QCOMPARE(decision->path, crl::DecisionPath::Exploitation);
    QCOMPARE(decision->action, crl::ActionType::ReduceBidConservative);

    const crl::PersistenceDelta delta = engine.takePersistenceDelta();
    QVERIFY(delta.strategies.isEmpty());
    QVERIFY(!delta.hasActiveBuffer);
}

void TestQLearningEngine::testMalformedRestoredExperienceDroppedInBatch()
{
    const QDateTime now = QDateTime::currentDateTimeUtc();
    auto makePending = [&now](const QString& id, const QString& context,
                              const QString& action, double reward) {
        crl::Experience experience;
        experience.id = id;
        experience.context = context;
        experience.action = action;
        experience.reward = reward;
        experience.timestamp = now;
        return experience;
    };

    crl::QLearningEngine engine(deterministicConfig());
    engine.restoreState({}, {},
                        {makePending(QStringLiteral("good-1"), QStringLiteral("MAXIMIZE_ROAS"),
                                     QStringLiteral("focus_high_value_audiences"), 0.8),
                         makePending(QStringLiteral("bad"), QStringLiteral("MINIMIZE_CPA"),
                                     QStringLiteral("launch_fireworks"), 0.5),
                         makePending(QStringLiteral("good-2"), QStringLiteral("MAXIMIZE_ROAS"),
                                     QStringLiteral("focus_high_value_audiences"), 0.6)},
                        {});
    QCOMPARE(engine.activeSnapshot().size(), 3);

    const crl::BatchStats stats = engine.processExperiences();
    QCOMPARE(stats.experiencesProcessed, 2);
    QCOMPARE(stats.experiencesDropped, 1);
    QCOMPARE(stats.touchedContexts, QStringList{QStringLiteral("MAXIMIZE_ROAS")});

    QVERIFY(qFuzzyCompare(engine.qValue(QStringLiteral("MAXIMIZE_ROAS"),
                                        crl::ActionType::FocusHighValueAudiences),
                          0.1396));
    QVERIFY(!engine.strategy(QStringLiteral("MINIMIZE_CPA")).has_value());

    const crl::LearningMetrics metrics = engine.learningMetrics();
    QCOMPARE(metrics.qTableContexts, 1);
    QCOMPARE(metrics.totalExperiencesDropped, qint64(1));
    QCOMPARE(metrics.buffer.activeSize, 0);

    bool foundBad = false;
    for (const crl::Experience& experience : engine.historySnapshot()) {
        if (experience.id == QLatin1String("bad")) {
            foundBad = true;
            QCOMPARE(experience.state, crl::ExperienceState::Dropped);
            QCOMPARE(experience.dropReason, crl::kDropReasonValidation);
        } else {
            QCOMPARE(experience.state, crl::ExperienceState::Processed);
        }
    }
    QVERIFY(foundBad);
    QCOMPARE(engine.historySnapshot().size(), 3);
}

void TestQLearningEngine::testMetricsReportHyperparameters()
{
    crl::QLearningEngine engine(deterministicConfig());
    engine.addExperience(QStringLiteral("MAXIMIZE_ROAS"),
                         QStringLiteral("focus_high_value_audiences"), 0.8);
    engine.processExperiences();

    const QJsonObject json = engine.learningMetrics().toJson();
    QCOMPARE(json.value(QStringLiteral("total_strategies")).toInt(), 1);
    QCOMPARE(json.value(QStringLiteral("q_table_entries")).toInt(), 1);
    QCOMPARE(json.value(QStringLiteral("total_experiences_processed")).toInt(), 1);

    const QJsonObject hyper = json.value(QStringLiteral("hyperparameters")).toObject();
    QCOMPARE(hyper.value(QStringLiteral("learning_rate")).toDouble(), 0.1);
    QCOMPARE(hyper.value(QStringLiteral("discount_factor")).toDouble(), 0.95);
    QCOMPARE(hyper.value(QStringLiteral("exploration_rate")).toDouble(), 0.0);

    const QJsonObject buffer = json.value(QStringLiteral("buffer_status")).toObject();
    QCOMPARE(buffer.value(QStringLiteral("history_buffer_size")).toInt(), 1);
    QCOMPARE(buffer.value(QStringLiteral("active_buffer_max")).toInt(), 25);
}

QTEST_MAIN(TestQLearningEngine)
#include "test_q_learning_engine.moc"
