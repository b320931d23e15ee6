#pragma once

#include <cstdint>

namespace crl {

// Subset of reported campaign metrics that shapes rewards. Absent metrics
// stay at 0 and therefore count as poor performance.
struct RewardSignals {
    double roas = 0.0;
    double ctr = 0.0;
    int64_t conversions = 0;
};

// RewardCalculator -- maps outcome events to rewards in [-1, 1].
class RewardCalculator {
public:
    static constexpr double kSuccessBase = 0.5;
    static constexpr double kImprovementBase = 0.5;
    static constexpr double kNoImprovementBase = -0.3;

    static constexpr double kRoasHigh = 3.0;
    static constexpr double kRoasLow = 1.0;
    static constexpr double kRoasAdjustment = 0.3;
    static constexpr double kCtrHigh = 2.5;
    static constexpr double kCtrLow = 0.8;
    static constexpr double kCtrAdjustment = 0.2;
    static constexpr int64_t kConversionsBonusThreshold = 30;
    static constexpr double kConversionsBonus = 0.1;

    // traffic.request_completed: +/-0.5 base, then ROAS, CTR and
    // conversion adjustments.
    static double forCompletedRequest(bool success, const RewardSignals& rewardSignals);

    // campaign.performance_updated: +0.5 on improvement, -0.3 otherwise,
    // then the ROAS adjustment.
    static double forPerformanceUpdate(bool improvement, const RewardSignals& rewardSignals);

    // rl.strategy_feedback: caller supplied reward. NaN maps to 0.
    static double forExplicitFeedback(double reward);

    static double clamp(double reward);

private:
    static double roasAdjustment(double roas);
};

} // namespace crl
