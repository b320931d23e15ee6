#include "core/learning/reward_calculator.h"

#include <algorithm>
#include <cmath>

namespace crl {

double RewardCalculator::forCompletedRequest(bool success, const RewardSignals& rewardSignals)
{
    double reward = success ? kSuccessBase : -kSuccessBase;
    reward += roasAdjustment(rewardSignals.roas);

    if (rewardSignals.ctr > kCtrHigh) {
        reward += kCtrAdjustment;
    } else if (rewardSignals.ctr < kCtrLow) {
        reward -= kCtrAdjustment;
    }

    // Conversions only ever add.
    if (rewardSignals.conversions > kConversionsBonusThreshold) {
        reward += kConversionsBonus;
    }
    return clamp(reward);
}

double RewardCalculator::forPerformanceUpdate(bool improvement, const RewardSignals& rewardSignals)
{
    const double base = improvement ? kImprovementBase : kNoImprovementBase;
    return clamp(base + roasAdjustment(rewardSignals.roas));
}

double RewardCalculator::forExplicitFeedback(double reward)
{
    return clamp(reward);
}

double RewardCalculator::clamp(double reward)
{
    if (std::isnan(reward)) {
        return 0.0;
    }
    return std::clamp(reward, -1.0, 1.0);
}

double RewardCalculator::roasAdjustment(double roas)
{
    if (roas > kRoasHigh) {
        return kRoasAdjustment;
    }
    if (roas < kRoasLow) {
        return -kRoasAdjustment;
    }
    return 0.0;
}

} // namespace crl
