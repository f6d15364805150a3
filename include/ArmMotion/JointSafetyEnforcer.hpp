/**
 * @file JointSafetyEnforcer.hpp
 * @brief 关节安全钳制器 - 单关节限位 + 耦合限位校正
 *
 * 无状态纯函数：任意实数6维输入 → 满足全部单关节限位的关节向量。
 * 耦合规则按固定顺序单遍校正 (大臂小臂和 → 小臂前倾 → 腕部组合)，
 * 不迭代到不动点。
 *
 * @version 1.0.0
 * @date 2026-10-16
 */

#pragma once

#include "Types.hpp"
#include "ArmConfig.hpp"

namespace armmotion {

class JointSafetyEnforcer {
public:
    explicit JointSafetyEnforcer(const JointLimits& limits = JointLimits())
        : limits_(limits) {}

    /**
     * @brief 钳制关节向量
     * @param raw 原始关节角 (deg)，NaN视为该关节最小值
     * @return 安全关节角 (deg)
     */
    JointVector clamp(const JointVector& raw) const {
        JointVector q;

        // 1. 单关节限位
        for (int i = 0; i < kNumJoints; ++i) {
            double value = std::isnan(raw[i]) ? limits_.jointMin[i] : raw[i];
            q[i] = std::clamp(value, limits_.jointMin[i], limits_.jointMax[i]);
        }

        const double tol = limits_.couplingTolerance;

        // 2. 大臂+小臂角度和，只调整小臂
        double sum = q[kShoulder] + q[kElbow];
        if (sum > limits_.shoulderElbowMax + tol) {
            q[kElbow] = limits_.shoulderElbowMax - q[kShoulder];
        } else if (sum < limits_.shoulderElbowMin - tol) {
            q[kElbow] = limits_.shoulderElbowMin - q[kShoulder];
        }
        q[kElbow] = clampJoint(kElbow, q[kElbow]);

        // 3. 小臂前倾上限
        if (q[kElbow] > limits_.elbowForwardMax) {
            q[kElbow] = limits_.elbowForwardMax;
        }

        // 4. 腕部组合限位，两个关节各承担一半超出量
        double combined = std::abs(q[kWristRoll]) + std::abs(q[kWristPitch]);
        if (combined > limits_.wristCoupledLimit + tol) {
            double half = 0.5 * (combined - limits_.wristCoupledLimit);
            q[kWristRoll] = clampJoint(kWristRoll, towardZero(q[kWristRoll], half));
            q[kWristPitch] = clampJoint(kWristPitch, towardZero(q[kWristPitch], half));
        }

        return q;
    }

    /// 是否满足全部单关节限位 (NaN不满足)
    bool isWithinLimits(const JointVector& q) const {
        for (int i = 0; i < kNumJoints; ++i) {
            if (std::isnan(q[i])) return false;
            if (q[i] < limits_.jointMin[i] || q[i] > limits_.jointMax[i]) return false;
        }
        return true;
    }

    /// 是否满足全部耦合规则
    bool satisfiesCoupling(const JointVector& q) const {
        const double tol = limits_.couplingTolerance;
        double sum = q[kShoulder] + q[kElbow];
        if (sum > limits_.shoulderElbowMax + tol || sum < limits_.shoulderElbowMin - tol) {
            return false;
        }
        if (q[kElbow] > limits_.elbowForwardMax) return false;
        double combined = std::abs(q[kWristRoll]) + std::abs(q[kWristPitch]);
        return combined <= limits_.wristCoupledLimit + tol;
    }

    const JointLimits& limits() const { return limits_; }

private:
    double clampJoint(int joint, double value) const {
        return std::clamp(value, limits_.jointMin[joint], limits_.jointMax[joint]);
    }

    /// 向零收缩，不越过零点
    static double towardZero(double value, double amount) {
        if (value > 0.0) return std::max(0.0, value - amount);
        if (value < 0.0) return std::min(0.0, value + amount);
        return 0.0;
    }

    JointLimits limits_;
};

} // namespace armmotion
