/**
 * @file CollisionValidator.hpp
 * @brief 碰撞验证器 - 限位检查 + 地面/底座碰撞检查
 *
 * 与 JointSafetyEnforcer 使用同一套规则，但只报告不校正。
 * 所有违规项都会被收集 (不短路)，便于调用方完整记录原因。
 *
 * @version 1.0.0
 * @date 2026-10-16
 */

#pragma once

#include "Types.hpp"
#include "ArmConfig.hpp"
#include "ApproxKinematics.hpp"

#include <string>
#include <vector>

namespace armmotion {

/**
 * @brief 违规规则
 */
enum class ViolationRule {
    NotANumber,          // 关节值非数值
    JointBelowMin,       // 低于单关节下限
    JointAboveMax,       // 高于单关节上限
    ShoulderElbowSum,    // 大臂+小臂角度和越界
    ElbowForward,        // 小臂前倾超限
    WristCoupled,        // 腕部组合超限
    GroundPenetration,   // 关键点低于地面
    PedestalCollision    // 关键点进入底座包络
};

inline const char* violationRuleString(ViolationRule rule) {
    switch (rule) {
        case ViolationRule::NotANumber: return "NotANumber";
        case ViolationRule::JointBelowMin: return "JointBelowMin";
        case ViolationRule::JointAboveMax: return "JointAboveMax";
        case ViolationRule::ShoulderElbowSum: return "ShoulderElbowSum";
        case ViolationRule::ElbowForward: return "ElbowForward";
        case ViolationRule::WristCoupled: return "WristCoupled";
        case ViolationRule::GroundPenetration: return "GroundPenetration";
        case ViolationRule::PedestalCollision: return "PedestalCollision";
        default: return "Unknown";
    }
}

/**
 * @brief 单条违规记录
 */
struct Violation {
    ViolationRule rule = ViolationRule::NotANumber;
    int joint = -1;          // 关节索引；耦合/几何规则为-1
    int keyPoint = -1;       // 几何规则对应的关键点
    double observed = 0.0;   // 实测值 (deg 或 m)
    double bound = 0.0;      // 被违反的边界

    std::string describe() const {
        std::ostringstream os;
        os << violationRuleString(rule);
        if (joint >= 0) os << "(" << jointName(joint) << ")";
        if (keyPoint >= 0) os << "(" << keyPointName(keyPoint) << ")";
        os << " observed=" << observed << " bound=" << bound;
        return os.str();
    }
};

/**
 * @brief 安全判定结果
 */
struct SafetyVerdict {
    bool ok = true;
    std::vector<Violation> violations;

    void add(const Violation& v) {
        violations.push_back(v);
        ok = false;
    }

    bool has(ViolationRule rule) const {
        for (const auto& v : violations) {
            if (v.rule == rule) return true;
        }
        return false;
    }

    std::string summary() const {
        if (ok) return "OK";
        std::string text;
        for (size_t i = 0; i < violations.size(); ++i) {
            if (i > 0) text += "; ";
            text += violations[i].describe();
        }
        return text;
    }
};

class CollisionValidator {
public:
    explicit CollisionValidator(const ArmConfig& config = ArmConfig::defaultArm())
        : config_(config), kinematics_(config.links) {}

    /**
     * @brief 检查关节配置
     * @param angles 关节角 (deg)
     * @return 判定结果，包含全部违规项
     */
    SafetyVerdict check(const JointVector& angles) const {
        SafetyVerdict verdict;
        checkJointBounds(angles, verdict);
        checkCoupling(angles, verdict);

        // 含NaN时几何计算无意义
        if (utils::allFinite(angles)) {
            checkGeometry(angles, verdict);
        }
        return verdict;
    }

    const ArmConfig& config() const { return config_; }
    const ApproxKinematics& kinematics() const { return kinematics_; }

private:
    void checkJointBounds(const JointVector& q, SafetyVerdict& verdict) const {
        const JointLimits& lim = config_.limits;
        for (int i = 0; i < kNumJoints; ++i) {
            if (std::isnan(q[i])) {
                verdict.add({ViolationRule::NotANumber, i, -1, q[i], lim.jointMin[i]});
            } else if (q[i] < lim.jointMin[i]) {
                verdict.add({ViolationRule::JointBelowMin, i, -1, q[i], lim.jointMin[i]});
            } else if (q[i] > lim.jointMax[i]) {
                verdict.add({ViolationRule::JointAboveMax, i, -1, q[i], lim.jointMax[i]});
            }
        }
    }

    void checkCoupling(const JointVector& q, SafetyVerdict& verdict) const {
        const JointLimits& lim = config_.limits;
        const double tol = lim.couplingTolerance;

        double sum = q[kShoulder] + q[kElbow];
        if (sum > lim.shoulderElbowMax + tol) {
            verdict.add({ViolationRule::ShoulderElbowSum, -1, -1, sum, lim.shoulderElbowMax});
        } else if (sum < lim.shoulderElbowMin - tol) {
            verdict.add({ViolationRule::ShoulderElbowSum, -1, -1, sum, lim.shoulderElbowMin});
        }

        if (q[kElbow] > lim.elbowForwardMax) {
            verdict.add({ViolationRule::ElbowForward, kElbow, -1, q[kElbow], lim.elbowForwardMax});
        }

        double combined = std::abs(q[kWristRoll]) + std::abs(q[kWristPitch]);
        if (combined > lim.wristCoupledLimit + tol) {
            verdict.add({ViolationRule::WristCoupled, -1, -1, combined, lim.wristCoupledLimit});
        }
    }

    void checkGeometry(const JointVector& q, SafetyVerdict& verdict) const {
        const CollisionEnvelope& env = config_.envelope;
        const double pedestalTop = config_.links.baseHeight + env.pedestalClearance;

        ApproxKinematics::KeyPoints points = kinematics_.forwardPositions(q);
        for (int k = 0; k < static_cast<int>(points.size()); ++k) {
            const KeyPoint& p = points[k];
            if (p.z < env.groundZ) {
                verdict.add({ViolationRule::GroundPenetration, -1, k, p.z, env.groundZ});
            }
            if (p.z < pedestalTop && p.radial < env.pedestalRadius) {
                verdict.add({ViolationRule::PedestalCollision, -1, k, p.radial, env.pedestalRadius});
            }
        }
    }

    ArmConfig config_;
    ApproxKinematics kinematics_;
};

} // namespace armmotion
