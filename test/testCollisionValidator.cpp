/**
 * @file testCollisionValidator.cpp
 * @brief 近似正运动学与碰撞验证器测试
 *
 * 测试内容：
 * 1. 关键点位置 (零位竖直 / 水平伸展)
 * 2. 零位通过全部检查
 * 3. 限位与耦合违规只报告不校正，且全部收集
 * 4. 地面穿透与底座碰撞
 * 5. 钳制输出不再出现限位类违规
 *
 * @version 1.0.0
 * @date 2026-10-16
 */

#include <iostream>
#include <limits>
#include <random>

#include "ArmMotion/Types.hpp"
#include "ArmMotion/ArmConfig.hpp"
#include "ArmMotion/ApproxKinematics.hpp"
#include "ArmMotion/JointSafetyEnforcer.hpp"
#include "ArmMotion/CollisionValidator.hpp"
#include "TestSupport.hpp"

using namespace armmotion;
using namespace armmotion::test;

namespace {

int countRule(const SafetyVerdict& verdict, ViolationRule rule) {
    int n = 0;
    for (const auto& v : verdict.violations) {
        if (v.rule == rule) ++n;
    }
    return n;
}

} // namespace

/**
 * @brief 测试1: 近似正运动学
 */
void testForwardPositions() {
    printSeparator("测试1: 近似正运动学关键点");
    ApproxKinematics fk;

    auto upright = fk.forwardPositions(JointVector::Zero());
    checkNear(upright[kElbowPoint].z, 0.396, 1e-12, "零位肘部高度 = 基座高 + 连杆A");
    checkNear(upright[kWristPoint].z, 0.581, 1e-12, "零位腕部高度");
    checkNear(upright[kEndEffectorPoint].z, 0.706, 1e-12, "零位末端高度");
    checkNear(upright[kEndEffectorPoint].radial, 0.0, 1e-12, "零位末端在竖直轴上");

    // 基座90°, 大臂90°: 沿x轴水平伸展
    auto level = fk.forwardPositions(makeJoints({90, 90, 0, 0, 0, 0}));
    checkNear(level[kEndEffectorPoint].x, fk.maxReach(), 1e-9, "水平伸展时末端x = 总臂长");
    checkNear(level[kEndEffectorPoint].y, 0.0, 1e-9, "基座90°时y为0");
    checkNear(level[kEndEffectorPoint].z, 0.166, 1e-9, "水平伸展时末端高度 = 基座高");
    checkNear(level[kElbowPoint].radial, 0.23, 1e-9, "肘部径向距离 = 连杆A");

    // 腕部旋转与末端关节不影响位置
    CartesianPoint a = fk.endEffector(makeJoints({30, 20, 40, 0, 10, 0}));
    CartesianPoint b = fk.endEffector(makeJoints({30, 20, 40, 120, 10, -90}));
    check((a - b).norm() < 1e-12, "腕部旋转与末端关节被忽略");

    checkNear(fk.maxReach(), 0.54, 1e-12, "总臂长 0.54 m");
}

/**
 * @brief 测试2: 零位
 */
void testHomePoseClean() {
    printSeparator("测试2: 零位无违规");
    CollisionValidator validator;
    SafetyVerdict verdict = validator.check(JointVector::Zero());
    check(verdict.ok, "零位通过检查");
    check(verdict.violations.empty(), "零位无违规项");
    check(verdict.summary() == "OK", "摘要为 OK");
}

/**
 * @brief 测试3: 限位与耦合违规
 */
void testBoundViolations() {
    printSeparator("测试3: 限位与耦合违规收集");
    CollisionValidator validator;

    JointVector raw = makeJoints({0, -30, 200, 0, 0, 0});
    SafetyVerdict verdict = validator.check(raw);
    std::cout << "  " << verdict.summary() << "\n";
    check(!verdict.ok, "(-30, 200) 判定为不安全");
    check(verdict.has(ViolationRule::ShoulderElbowSum), "报告大臂+小臂和越界");
    check(verdict.has(ViolationRule::JointAboveMax), "同时报告小臂单关节越界");
    check(verdict.has(ViolationRule::ElbowForward), "同时报告小臂前倾越界");
    for (const auto& v : verdict.violations) {
        if (v.rule == ViolationRule::ShoulderElbowSum) {
            checkNear(v.observed, 170.0, 1e-12, "记录实测和 170");
            checkNear(v.bound, 160.0, 0.0, "记录上限 160");
            check(v.joint == -1, "耦合规则关节索引为 -1");
        }
    }

    SafetyVerdict inside = validator.check(makeJoints({0, 60, 100, 0, 0, 0}));
    check(!inside.has(ViolationRule::ShoulderElbowSum), "和恰为160不报告");

    SafetyVerdict low = validator.check(makeJoints({0, -90, -75, 0, 0, 0}));
    check(low.has(ViolationRule::ShoulderElbowSum), "和为-165报告越下限");

    SafetyVerdict wrist = validator.check(makeJoints({0, 0, 0, 150, 60, 0}));
    check(countRule(wrist, ViolationRule::WristCoupled) == 1, "报告腕部组合越界");

    const double nan = std::numeric_limits<double>::quiet_NaN();
    SafetyVerdict nanVerdict = validator.check(makeJoints({0, 0, nan, 0, 0, 0}));
    check(countRule(nanVerdict, ViolationRule::NotANumber) == 1, "NaN 单独报告");
    check(!nanVerdict.has(ViolationRule::GroundPenetration) &&
          !nanVerdict.has(ViolationRule::PedestalCollision), "含NaN时跳过几何检查");

    // 只报告不校正: 输入保持不变
    check(raw[kElbow] == 200.0, "检查不修改输入");
}

/**
 * @brief 测试4: 几何碰撞
 */
void testGeometry() {
    printSeparator("测试4: 地面穿透与底座碰撞");
    CollisionValidator validator;

    // 大臂水平, 小臂向下: 腕部与末端低于地面
    SafetyVerdict ground = validator.check(makeJoints({0, 90, 70, 0, 0, 0}));
    std::cout << "  " << ground.summary() << "\n";
    check(countRule(ground, ViolationRule::GroundPenetration) == 2, "腕部与末端均穿透地面");
    check(ground.violations.size() == 2, "没有其他违规项");
    bool wristReported = false;
    for (const auto& v : ground.violations) {
        if (v.keyPoint == kWristPoint) wristReported = true;
    }
    check(wristReported, "违规记录指明腕部关键点");

    // 小臂后折, 末端回到底座上方
    SafetyVerdict pedestal = validator.check(makeJoints({0, -20, -135, 0, -90, 0}));
    std::cout << "  " << pedestal.summary() << "\n";
    check(countRule(pedestal, ViolationRule::PedestalCollision) == 1, "末端进入底座包络");
    check(pedestal.violations.size() == 1, "限位与耦合均合法");
    check(pedestal.violations.front().keyPoint == kEndEffectorPoint, "违规关键点为末端");

    // 放宽包络后同一姿态合法
    ArmConfig relaxed = ArmConfig::defaultArm();
    relaxed.envelope.pedestalRadius = 0.02;
    CollisionValidator relaxedValidator(relaxed);
    check(relaxedValidator.check(makeJoints({0, -20, -135, 0, -90, 0})).ok,
          "缩小底座半径后通过");
}

/**
 * @brief 测试5: 钳制输出与验证器规则一致
 */
void testClampAgreesWithValidator() {
    printSeparator("测试5: 钳制输出不含限位类违规");
    JointSafetyEnforcer enforcer;
    CollisionValidator validator;

    std::mt19937 gen(7);
    std::uniform_real_distribution<double> dist(-300.0, 300.0);

    const int trials = 2000;
    int boundClean = 0;
    for (int t = 0; t < trials; ++t) {
        JointVector raw;
        for (int i = 0; i < kNumJoints; ++i) raw[i] = dist(gen);
        SafetyVerdict verdict = validator.check(enforcer.clamp(raw));

        bool onlyGeometric = true;
        for (const auto& v : verdict.violations) {
            if (v.rule != ViolationRule::GroundPenetration &&
                v.rule != ViolationRule::PedestalCollision) {
                onlyGeometric = false;
            }
        }
        if (onlyGeometric) ++boundClean;
    }
    check(boundClean == trials, "钳制后只可能剩下几何违规");
}

int main() {
    std::cout << "\n";
    printSeparator("碰撞验证器测试");

    testForwardPositions();
    testHomePoseClean();
    testBoundViolations();
    testGeometry();
    testClampAgreesWithValidator();

    return summary("CollisionValidator");
}
