/**
 * @file testCartesianPathPlanner.cpp
 * @brief 笛卡尔路径规划器测试
 *
 * 测试内容：
 * 1. 直线采样点数与端点精确性
 * 2. 不可达采样点中止并报告索引
 * 3. 验证失败中止，不暴露部分路径
 * 4. 求解结果先钳制再验证
 * 5. 无效请求
 * 6. 异步规划
 *
 * @version 1.0.0
 * @date 2026-10-16
 */

#include <iostream>
#include <limits>

#include "ArmMotion/Types.hpp"
#include "ArmMotion/ArmConfig.hpp"
#include "ArmMotion/ApproxKinematics.hpp"
#include "ArmMotion/CartesianPathPlanner.hpp"
#include "TestSupport.hpp"

using namespace armmotion;
using namespace armmotion::test;

/**
 * @brief 测试1: 采样与端点
 */
void testSampling() {
    printSeparator("测试1: 直线采样");
    PlanarIKOracle oracle;
    CartesianPathPlanner planner(oracle);

    const CartesianPoint start(0.0, 0.25, 0.30);
    const CartesianPoint goal(0.15, 0.25, 0.25);

    PlanResult result = planner.plan(start, goal, 15);
    check(result.isSuccess(), "规划成功: " + result.statusString());
    check(result.path.size() == 16, "N=15 产生16个路径点");
    check(oracle.calls == 16, "每个采样点调用一次IK");
    check(result.oracleCalls == 16, "结果记录IK调用次数");
    if (result.path.size() == 16) {
        check(result.path.waypoints.front().point == start, "首点精确等于起点");
        check(result.path.waypoints.back().point == goal, "末点精确等于终点");
        checkNear(result.path.waypoints[5].t, 5.0 / 15.0, 1e-15, "采样参数 t = i/N");

        bool ordered = true;
        for (size_t i = 0; i < oracle.queries.size(); ++i) {
            if (!(oracle.queries[i] == result.path.waypoints[i].point)) ordered = false;
        }
        check(ordered, "IK按采样顺序依次调用");

        ApproxKinematics fk;
        CartesianPoint reached = fk.endEffector(result.path.finalJoints());
        check((reached - goal).norm() < 1e-6, "终点关节解的近似末端位置与目标一致");
    }
    check(result.failedIndex == -1, "成功时无失败索引");

    std::vector<CartesianPoint> one = CartesianPathPlanner::samplePoints(start, goal, 1);
    check(one.size() == 2 && one[0] == start && one[1] == goal, "N=1 只含两个端点");
    check(CartesianPathPlanner::samplePoints(start, goal, 0).empty(), "N=0 不产生采样点");

    PlanResult same = planner.plan(start, start, 4);
    check(same.isSuccess() && same.path.size() == 5, "起点等于终点时仍产生 N+1 个点");
}

/**
 * @brief 测试2: 不可达
 */
void testUnreachable() {
    printSeparator("测试2: 不可达采样点");
    PlanarIKOracle oracle;
    CartesianPathPlanner planner(oracle);

    // 沿y轴远离，第4个采样点 (索引3) 超出臂长
    PlanResult result = planner.plan(CartesianPoint(0.0, 0.25, 0.30), CartesianPoint(0.0, 2.0, 0.30), 15);
    std::cout << "  " << result.errorMessage << "\n";
    check(result.status == PlanStatus::Unreachable, "状态为 Unreachable");
    check(result.failedIndex == 3, "失败索引为 3");
    check(oracle.calls == 4, "失败后不再调用IK");
    check(result.path.empty(), "不返回部分路径");
    check(!result.errorMessage.empty(), "包含失败原因");
}

/**
 * @brief 测试3: 验证失败
 */
void testValidationFailure() {
    printSeparator("测试3: 采样点验证失败");
    int calls = 0;
    FunctionIKOracle oracle([&calls](const CartesianPoint& p) {
        ++calls;
        if (p.z() < 0.2) {
            // 大臂水平、小臂下垂: 腕部低于地面
            return IKSolution::solved(makeJoints({0, 90, 70, 0, 0, 0}));
        }
        return IKSolution::solved(JointVector::Zero());
    });
    CartesianPathPlanner planner(oracle);

    PlanResult result = planner.plan(CartesianPoint(0, 0.2, 0.4), CartesianPoint(0, 0.2, 0.0), 4);
    check(result.status == PlanStatus::ValidationFailed, "状态为 ValidationFailed");
    check(result.failedIndex == 3, "失败索引为 3 (z = 0.1)");
    check(calls == 4, "失败后不再调用IK");
    check(result.verdict.has(ViolationRule::GroundPenetration), "判定包含地面穿透");
    check(result.path.empty(), "不返回部分路径");
    checkNear(result.failedPoint.z(), 0.1, 1e-12, "记录失败采样点");

    FunctionIKOracle nanOracle([](const CartesianPoint&) {
        JointVector q = JointVector::Zero();
        q[kShoulder] = std::numeric_limits<double>::quiet_NaN();
        return IKSolution::solved(q);
    });
    CartesianPathPlanner nanPlanner(nanOracle);
    PlanResult nanResult = nanPlanner.plan(CartesianPoint(0, 0.2, 0.3), CartesianPoint(0, 0.25, 0.3), 3);
    check(nanResult.status == PlanStatus::ValidationFailed && nanResult.failedIndex == 0,
          "非有限解在首点即失败");
    check(nanResult.verdict.has(ViolationRule::NotANumber), "判定包含 NotANumber");
}

/**
 * @brief 测试4: 求解结果被钳制
 */
void testSolutionsAreClamped() {
    printSeparator("测试4: IK解先钳制再验证");
    FunctionIKOracle oracle([](const CartesianPoint&) {
        return IKSolution::solved(makeJoints({0, -30, 200, 0, 0, 0}));
    });
    CartesianPathPlanner planner(oracle);

    PlanResult result = planner.plan(CartesianPoint(0, 0.2, 0.3), CartesianPoint(0, 0.25, 0.3), 2);
    check(result.isSuccess(), "钳制后的解通过验证");
    if (result.isSuccess()) {
        checkNear(result.path.finalJoints()[kElbow], 125.0, 1e-12, "小臂被钳制到前倾上限");
        check(planner.enforcer().isWithinLimits(result.path.finalJoints()), "路径点满足单关节限位");
    }

    FunctionIKOracle unbound(FunctionIKOracle::SolveFunction{});
    CartesianPathPlanner unboundPlanner(unbound);
    check(unboundPlanner.plan(CartesianPoint(0, 0.2, 0.3), CartesianPoint(0, 0.25, 0.3), 2).status ==
          PlanStatus::Unreachable, "未绑定求解函数视为不可达");
}

/**
 * @brief 测试5: 无效请求
 */
void testInvalidRequests() {
    printSeparator("测试5: 无效请求");
    PlanarIKOracle oracle;
    CartesianPathPlanner planner(oracle);

    PlanResult zero = planner.plan(CartesianPoint(0, 0.2, 0.3), CartesianPoint(0, 0.25, 0.3), 0);
    check(zero.status == PlanStatus::InvalidRequest, "samples=0 为无效请求");

    const double nan = std::numeric_limits<double>::quiet_NaN();
    PlanResult bad = planner.plan(CartesianPoint(nan, 0.2, 0.3), CartesianPoint(0, 0.25, 0.3), 5);
    check(bad.status == PlanStatus::InvalidRequest, "非有限起点为无效请求");
    check(oracle.calls == 0, "无效请求不调用IK");
}

/**
 * @brief 测试6: 异步规划
 */
void testPlanAsync() {
    printSeparator("测试6: 异步规划");
    PlanarIKOracle oracle;
    CartesianPathPlanner planner(oracle);

    const CartesianPoint start(-0.15, 0.25, 0.25);
    const CartesianPoint goal(0.15, 0.25, 0.25);
    std::future<PlanResult> pending = planner.planAsync(start, goal);
    PlanResult async = pending.get();
    PlanResult sync = planner.plan(start, goal);

    check(async.isSuccess(), "异步规划成功");
    check(async.path.size() == static_cast<size_t>(CartesianPathPlanner::kDefaultSamples + 1),
          "默认采样段数 15");
    check(async.path.size() == sync.path.size() &&
          utils::nearlyEqual(async.path.finalJoints(), sync.path.finalJoints(), 0.0),
          "异步与同步结果一致");
}

int main() {
    std::cout << "\n";
    printSeparator("笛卡尔路径规划器测试");

    testSampling();
    testUnreachable();
    testValidationFailure();
    testSolutionsAreClamped();
    testInvalidRequests();
    testPlanAsync();

    return summary("CartesianPathPlanner");
}
