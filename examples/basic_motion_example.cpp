/**
 * @file basic_motion_example.cpp
 * @brief 基础运动示例 | Basic Motion Example
 *
 * 关节运动 -> 笛卡尔预置位置 -> 动作序列，在仿真模式下以固定周期推进控制循环。
 */

#include "ArmMotion/MotionController.hpp"

#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <thread>

using namespace armmotion;

namespace {

/// 与近似运动学同一模型的平面两连杆IK
IKSolution planarIK(const CartesianPoint& p) {
    const LinkLengths links;
    const double l1 = links.linkA();
    const double l2 = links.linkB() + links.linkC();
    const double r = std::hypot(p.x(), p.y());
    const double h = p.z() - links.baseHeight;
    const double d = std::hypot(r, h);
    if (d > l1 + l2 + 1e-9 || d < std::abs(l1 - l2) - 1e-9) {
        return IKSolution::unreachable("out of reach");
    }

    double c = std::clamp((d * d - l1 * l1 - l2 * l2) / (2.0 * l1 * l2), -1.0, 1.0);
    double elbow = std::acos(c);
    double shoulder = std::atan2(r, h) - std::atan2(l2 * std::sin(elbow), l1 + l2 * std::cos(elbow));

    JointVector q = JointVector::Zero();
    q[kBase] = r < 1e-12 ? 0.0 : std::atan2(p.x(), p.y()) * utils::kRadToDeg;
    q[kShoulder] = shoulder * utils::kRadToDeg;
    q[kElbow] = elbow * utils::kRadToDeg;
    return IKSolution::solved(q);
}

/// 以 20ms 周期推进直到空闲
void runLoop(MotionController& controller) {
    const auto period = std::chrono::milliseconds(20);
    while (controller.isMoving() || controller.isPlaying()) {
        controller.tick();
        std::this_thread::sleep_for(period);
    }
}

} // namespace

int main() {
    std::cout << "╔══════════════════════════════════════════════════════════╗\n";
    std::cout << "║   ArmMotion - Basic Motion Example                       ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════╝\n\n";

    // 1. 创建控制器 (环境变量可覆盖配置)
    FunctionIKOracle oracle(planarIK);
    EngineConfig config = EngineConfig::fromEnvironment();
    config.defaultMoveDurationMs = 500.0;
    config.cartesianMoveDurationMs = 800.0;
    MotionController controller(oracle, config);
    std::cout << "📦 控制模式: " << controlModeString(config.controlMode) << "\n\n";

    // 2. 关节空间运动
    JointVector target = makeJoints({30, 20, 40, 0, 10, 0});
    std::cout << "🎯 关节目标 (deg): " << utils::formatJoints(target) << "\n";
    MoveResult move = controller.moveToJoints(target);
    if (!move.isSuccess()) {
        std::cerr << "❌ 关节运动失败: " << move.statusString() << " " << move.errorMessage << "\n";
        return 1;
    }
    runLoop(controller);
    std::cout << "✅ 到达: " << utils::formatJoints(controller.commanded()) << "\n\n";

    // 3. 不安全目标被拒绝
    MoveResult unsafe = controller.moveToJoints(makeJoints({0, -20, -135, 0, -90, 0}));
    std::cout << "🛡  不安全目标: " << unsafe.statusString() << " (" << unsafe.errorMessage << ")\n\n";

    // 4. 笛卡尔预置位置
    for (const char* name : {"home", "left", "right", "pickup"}) {
        auto startTime = std::chrono::high_resolution_clock::now();
        MoveResult result = controller.moveToPreset(name);
        auto endTime = std::chrono::high_resolution_clock::now();
        double planningTime = std::chrono::duration<double, std::milli>(endTime - startTime).count();

        if (!result.isSuccess()) {
            std::cout << "❌ " << name << ": " << result.statusString() << "\n";
            continue;
        }
        runLoop(controller);
        std::cout << "✅ " << std::left << std::setw(7) << name
                  << " 规划 " << std::fixed << std::setprecision(2) << planningTime << " ms"
                  << "  末端 " << utils::formatPoint(controller.kinematics().endEffector(controller.commanded()))
                  << "\n";
    }
    std::cout << "\n";

    // 5. 动作序列
    std::cout << "🚀 播放 pick_demo...\n";
    PlayResult play = controller.playAction("pick_demo");
    if (!play.isSuccess()) {
        std::cerr << "❌ 播放失败: " << play.statusString() << "\n";
        return 1;
    }
    runLoop(controller);

    std::cout << "\n═══════════════════════════════════════════════════════════\n";
    const DispatchStats& stats = controller.dispatcher().stats();
    std::cout << "   ├─ 结束方式: " << playbackOutcomeString(controller.player().lastOutcome()) << "\n";
    std::cout << "   ├─ 下发次数: " << stats.total() << " (仿真 " << stats.simulated
              << ", 实机 " << stats.sent << ")\n";
    std::cout << "   └─ 夹爪指令: " << stats.gripperCommands << "\n";
    std::cout << "═══════════════════════════════════════════════════════════\n";

    return 0;
}
