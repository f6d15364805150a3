/**
 * @file MotionController.hpp
 * @brief 运动控制器 - 顶层接口
 *
 * 整合所有子模块，作为控制循环中唯一的写入者：
 * - 关节空间运动 / 单关节设置 / 键盘点动
 * - 笛卡尔直线运动与预置位置
 * - 动作序列播放
 * - 急停 (锁存，需手动复位)
 *
 * 所有运动进度都在 tick() 中推进。
 *
 * @version 1.0.0
 * @date 2026-10-16
 */

#pragma once

#include "Types.hpp"
#include "ArmConfig.hpp"
#include "JointSafetyEnforcer.hpp"
#include "ApproxKinematics.hpp"
#include "CollisionValidator.hpp"
#include "HardwareInterface.hpp"
#include "CartesianPathPlanner.hpp"
#include "TrajectoryExecutor.hpp"
#include "ActionSequencePlayer.hpp"

#include <iostream>
#include <map>
#include <optional>
#include <string>

namespace armmotion {

/// 运动指令状态
enum class MoveStatus {
    Success,            // 已开始执行
    ValidationFailed,   // 目标不安全，未下发
    Unreachable,        // 笛卡尔目标不可达
    InvalidRequest,     // 参数无效
    EmergencyStopped    // 急停锁存中，拒绝运动
};

/**
 * @brief 运动指令结果
 */
struct MoveResult {
    MoveStatus status = MoveStatus::InvalidRequest;
    JointVector target = JointVector::Zero();   // 钳制后的目标
    TrajectoryHandle handle;
    SafetyVerdict verdict;
    int failedSample = -1;                      // 笛卡尔规划失败的采样点
    std::string errorMessage;

    bool isSuccess() const { return status == MoveStatus::Success; }

    std::string statusString() const {
        switch (status) {
            case MoveStatus::Success: return "Success";
            case MoveStatus::ValidationFailed: return "Validation Failed";
            case MoveStatus::Unreachable: return "Unreachable";
            case MoveStatus::InvalidRequest: return "Invalid Request";
            case MoveStatus::EmergencyStopped: return "Emergency Stopped";
            default: return "Unknown";
        }
    }
};

/**
 * @brief 运动控制器
 */
class MotionController {
public:
    // 禁止复制和移动，避免内部引用悬空
    MotionController(const MotionController&) = delete;
    MotionController& operator=(const MotionController&) = delete;
    MotionController(MotionController&&) = delete;
    MotionController& operator=(MotionController&&) = delete;

    /**
     * @brief 构造函数
     * @param oracle 外部IK求解器 (不拥有)
     * @param config 引擎配置
     * @param clock 时间源 [ms]
     */
    explicit MotionController(IKOracle& oracle,
                              const EngineConfig& config = EngineConfig::defaultConfig(),
                              TrajectoryExecutor::TimeSource clock = TrajectoryExecutor::steadyClockMs())
        : config_(config),
          enforcer_(config.arm.limits),
          kinematics_(config.arm.links),
          validator_(config.arm),
          dispatcher_(config.arm.limits, config.controlMode, config.verbose),
          planner_(oracle, config.arm, config.verbose),
          executor_(JointVector::Zero(), std::move(clock)),
          player_(executor_, config.arm) {
        executor_.setStreamEveryTick(config.streamEveryTick);
        executor_.setVerbose(config.verbose);
        executor_.setDispatchSink([this](const JointVector& q) {
            lastDispatchStatus_ = dispatcher_.dispatch(q);
        });

        player_.setVerbose(config.verbose);
        player_.setGripperSink([this](bool open) {
            lastDispatchStatus_ = dispatcher_.dispatchGripper(open);
        });

        if (config_.verbose) {
            std::cout << "[MotionController] 初始化完成, 模式: "
                      << controlModeString(config_.controlMode)
                      << ", 采样段数: " << config_.pathSamples << std::endl;
        }
    }

    // ========================================================================
    // 硬件
    // ========================================================================

    void setTransport(HardwareTransport* transport) { dispatcher_.setTransport(transport); }

    void setControlMode(ControlMode mode) {
        config_.controlMode = mode;
        dispatcher_.setControlMode(mode);
    }

    /**
     * @brief 与实际位置同步 (遥测对账用)，停止当前运动
     */
    void syncCommanded(const JointVector& measured) {
        player_.stop();
        executor_.resetCommanded(enforcer_.clamp(measured));
        lastCartesianTarget_.reset();
    }

    // ========================================================================
    // 关节空间运动
    // ========================================================================

    MoveResult moveToJoints(const JointVector& target) {
        return moveToJoints(target, config_.defaultMoveDurationMs);
    }

    /**
     * @brief 关节空间运动: 钳制 -> 验证 -> 执行
     * @param target 目标关节角 (deg)
     * @param durationMs 运动时长
     */
    MoveResult moveToJoints(const JointVector& target, double durationMs) {
        MoveResult result;
        if (!admitManualCommand(result)) return result;
        if (!std::isfinite(durationMs)) {
            result.status = MoveStatus::InvalidRequest;
            result.errorMessage = "duration must be finite";
            return result;
        }
        return startJointMove(target, durationMs, result);
    }

    /// 单关节设置，其他关节保持当前指令值
    MoveResult setJointAngle(int index, double angleDeg) {
        std::map<int, double> angles;
        angles[index] = angleDeg;
        return setJointAngles(angles);
    }

    /// 多关节设置，未指定的关节保持当前指令值
    MoveResult setJointAngles(const std::map<int, double>& angles) {
        MoveResult result;
        if (!admitManualCommand(result)) return result;

        JointVector target = executor_.commanded();
        for (const auto& kv : angles) {
            if (kv.first < 0 || kv.first >= kNumJoints) {
                result.status = MoveStatus::InvalidRequest;
                result.errorMessage = "joint index out of range: " + std::to_string(kv.first);
                std::cerr << "[MotionController] " << result.errorMessage << std::endl;
                return result;
            }
            target[kv.first] = kv.second;
        }
        return startJointMove(target, config_.defaultMoveDurationMs, result);
    }

    /**
     * @brief 键盘点动
     * @param index 关节索引
     * @param direction >0 正向, <0 反向
     */
    MoveResult jogJoint(int index, int direction) {
        MoveResult result;
        if (!admitManualCommand(result)) return result;

        if (index < 0 || index >= kNumJoints || direction == 0) {
            result.status = MoveStatus::InvalidRequest;
            result.errorMessage = "invalid jog: joint " + std::to_string(index) +
                                  ", direction " + std::to_string(direction);
            std::cerr << "[MotionController] " << result.errorMessage << std::endl;
            return result;
        }

        JointVector target = executor_.commanded();
        target[index] += direction > 0 ? config_.jogStepDeg : -config_.jogStepDeg;
        return startJointMove(target, config_.jogDurationMs, result);
    }

    // ========================================================================
    // 笛卡尔空间运动
    // ========================================================================

    /**
     * @brief 笛卡尔直线运动，起点为上次笛卡尔目标 (无则取当前近似末端位置)
     */
    MoveResult moveToCartesian(const CartesianPoint& goal) {
        CartesianPoint start = lastCartesianTarget_
                                   ? *lastCartesianTarget_
                                   : kinematics_.endEffector(executor_.commanded());
        return moveToCartesian(start, goal);
    }

    MoveResult moveToCartesian(const CartesianPoint& start, const CartesianPoint& goal) {
        MoveResult result;
        if (!admitManualCommand(result)) return result;

        PlanResult plan = planner_.plan(start, goal, config_.pathSamples);
        if (!plan.isSuccess()) {
            result.status = plan.status == PlanStatus::Unreachable ? MoveStatus::Unreachable
                          : plan.status == PlanStatus::ValidationFailed ? MoveStatus::ValidationFailed
                          : MoveStatus::InvalidRequest;
            result.verdict = plan.verdict;
            result.failedSample = plan.failedIndex;
            result.errorMessage = plan.errorMessage;
            return result;
        }

        stopSequenceForManualMove();
        result.target = plan.path.finalJoints();
        result.handle = executor_.runPath(plan.path.jointPath(), config_.cartesianMoveDurationMs);
        result.status = MoveStatus::Success;
        lastCartesianTarget_ = goal;

        if (config_.verbose) {
            std::cout << "[MotionController] 笛卡尔运动 -> " << utils::formatPoint(goal)
                      << ", " << plan.path.size() << " 点" << std::endl;
        }
        return result;
    }

    /// 预置位置
    MoveResult moveToPreset(const std::string& name) {
        const auto& table = presets();
        auto it = table.find(name);
        if (it == table.end()) {
            MoveResult result;
            result.status = MoveStatus::InvalidRequest;
            result.errorMessage = "unknown preset: " + name;
            std::cerr << "[MotionController] " << result.errorMessage << std::endl;
            return result;
        }
        return moveToCartesian(it->second);
    }

    /// 预置笛卡尔位置表 [m]
    static const std::map<std::string, CartesianPoint>& presets() {
        static const std::map<std::string, CartesianPoint> table = {
            {"home",    CartesianPoint( 0.00, 0.25, 0.30)},
            {"left",    CartesianPoint(-0.15, 0.25, 0.25)},
            {"right",   CartesianPoint( 0.15, 0.25, 0.25)},
            {"center",  CartesianPoint( 0.00, 0.20, 0.20)},
            {"high",    CartesianPoint( 0.00, 0.25, 0.40)},
            {"pickup",  CartesianPoint( 0.10, 0.30, 0.15)},
            {"forward", CartesianPoint( 0.00, 0.15, 0.25)},
            {"back",    CartesianPoint( 0.00, 0.35, 0.25)}
        };
        return table;
    }

    // ========================================================================
    // 动作序列
    // ========================================================================

    PlayResult playAction(const std::string& name) {
        if (estopped_) return refusePlay(name);
        PlayResult result = player_.play(name);
        if (result.isSuccess()) lastCartesianTarget_.reset();
        return result;
    }

    PlayResult playSequence(const ActionSequence& sequence) {
        if (estopped_) return refusePlay(sequence.name);
        PlayResult result = player_.playSequence(sequence);
        if (result.isSuccess()) lastCartesianTarget_.reset();
        return result;
    }

    bool stopAction() { return player_.stop(); }

    /// 夹爪开合 (急停中拒绝)
    DispatchStatus setGripper(bool open) {
        if (estopped_) {
            std::cerr << "[MotionController] 急停中, 拒绝夹爪指令" << std::endl;
            return DispatchStatus::Rejected;
        }
        lastDispatchStatus_ = dispatcher_.dispatchGripper(open);
        return lastDispatchStatus_;
    }

    // ========================================================================
    // 急停
    // ========================================================================

    /**
     * @brief 急停：清除序列与轨迹，保持当前指令位置，下发硬件急停并锁存
     */
    void emergencyStop() {
        player_.stop();
        executor_.cancelAll();
        estopped_ = true;
        lastDispatchStatus_ = dispatcher_.emergencyStop();
        std::cerr << "[MotionController] 急停锁存, 保持于 "
                  << utils::formatJoints(executor_.commanded()) << std::endl;
    }

    void resetEmergencyStop() {
        if (!estopped_) return;
        estopped_ = false;
        std::cout << "[MotionController] 急停已复位" << std::endl;
    }

    bool isEmergencyStopped() const { return estopped_; }

    // ========================================================================
    // 控制循环
    // ========================================================================

    /**
     * @brief 推进一个控制周期
     */
    void tick() {
        executor_.tick();
        player_.update();
    }

    // ========================================================================
    // 状态查询
    // ========================================================================

    const JointVector& commanded() const { return executor_.commanded(); }
    bool isMoving() const { return executor_.isRunning(); }
    bool isPlaying() const { return player_.isPlaying(); }
    const std::optional<CartesianPoint>& lastCartesianTarget() const { return lastCartesianTarget_; }
    DispatchStatus lastDispatchStatus() const { return lastDispatchStatus_; }

    const EngineConfig& config() const { return config_; }
    const JointSafetyEnforcer& enforcer() const { return enforcer_; }
    const ApproxKinematics& kinematics() const { return kinematics_; }
    const CollisionValidator& validator() const { return validator_; }
    const CommandDispatcher& dispatcher() const { return dispatcher_; }
    const CartesianPathPlanner& planner() const { return planner_; }
    const TrajectoryExecutor& executor() const { return executor_; }
    const ActionSequencePlayer& player() const { return player_; }

private:
    /// 急停检查，被拒绝的指令不改变运动状态
    bool admitManualCommand(MoveResult& result) {
        if (estopped_) {
            result.status = MoveStatus::EmergencyStopped;
            result.errorMessage = "emergency stop latched";
            std::cerr << "[MotionController] 急停中, 拒绝运动指令" << std::endl;
            return false;
        }
        return true;
    }

    /// 已通过验证/规划的手动指令打断当前序列
    void stopSequenceForManualMove() {
        if (player_.isPlaying()) {
            player_.stop();
        }
    }

    MoveResult& startJointMove(const JointVector& target, double durationMs, MoveResult& result) {
        JointVector safe = enforcer_.clamp(target);
        SafetyVerdict verdict = validator_.check(safe);
        result.target = safe;

        if (!verdict.ok) {
            result.status = MoveStatus::ValidationFailed;
            result.verdict = verdict;
            result.errorMessage = verdict.summary();
            std::cerr << "[MotionController] 拒绝目标 " << utils::formatJoints(safe)
                      << ": " << result.errorMessage << std::endl;
            return result;
        }

        stopSequenceForManualMove();
        // 笛卡尔路径起点以后改为从当前姿态推算
        lastCartesianTarget_.reset();
        result.handle = executor_.run(safe, durationMs);
        result.status = MoveStatus::Success;
        return result;
    }

    PlayResult refusePlay(const std::string& name) {
        std::cerr << "[MotionController] 急停中, 拒绝动作 '" << name << "'" << std::endl;
        PlayResult result;
        result.status = PlayStatus::Refused;
        result.sequence = name;
        return result;
    }

    EngineConfig config_;
    JointSafetyEnforcer enforcer_;
    ApproxKinematics kinematics_;
    CollisionValidator validator_;
    CommandDispatcher dispatcher_;
    CartesianPathPlanner planner_;
    TrajectoryExecutor executor_;
    ActionSequencePlayer player_;

    std::optional<CartesianPoint> lastCartesianTarget_;
    bool estopped_ = false;
    DispatchStatus lastDispatchStatus_ = DispatchStatus::Simulated;
};

} // namespace armmotion
