/**
 * @file HardwareInterface.hpp
 * @brief 硬件接口 - 传输层抽象 + 指令下发器
 *
 * 传输层 (串口 / WebSocket / REST) 由外部实现，本引擎只依赖
 * HardwareTransport 接口。CommandDispatcher 负责：
 * - 仿真/实机模式切换
 * - 下发前的单关节限位复核
 * - 角度单位转换
 * - 下发统计
 *
 * @version 1.0.0
 * @date 2026-10-16
 */

#pragma once

#include "Types.hpp"
#include "ArmConfig.hpp"

#include <cstddef>
#include <iostream>
#include <string>

namespace armmotion {

/// 传输层角度单位
enum class AngleUnit {
    Degrees,
    Radians
};

/**
 * @brief 硬件传输层接口
 *
 * 所有调用尽力而为：返回false表示失败，不抛异常。
 */
class HardwareTransport {
public:
    HardwareTransport() = default;
    virtual ~HardwareTransport() = default;

    /// 传输层期望的角度单位
    virtual AngleUnit nativeUnit() const { return AngleUnit::Degrees; }

    /// 下发关节角 (单位为 nativeUnit())
    virtual bool sendJointAngles(const JointVector& values) = 0;

    /// 夹爪开合
    virtual bool setGripper(bool open) = 0;

    /// 硬件急停
    virtual bool emergencyStop() = 0;

    virtual std::string name() const { return "transport"; }
};

/// 下发状态
enum class DispatchStatus {
    Sent,            // 已发送到硬件
    Simulated,       // 仿真模式，仅记录
    Rejected,        // 复核失败，未发送
    TransportError   // 传输层失败或未连接
};

inline const char* dispatchStatusString(DispatchStatus status) {
    switch (status) {
        case DispatchStatus::Sent: return "Sent";
        case DispatchStatus::Simulated: return "Simulated";
        case DispatchStatus::Rejected: return "Rejected";
        case DispatchStatus::TransportError: return "Transport Error";
        default: return "Unknown";
    }
}

/// 下发统计
struct DispatchStats {
    size_t sent = 0;
    size_t simulated = 0;
    size_t rejected = 0;
    size_t transportErrors = 0;
    size_t gripperCommands = 0;

    size_t total() const { return sent + simulated + rejected + transportErrors; }
};

/**
 * @brief 指令下发器
 *
 * 不拥有传输层对象，调用方保证其生命周期长于下发器。
 */
class CommandDispatcher {
public:
    explicit CommandDispatcher(const JointLimits& limits = JointLimits(),
                               ControlMode mode = ControlMode::Simulation,
                               bool verbose = false)
        : limits_(limits), mode_(mode), verbose_(verbose) {
        lastDispatched_.setZero();
    }

    void setTransport(HardwareTransport* transport) { transport_ = transport; }
    HardwareTransport* transport() const { return transport_; }

    void setControlMode(ControlMode mode) {
        if (mode != mode_ && verbose_) {
            std::cout << "[CommandDispatcher] 控制模式: " << controlModeString(mode_)
                      << " -> " << controlModeString(mode) << std::endl;
        }
        mode_ = mode;
    }
    ControlMode controlMode() const { return mode_; }

    void setVerbose(bool verbose) { verbose_ = verbose; }

    /**
     * @brief 下发关节角
     * @param angles 关节角 (deg)
     */
    DispatchStatus dispatch(const JointVector& angles) {
        // 最后一道防线：单关节限位复核
        for (int i = 0; i < kNumJoints; ++i) {
            if (!std::isfinite(angles[i]) ||
                angles[i] < limits_.jointMin[i] || angles[i] > limits_.jointMax[i]) {
                ++stats_.rejected;
                std::cerr << "[CommandDispatcher] 拒绝下发: " << jointName(i) << " = "
                          << angles[i] << " 超出 [" << limits_.jointMin[i] << ", "
                          << limits_.jointMax[i] << "]" << std::endl;
                return DispatchStatus::Rejected;
            }
        }

        lastDispatched_ = angles;

        if (mode_ == ControlMode::Simulation) {
            ++stats_.simulated;
            if (verbose_) {
                std::cout << "[CommandDispatcher] (仿真) " << utils::formatJoints(angles) << std::endl;
            }
            return DispatchStatus::Simulated;
        }

        if (!transport_) {
            ++stats_.transportErrors;
            std::cerr << "[CommandDispatcher] 实机模式下未连接传输层" << std::endl;
            return DispatchStatus::TransportError;
        }

        JointVector values = transport_->nativeUnit() == AngleUnit::Radians
                                 ? utils::toRadians(angles)
                                 : angles;
        if (!transport_->sendJointAngles(values)) {
            ++stats_.transportErrors;
            std::cerr << "[CommandDispatcher] " << transport_->name() << " 下发失败: "
                      << utils::formatJoints(angles) << std::endl;
            return DispatchStatus::TransportError;
        }

        ++stats_.sent;
        if (verbose_) {
            std::cout << "[CommandDispatcher] -> " << transport_->name() << " "
                      << utils::formatJoints(angles) << std::endl;
        }
        return DispatchStatus::Sent;
    }

    /**
     * @brief 夹爪开合 (与关节指令同样受模式控制)
     */
    DispatchStatus dispatchGripper(bool open) {
        ++stats_.gripperCommands;
        gripperOpen_ = open;

        if (mode_ == ControlMode::Simulation) {
            if (verbose_) {
                std::cout << "[CommandDispatcher] (仿真) 夹爪" << (open ? "张开" : "闭合") << std::endl;
            }
            return DispatchStatus::Simulated;
        }
        if (!transport_ || !transport_->setGripper(open)) {
            ++stats_.transportErrors;
            std::cerr << "[CommandDispatcher] 夹爪指令失败" << std::endl;
            return DispatchStatus::TransportError;
        }
        return DispatchStatus::Sent;
    }

    /**
     * @brief 急停指令，仿真模式下同样只记录
     */
    DispatchStatus emergencyStop() {
        std::cerr << "[CommandDispatcher] 急停!" << std::endl;
        if (mode_ == ControlMode::Simulation) {
            return DispatchStatus::Simulated;
        }
        if (!transport_ || !transport_->emergencyStop()) {
            ++stats_.transportErrors;
            std::cerr << "[CommandDispatcher] 急停指令发送失败" << std::endl;
            return DispatchStatus::TransportError;
        }
        return DispatchStatus::Sent;
    }

    const DispatchStats& stats() const { return stats_; }
    void resetStats() { stats_ = DispatchStats(); }

    const JointVector& lastDispatched() const { return lastDispatched_; }
    bool gripperOpen() const { return gripperOpen_; }

private:
    JointLimits limits_;
    ControlMode mode_;
    bool verbose_;
    HardwareTransport* transport_ = nullptr;

    DispatchStats stats_;
    JointVector lastDispatched_;
    bool gripperOpen_ = true;
};

} // namespace armmotion
