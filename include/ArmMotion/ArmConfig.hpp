/**
 * @file ArmConfig.hpp
 * @brief 机械臂安全参数与引擎配置
 *
 * 包含：
 * - 单关节限位与三条耦合限位规则
 * - 用于近似碰撞几何的连杆长度
 * - 地面/底座碰撞包络
 * - 引擎运行配置 (支持环境变量覆盖)
 *
 * 所有角度单位为度，所有长度单位为米。
 *
 * @version 1.0.0
 * @date 2026-10-16
 */

#pragma once

#include "Types.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

namespace armmotion {

/**
 * @brief 关节限位 (单关节 + 耦合规则)
 */
struct JointLimits {
    // 单关节限位 (deg)
    std::array<double, kNumJoints> jointMin = {-180, -90, -135, -180, -90, -180};
    std::array<double, kNumJoints> jointMax = { 180,  90,  135,  180,  90,  180};

    // 耦合规则1: 大臂+小臂角度和 ∈ [seMin, seMax]
    double shoulderElbowMin = -160.0;
    double shoulderElbowMax = 160.0;

    // 耦合规则2: 小臂前倾上限
    double elbowForwardMax = 125.0;

    // 耦合规则3: |腕部旋转| + |腕部俯仰| 上限
    double wristCoupledLimit = 180.0;

    // 耦合规则比较容差，校正到边界上的值视为合法
    double couplingTolerance = 1e-9;

    double minOf(int joint) const { return jointMin[joint]; }
    double maxOf(int joint) const { return jointMax[joint]; }
};

/**
 * @brief 连杆长度 (仅用于近似碰撞几何，不是完整运动学模型)
 */
struct LinkLengths {
    double baseHeight = 0.166;   // 基座到肩关节高度
    double shoulder = 0.030;     // 肩部连杆
    double upperArm = 0.200;     // 大臂
    double forearm = 0.185;      // 小臂
    double wrist = 0.075;        // 腕部
    double flange = 0.050;       // 法兰

    /// 平面三连杆: A = 肩部+大臂, B = 小臂, C = 腕部+法兰
    double linkA() const { return shoulder + upperArm; }
    double linkB() const { return forearm; }
    double linkC() const { return wrist + flange; }

    double totalReach() const { return linkA() + linkB() + linkC(); }
};

/**
 * @brief 地面与底座碰撞包络
 */
struct CollisionEnvelope {
    double groundZ = 0.0;             // 地面高度 [m]
    double pedestalRadius = 0.060;    // 底座圆柱半径 [m]
    double pedestalClearance = 0.020; // 底座上方安全间隙 [m]
};

/**
 * @brief 机械臂配置
 */
struct ArmConfig {
    JointLimits limits;
    LinkLengths links;
    CollisionEnvelope envelope;

    /// 默认六轴桌面机械臂
    static ArmConfig defaultArm() {
        return ArmConfig();
    }
};

/**
 * @brief 控制模式
 */
enum class ControlMode {
    Simulation,   // 仅更新指令状态，不下发硬件
    Physical      // 同时下发到硬件传输层
};

inline const char* controlModeString(ControlMode mode) {
    return mode == ControlMode::Physical ? "physical" : "simulation";
}

/**
 * @brief 引擎运行配置
 */
struct EngineConfig {
    ArmConfig arm = ArmConfig::defaultArm();

    // 笛卡尔路径规划
    int pathSamples = 15;                    // 直线采样段数 (产生 N+1 个点)

    // 运动时长 (ms)
    double defaultMoveDurationMs = 1000.0;   // 关节空间单目标运动
    double cartesianMoveDurationMs = 2000.0; // 笛卡尔路径总时长

    // 键盘点动
    double jogStepDeg = 5.0;
    double jogDurationMs = 150.0;

    ControlMode controlMode = ControlMode::Simulation;
    bool streamEveryTick = false;            // 每个tick都下发 (否则仅在轨迹结束时下发)
    bool verbose = false;

    static EngineConfig defaultConfig() {
        return EngineConfig();
    }

    /**
     * @brief 从环境变量读取覆盖项
     *
     * ARMMOTION_CONTROL_MODE     simulation | physical
     * ARMMOTION_PATH_SAMPLES     >= 1
     * ARMMOTION_MOVE_DURATION_MS >= 0
     * ARMMOTION_STREAM_TICKS     0 | 1
     * ARMMOTION_VERBOSE          0 | 1
     */
    static EngineConfig fromEnvironment() {
        return fromEnvironment(defaultConfig());
    }

    static EngineConfig fromEnvironment(const EngineConfig& base) {
        EngineConfig config = base;

        if (const char* mode = std::getenv("ARMMOTION_CONTROL_MODE")) {
            std::string value(mode);
            if (value == "physical") {
                config.controlMode = ControlMode::Physical;
            } else if (value == "simulation") {
                config.controlMode = ControlMode::Simulation;
            } else {
                std::cerr << "[EngineConfig] 忽略无效的 ARMMOTION_CONTROL_MODE: " << value << "\n";
            }
        }

        int samples = 0;
        if (readInt("ARMMOTION_PATH_SAMPLES", samples)) {
            if (samples >= 1) {
                config.pathSamples = samples;
            } else {
                std::cerr << "[EngineConfig] ARMMOTION_PATH_SAMPLES 必须 >= 1, 保持 "
                          << config.pathSamples << "\n";
            }
        }

        double duration = 0.0;
        if (readDouble("ARMMOTION_MOVE_DURATION_MS", duration)) {
            if (duration >= 0.0) {
                config.defaultMoveDurationMs = duration;
            } else {
                std::cerr << "[EngineConfig] ARMMOTION_MOVE_DURATION_MS 不能为负\n";
            }
        }

        readFlag("ARMMOTION_STREAM_TICKS", config.streamEveryTick);
        readFlag("ARMMOTION_VERBOSE", config.verbose);

        return config;
    }

private:
    static bool readInt(const char* name, int& out) {
        const char* raw = std::getenv(name);
        if (!raw) return false;
        char* end = nullptr;
        long value = std::strtol(raw, &end, 10);
        if (end == raw || *end != '\0') {
            std::cerr << "[EngineConfig] 忽略无效的 " << name << ": " << raw << "\n";
            return false;
        }
        out = static_cast<int>(value);
        return true;
    }

    static bool readDouble(const char* name, double& out) {
        const char* raw = std::getenv(name);
        if (!raw) return false;
        char* end = nullptr;
        double value = std::strtod(raw, &end);
        if (end == raw || *end != '\0' || !std::isfinite(value)) {
            std::cerr << "[EngineConfig] 忽略无效的 " << name << ": " << raw << "\n";
            return false;
        }
        out = value;
        return true;
    }

    static void readFlag(const char* name, bool& out) {
        const char* raw = std::getenv(name);
        if (!raw) return;
        std::string value(raw);
        if (value == "1" || value == "true" || value == "on") {
            out = true;
        } else if (value == "0" || value == "false" || value == "off") {
            out = false;
        } else {
            std::cerr << "[EngineConfig] 忽略无效的 " << name << ": " << value << "\n";
        }
    }
};

} // namespace armmotion
