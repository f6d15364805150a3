/**
 * @file ApproxKinematics.hpp
 * @brief 近似正运动学 - 仅用于粗略碰撞包络检查
 *
 * 模型: 平面三连杆 (肩部+大臂, 小臂, 腕部+法兰)，
 * 由基座关节绕竖直轴旋转，俯仰角从竖直方向起算并逐级累加：
 *   连杆A: shoulder
 *   连杆B: shoulder + elbow
 *   连杆C: shoulder + elbow + wrist-pitch
 *
 * 忽略腕部旋转和末端偏移，不可用于可视化或精确定位。
 *
 * @version 1.0.0
 * @date 2026-10-16
 */

#pragma once

#include "Types.hpp"
#include "ArmConfig.hpp"

namespace armmotion {

/**
 * @brief 关键点 (肘部 / 腕部 / 末端)
 */
struct KeyPoint {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
    double radial = 0.0;   // 到竖直轴距离

    CartesianPoint position() const { return CartesianPoint(x, y, z); }
};

enum KeyPointIndex : int {
    kElbowPoint = 0,
    kWristPoint = 1,
    kEndEffectorPoint = 2
};

inline const char* keyPointName(int index) {
    switch (index) {
        case kElbowPoint: return "elbow";
        case kWristPoint: return "wrist";
        case kEndEffectorPoint: return "end-effector";
        default: return "unknown";
    }
}

class ApproxKinematics {
public:
    using KeyPoints = std::array<KeyPoint, 3>;

    explicit ApproxKinematics(const LinkLengths& links = LinkLengths())
        : links_(links) {}

    /**
     * @brief 计算肘部、腕部、末端位置
     * @param angles 关节角 (deg)
     */
    KeyPoints forwardPositions(const JointVector& angles) const {
        const double base = angles[kBase] * utils::kDegToRad;
        const double pitchA = angles[kShoulder] * utils::kDegToRad;
        const double pitchB = pitchA + angles[kElbow] * utils::kDegToRad;
        const double pitchC = pitchB + angles[kWristPitch] * utils::kDegToRad;

        // 平面内 (r, h)，r为沿基座朝向的水平距离
        double r = 0.0;
        double h = links_.baseHeight;

        KeyPoints points;

        r += links_.linkA() * std::sin(pitchA);
        h += links_.linkA() * std::cos(pitchA);
        points[kElbowPoint] = rotate(r, h, base);

        r += links_.linkB() * std::sin(pitchB);
        h += links_.linkB() * std::cos(pitchB);
        points[kWristPoint] = rotate(r, h, base);

        r += links_.linkC() * std::sin(pitchC);
        h += links_.linkC() * std::cos(pitchC);
        points[kEndEffectorPoint] = rotate(r, h, base);

        return points;
    }

    /// 末端近似位置
    CartesianPoint endEffector(const JointVector& angles) const {
        return forwardPositions(angles)[kEndEffectorPoint].position();
    }

    /// 最大伸展距离 (从肩关节起算)
    double maxReach() const { return links_.totalReach(); }

    const LinkLengths& links() const { return links_; }

private:
    static KeyPoint rotate(double r, double h, double base) {
        KeyPoint p;
        p.x = r * std::sin(base);
        p.y = r * std::cos(base);
        p.z = h;
        p.radial = std::hypot(p.x, p.y);
        return p;
    }

    LinkLengths links_;
};

} // namespace armmotion
