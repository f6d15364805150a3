/**
 * @file Types.hpp
 * @brief 核心数据类型定义 - 六轴机械臂安全运动引擎
 *
 * 定义了运动引擎中使用的基础数据类型，包括：
 * - 关节空间向量 (单位: 度)
 * - 笛卡尔空间点 (单位: m, 基座坐标系)
 * - 插值与缓动工具函数
 *
 * @version 1.0.0
 * @date 2026-10-16
 */

#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace armmotion {

// ============================================================================
// 基础类型定义
// ============================================================================

/// 关节数量
constexpr int kNumJoints = 6;

/// 6关节向量 [deg]，顺序: 基座, 大臂, 小臂, 腕部旋转, 腕部俯仰, 末端
using JointVector = Eigen::Matrix<double, kNumJoints, 1>;

/// 笛卡尔位置 (x右, y前, z上) [m]
using CartesianPoint = Eigen::Vector3d;

/// 关节索引
enum Joint : int {
    kBase = 0,
    kShoulder = 1,
    kElbow = 2,
    kWristRoll = 3,
    kWristPitch = 4,
    kTool = 5
};

inline const char* jointName(int index) {
    static const char* names[kNumJoints] = {
        "base", "shoulder", "elbow", "wrist-roll", "wrist-pitch", "tool"
    };
    if (index < 0 || index >= kNumJoints) return "coupled";
    return names[index];
}

/// 由初始化列表构造关节向量 (不足6个补0)
inline JointVector makeJoints(std::initializer_list<double> list) {
    JointVector q = JointVector::Zero();
    int i = 0;
    for (double val : list) {
        if (i < kNumJoints) q[i++] = val;
    }
    return q;
}

// ============================================================================
// 工具函数
// ============================================================================

namespace utils {

constexpr double kDegToRad = M_PI / 180.0;
constexpr double kRadToDeg = 180.0 / M_PI;

inline JointVector toRadians(const JointVector& deg) {
    return deg * kDegToRad;
}

inline JointVector toDegrees(const JointVector& rad) {
    return rad * kRadToDeg;
}

/// 线性插值
template<typename T>
inline T lerp(const T& a, const T& b, double t) {
    return a + t * (b - a);
}

/// 三次缓入缓出: p<0.5: 4p³; 否则: 1-(-2p+2)³/2
inline double easeInOutCubic(double p) {
    p = std::clamp(p, 0.0, 1.0);
    if (p < 0.5) {
        return 4.0 * p * p * p;
    }
    double f = -2.0 * p + 2.0;
    return 1.0 - f * f * f / 2.0;
}

/// 关节向量是否全部为有限值
inline bool allFinite(const JointVector& q) {
    for (int i = 0; i < kNumJoints; ++i) {
        if (!std::isfinite(q[i])) return false;
    }
    return true;
}

/// 关节向量逐项近似相等
inline bool nearlyEqual(const JointVector& a, const JointVector& b, double tol = 1e-9) {
    return (a - b).cwiseAbs().maxCoeff() <= tol;
}

/// 日志输出用: "[a, b, c, d, e, f]"
inline std::string formatJoints(const JointVector& q, int precision = 2) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(precision) << "[";
    for (int i = 0; i < kNumJoints; ++i) {
        os << q[i];
        if (i < kNumJoints - 1) os << ", ";
    }
    os << "]";
    return os.str();
}

inline std::string formatPoint(const CartesianPoint& p, int precision = 3) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(precision)
       << "(" << p.x() << ", " << p.y() << ", " << p.z() << ")";
    return os.str();
}

} // namespace utils

} // namespace armmotion
