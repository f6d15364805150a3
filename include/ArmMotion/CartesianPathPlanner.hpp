/**
 * @file CartesianPathPlanner.hpp
 * @brief 笛卡尔直线路径规划器
 *
 * 在起点与终点之间直线采样，逐点调用外部IK求解器，
 * 每个解先经 JointSafetyEnforcer 钳制再经 CollisionValidator 验证。
 * 任一采样点失败即中止，不返回部分路径。
 *
 * IK求解器对本引擎是不透明的，关节空间连续性无法解析保证，
 * 因此采用离散化 + 逐点验证。
 *
 * @version 1.0.0
 * @date 2026-10-16
 */

#pragma once

#include "Types.hpp"
#include "ArmConfig.hpp"
#include "JointSafetyEnforcer.hpp"
#include "CollisionValidator.hpp"

#include <chrono>
#include <future>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace armmotion {

// ============================================================================
// IK 求解器接口
// ============================================================================

/**
 * @brief IK求解结果
 */
struct IKSolution {
    bool reachable = false;
    JointVector joints = JointVector::Zero();   // deg，未钳制
    std::string message;

    static IKSolution solved(const JointVector& q) {
        IKSolution s;
        s.reachable = true;
        s.joints = q;
        return s;
    }

    static IKSolution unreachable(const std::string& reason) {
        IKSolution s;
        s.reachable = false;
        s.message = reason;
        return s;
    }
};

/**
 * @brief 外部IK求解器
 *
 * 要求：同步返回；相同输入结果相同；不得自行钳制。
 */
class IKOracle {
public:
    virtual ~IKOracle() = default;
    virtual IKSolution solve(const CartesianPoint& point) = 0;
};

/**
 * @brief 将可调用对象适配为 IKOracle
 */
class FunctionIKOracle : public IKOracle {
public:
    using SolveFunction = std::function<IKSolution(const CartesianPoint&)>;

    explicit FunctionIKOracle(SolveFunction fn) : fn_(std::move(fn)) {}

    IKSolution solve(const CartesianPoint& point) override {
        if (!fn_) return IKSolution::unreachable("no solver bound");
        return fn_(point);
    }

private:
    SolveFunction fn_;
};

// ============================================================================
// 规划结果
// ============================================================================

/// 规划状态
enum class PlanStatus {
    Success,            // 成功
    Unreachable,        // 采样点不可达
    ValidationFailed,   // 采样点解不安全
    InvalidRequest      // 请求参数无效
};

/// 路径点
struct PlanWaypoint {
    CartesianPoint point = CartesianPoint::Zero();   // 任务空间采样点
    JointVector joints = JointVector::Zero();        // 钳制并验证后的关节角
    double t = 0.0;                                  // 采样参数 [0, 1]
};

/// 已验证的关节空间路径
struct PathPlan {
    std::vector<PlanWaypoint> waypoints;

    size_t size() const { return waypoints.size(); }
    bool empty() const { return waypoints.empty(); }

    /// 仅关节角序列，供 TrajectoryExecutor::runPath 使用
    std::vector<JointVector> jointPath() const {
        std::vector<JointVector> out;
        out.reserve(waypoints.size());
        for (const auto& wp : waypoints) out.push_back(wp.joints);
        return out;
    }

    const JointVector& finalJoints() const { return waypoints.back().joints; }
};

/// 规划结果
struct PlanResult {
    PlanStatus status = PlanStatus::InvalidRequest;
    PathPlan path;                  // 仅成功时非空

    // 失败信息
    int failedIndex = -1;           // 首个失败采样点索引
    CartesianPoint failedPoint = CartesianPoint::Zero();
    SafetyVerdict verdict;          // ValidationFailed 时的判定
    std::string errorMessage;

    // 统计信息
    int oracleCalls = 0;
    double planningTime = 0.0;      // 规划耗时 [s]

    bool isSuccess() const { return status == PlanStatus::Success; }

    std::string statusString() const {
        switch (status) {
            case PlanStatus::Success: return "Success";
            case PlanStatus::Unreachable: return "Unreachable";
            case PlanStatus::ValidationFailed: return "Validation Failed";
            case PlanStatus::InvalidRequest: return "Invalid Request";
            default: return "Unknown";
        }
    }
};

// ============================================================================
// 规划器
// ============================================================================

class CartesianPathPlanner {
public:
    static constexpr int kDefaultSamples = 15;

    /**
     * @brief 构造函数
     * @param oracle IK求解器 (不拥有，需长于规划器存活)
     * @param config 机械臂配置
     */
    explicit CartesianPathPlanner(IKOracle& oracle,
                                  const ArmConfig& config = ArmConfig::defaultArm(),
                                  bool verbose = false)
        : oracle_(oracle), enforcer_(config.limits), validator_(config), verbose_(verbose) {}

    /**
     * @brief 规划直线路径
     * @param start 起点 [m]
     * @param goal 终点 [m]
     * @param samples 采样段数，产生 samples+1 个点
     */
    PlanResult plan(const CartesianPoint& start, const CartesianPoint& goal,
                    int samples = kDefaultSamples) const {
        auto startTime = std::chrono::high_resolution_clock::now();
        PlanResult result;

        if (samples < 1) {
            result.status = PlanStatus::InvalidRequest;
            result.errorMessage = "samples must be >= 1, got " + std::to_string(samples);
            std::cerr << "[CartesianPathPlanner] " << result.errorMessage << std::endl;
            return result;
        }
        if (!start.allFinite() || !goal.allFinite()) {
            result.status = PlanStatus::InvalidRequest;
            result.errorMessage = "start/goal must be finite";
            std::cerr << "[CartesianPathPlanner] " << result.errorMessage << std::endl;
            return result;
        }

        if (verbose_) {
            std::cout << "[CartesianPathPlanner] " << utils::formatPoint(start) << " -> "
                      << utils::formatPoint(goal) << ", " << samples + 1 << " samples" << std::endl;
        }

        std::vector<CartesianPoint> points = samplePoints(start, goal, samples);
        PathPlan plan;
        plan.waypoints.reserve(points.size());

        // 逐点顺序调用，保证失败索引确定
        for (int i = 0; i < static_cast<int>(points.size()); ++i) {
            const CartesianPoint& p = points[i];

            IKSolution solution = oracle_.solve(p);
            ++result.oracleCalls;

            if (!solution.reachable) {
                fail(result, PlanStatus::Unreachable, i, p,
                     solution.message.empty() ? "IK unreachable" : solution.message);
                break;
            }

            if (!utils::allFinite(solution.joints)) {
                result.verdict = validator_.check(solution.joints);
                fail(result, PlanStatus::ValidationFailed, i, p, "IK returned non-finite joints");
                break;
            }

            JointVector safe = enforcer_.clamp(solution.joints);
            SafetyVerdict verdict = validator_.check(safe);
            if (!verdict.ok) {
                result.verdict = verdict;
                fail(result, PlanStatus::ValidationFailed, i, p, verdict.summary());
                break;
            }

            PlanWaypoint wp;
            wp.point = p;
            wp.joints = safe;
            wp.t = static_cast<double>(i) / samples;
            plan.waypoints.push_back(wp);
        }

        if (result.failedIndex < 0) {
            result.status = PlanStatus::Success;
            result.path = std::move(plan);
            if (verbose_) {
                std::cout << "[CartesianPathPlanner] 规划成功, 终点关节 "
                          << utils::formatJoints(result.path.finalJoints()) << std::endl;
            }
        }

        auto endTime = std::chrono::high_resolution_clock::now();
        result.planningTime = std::chrono::duration<double>(endTime - startTime).count();
        return result;
    }

    /**
     * @brief 在独立规划任务上执行 plan()
     *
     * 求解器调用仍为顺序执行。返回的 future 完成前，
     * 规划器与求解器必须保持存活。
     */
    std::future<PlanResult> planAsync(const CartesianPoint& start, const CartesianPoint& goal,
                                      int samples = kDefaultSamples) const {
        return std::async(std::launch::async, [this, start, goal, samples]() {
            return plan(start, goal, samples);
        });
    }

    /**
     * @brief 直线采样 p_i = (1-t)·start + t·goal, t = i/samples
     *
     * 两端点精确等于 start 和 goal。
     */
    static std::vector<CartesianPoint> samplePoints(const CartesianPoint& start,
                                                    const CartesianPoint& goal,
                                                    int samples) {
        std::vector<CartesianPoint> points;
        if (samples < 1) return points;
        points.reserve(samples + 1);
        for (int i = 0; i <= samples; ++i) {
            double t = static_cast<double>(i) / samples;
            points.push_back((1.0 - t) * start + t * goal);
        }
        return points;
    }

    const JointSafetyEnforcer& enforcer() const { return enforcer_; }
    const CollisionValidator& validator() const { return validator_; }
    void setVerbose(bool verbose) { verbose_ = verbose; }

private:
    static void fail(PlanResult& result, PlanStatus status, int index,
                     const CartesianPoint& point, const std::string& reason) {
        result.status = status;
        result.failedIndex = index;
        result.failedPoint = point;
        result.errorMessage = "sample " + std::to_string(index) + " " +
                              utils::formatPoint(point) + ": " + reason;
        result.path = PathPlan();
        std::cerr << "[CartesianPathPlanner] " << result.statusString() << " at "
                  << result.errorMessage << std::endl;
    }

    IKOracle& oracle_;
    JointSafetyEnforcer enforcer_;
    CollisionValidator validator_;
    bool verbose_;
};

} // namespace armmotion
