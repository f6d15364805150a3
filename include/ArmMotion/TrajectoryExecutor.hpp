/**
 * @file TrajectoryExecutor.hpp
 * @brief 轨迹执行器 - 缓动插值 + 多路径点播放 + 覆盖语义
 *
 * 执行器独占"指令关节角"，由周期性 tick() 推进 (单线程协作式)。
 * 同一时刻最多一条活动轨迹；新轨迹以当前 (可能在途中的) 指令值为起点
 * 覆盖旧轨迹，旧轨迹的完成回调被静默丢弃。
 *
 * 状态机: Idle <-> Running{generation}
 *
 * @version 1.0.0
 * @date 2026-10-16
 */

#pragma once

#include "Types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <utility>
#include <vector>

namespace armmotion {

/// 轨迹句柄，generation 为0表示无效
struct TrajectoryHandle {
    uint64_t generation = 0;

    bool valid() const { return generation != 0; }
    bool operator==(const TrajectoryHandle& other) const { return generation == other.generation; }
    bool operator!=(const TrajectoryHandle& other) const { return generation != other.generation; }
};

/// 插值方式
enum class Easing {
    CubicInOut,   // 单段运动
    Linear        // 多路径点，逐段线性
};

class TrajectoryExecutor {
public:
    using TimeSource = std::function<double()>;                     // 当前时间 [ms]
    using CompletionCallback = std::function<void()>;
    using DispatchSink = std::function<void(const JointVector&)>;

    enum class State {
        Idle,
        Running
    };

    explicit TrajectoryExecutor(const JointVector& initial = JointVector::Zero(),
                                TimeSource clock = steadyClockMs())
        : clock_(std::move(clock)), commanded_(initial) {}

    /// 默认时间源: steady_clock 毫秒
    static TimeSource steadyClockMs() {
        return []() {
            using namespace std::chrono;
            return duration<double, std::milli>(steady_clock::now().time_since_epoch()).count();
        };
    }

    void setDispatchSink(DispatchSink sink) { sink_ = std::move(sink); }
    void setStreamEveryTick(bool stream) { streamEveryTick_ = stream; }
    void setVerbose(bool verbose) { verbose_ = verbose; }

    // ========================================================================
    // 启动轨迹
    // ========================================================================

    /**
     * @brief 从当前指令值运动到目标
     * @param to 目标关节角 (deg)，调用方负责已钳制/验证
     * @param durationMs 时长，<=0 时下一个tick即完成
     */
    TrajectoryHandle run(const JointVector& to, double durationMs,
                         CompletionCallback onComplete = CompletionCallback()) {
        return run(commanded_, to, durationMs, std::move(onComplete));
    }

    TrajectoryHandle run(const JointVector& from, const JointVector& to, double durationMs,
                         CompletionCallback onComplete = CompletionCallback()) {
        std::vector<JointVector> points;
        points.push_back(from);
        points.push_back(to);
        return start(std::move(points), durationMs, Easing::CubicInOut, std::move(onComplete));
    }

    /**
     * @brief 多路径点播放，总时长均分到 waypoints.size()-1 段，段内线性插值
     *
     * 若当前指令值与首个路径点不同，将其作为起点插入，避免跳变。
     * 插入的起点段另占一段时长，各路径点之间的段时长不变，
     * 实际总时长为 totalDurationMs + 单段时长。起点段不做碰撞验证。
     */
    TrajectoryHandle runPath(const std::vector<JointVector>& waypoints, double totalDurationMs,
                             CompletionCallback onComplete = CompletionCallback()) {
        if (waypoints.empty()) {
            std::cerr << "[TrajectoryExecutor] runPath: 路径为空, 忽略" << std::endl;
            return TrajectoryHandle();
        }

        std::vector<JointVector> points;
        points.reserve(waypoints.size() + 1);
        double durationMs = totalDurationMs;
        if (!utils::nearlyEqual(commanded_, waypoints.front())) {
            points.push_back(commanded_);
            // 起点段: 一个路径段的时长 (单个路径点时为全部时长)
            if (waypoints.size() > 1) {
                durationMs += totalDurationMs / static_cast<double>(waypoints.size() - 1);
            }
        }
        points.insert(points.end(), waypoints.begin(), waypoints.end());
        if (points.size() == 1) {
            points.push_back(points.front());
        }
        return start(std::move(points), durationMs, Easing::Linear, std::move(onComplete));
    }

    // ========================================================================
    // 推进与取消
    // ========================================================================

    /**
     * @brief 推进一个tick
     * @return 本次是否有活动轨迹
     */
    bool tick() {
        if (state_ != State::Running) return false;

        double elapsed = clock_() - startTimeMs_;
        double progress = durationMs_ <= 0.0 ? 1.0 : std::clamp(elapsed / durationMs_, 0.0, 1.0);
        progress_ = progress;

        if (progress >= 1.0) {
            finish();
            return true;
        }

        commanded_ = sample(progress);
        if (streamEveryTick_ && sink_) {
            sink_(commanded_);
        }
        return true;
    }

    /**
     * @brief 取消指定轨迹 (仅当其仍为当前轨迹)
     * @return 是否取消成功
     */
    bool cancel(const TrajectoryHandle& handle) {
        if (state_ != State::Running || handle.generation != generation_) {
            return false;
        }
        cancelAll();
        return true;
    }

    /// 取消活动轨迹，指令值保持在当前位置
    void cancelAll() {
        if (state_ == State::Running && verbose_) {
            std::cout << "[TrajectoryExecutor] 取消轨迹 #" << generation_ << " 于 "
                      << utils::formatJoints(commanded_) << std::endl;
        }
        state_ = State::Idle;
        onComplete_ = CompletionCallback();
        points_.clear();
        // 使已发出的句柄全部失效
        ++generation_;
    }

    /// 取消并直接设定指令值 (初始化/同步实际位置用)
    void resetCommanded(const JointVector& q) {
        cancelAll();
        commanded_ = q;
    }

    // ========================================================================
    // 状态查询
    // ========================================================================

    const JointVector& commanded() const { return commanded_; }
    State state() const { return state_; }
    bool isRunning() const { return state_ == State::Running; }
    uint64_t generation() const { return generation_; }
    bool isCurrent(const TrajectoryHandle& handle) const {
        return state_ == State::Running && handle.generation == generation_;
    }
    double progress() const { return progress_; }
    Easing easing() const { return easing_; }
    const JointVector& target() const { return target_; }
    size_t completedCount() const { return completedCount_; }

private:
    TrajectoryHandle start(std::vector<JointVector> points, double durationMs,
                           Easing easing, CompletionCallback onComplete) {
        if (verbose_ && state_ == State::Running) {
            std::cout << "[TrajectoryExecutor] 轨迹 #" << generation_ << " 被覆盖" << std::endl;
        }

        ++generation_;
        state_ = State::Running;
        points_ = std::move(points);
        target_ = points_.back();
        durationMs_ = durationMs;
        easing_ = easing;
        onComplete_ = std::move(onComplete);
        startTimeMs_ = clock_();
        progress_ = 0.0;

        if (verbose_) {
            std::cout << "[TrajectoryExecutor] 轨迹 #" << generation_ << ": "
                      << points_.size() << " 点, " << durationMs << " ms -> "
                      << utils::formatJoints(target_) << std::endl;
        }
        return TrajectoryHandle{generation_};
    }

    JointVector sample(double progress) const {
        if (easing_ == Easing::CubicInOut) {
            double e = utils::easeInOutCubic(progress);
            return utils::lerp(points_.front(), points_.back(), e);
        }

        const size_t segments = points_.size() - 1;
        double scaled = progress * static_cast<double>(segments);
        size_t seg = std::min(static_cast<size_t>(scaled), segments - 1);
        double local = scaled - static_cast<double>(seg);
        return utils::lerp(points_[seg], points_[seg + 1], local);
    }

    void finish() {
        commanded_ = target_;
        state_ = State::Idle;
        progress_ = 1.0;
        ++completedCount_;
        points_.clear();

        // 先回到Idle再回调，回调内可立即启动下一条轨迹
        CompletionCallback callback = std::move(onComplete_);
        onComplete_ = CompletionCallback();

        if (sink_) {
            sink_(commanded_);
        }
        if (callback) {
            callback();
        }
    }

    TimeSource clock_;
    DispatchSink sink_;
    bool streamEveryTick_ = false;
    bool verbose_ = false;

    JointVector commanded_;
    JointVector target_ = JointVector::Zero();
    State state_ = State::Idle;
    uint64_t generation_ = 0;

    std::vector<JointVector> points_;
    double durationMs_ = 0.0;
    double startTimeMs_ = 0.0;
    double progress_ = 0.0;
    Easing easing_ = Easing::CubicInOut;
    CompletionCallback onComplete_;
    size_t completedCount_ = 0;
};

} // namespace armmotion
