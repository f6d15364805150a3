/**
 * @file ActionSequencePlayer.hpp
 * @brief 动作序列播放器 - 预置关键帧动作 (挥手/点头/转圈/跳舞/抓取演示)
 *
 * 每个关键帧先钳制再验证，通过后经 TrajectoryExecutor 播放，
 * 完成回调中启动下一帧。同一时刻只播放一个序列。
 *
 * @version 1.0.0
 * @date 2026-10-16
 */

#pragma once

#include "Types.hpp"
#include "ArmConfig.hpp"
#include "JointSafetyEnforcer.hpp"
#include "CollisionValidator.hpp"
#include "TrajectoryExecutor.hpp"

#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace armmotion {

// ============================================================================
// 动作数据
// ============================================================================

/**
 * @brief 关键帧
 */
struct Keyframe {
    JointVector angles = JointVector::Zero();   // deg
    double durationMs = 500.0;
    std::optional<bool> gripperOpen;            // 有值时在运动前设置夹爪

    Keyframe() = default;
    Keyframe(const JointVector& q, double duration)
        : angles(q), durationMs(duration) {}
    Keyframe(const JointVector& q, double duration, bool open)
        : angles(q), durationMs(duration), gripperOpen(open) {}
};

/**
 * @brief 动作序列
 */
struct ActionSequence {
    std::string name;
    std::string description;
    std::vector<Keyframe> keyframes;

    bool empty() const { return keyframes.empty(); }
    size_t size() const { return keyframes.size(); }

    double totalDurationMs() const {
        double total = 0.0;
        for (const auto& kf : keyframes) total += std::max(0.0, kf.durationMs);
        return total;
    }
};

/**
 * @brief 动作库 (按名称索引)
 */
class ActionLibrary {
public:
    /// 添加序列，名称已存在时返回false
    bool add(const ActionSequence& sequence) {
        return sequences_.emplace(sequence.name, sequence).second;
    }

    const ActionSequence* find(const std::string& name) const {
        auto it = sequences_.find(name);
        return it == sequences_.end() ? nullptr : &it->second;
    }

    bool contains(const std::string& name) const { return sequences_.count(name) > 0; }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        for (const auto& kv : sequences_) out.push_back(kv.first);
        return out;
    }

    size_t size() const { return sequences_.size(); }

    /**
     * @brief 内置动作库
     *
     * 所有关键帧在默认配置下均通过钳制与碰撞验证。
     */
    static ActionLibrary builtin() {
        ActionLibrary lib;

        // 关节顺序: 基座, 大臂, 小臂, 腕部旋转, 腕部俯仰, 末端
        const JointVector home = makeJoints({0, 0, 0, 0, 0, 0});

        lib.add({"home", "回到零位", {
            Keyframe(home, 1000)
        }});

        const JointVector raised = makeJoints({0, 20, 60, 0, 0, 0});
        lib.add({"wave", "挥手", {
            Keyframe(raised, 800),
            Keyframe(makeJoints({0, 20, 60, 0, 30, 0}), 400),
            Keyframe(makeJoints({0, 20, 60, 0, -30, 0}), 400),
            Keyframe(makeJoints({0, 20, 60, 0, 30, 0}), 400),
            Keyframe(makeJoints({0, 20, 60, 0, -30, 0}), 400),
            Keyframe(home, 800)
        }});

        const JointVector bow = makeJoints({0, 10, 20, 0, 40, 0});
        lib.add({"nod", "点头", {
            Keyframe(home, 500),
            Keyframe(bow, 400),
            Keyframe(home, 400),
            Keyframe(bow, 400),
            Keyframe(home, 400)
        }});

        lib.add({"spin", "转圈", {
            Keyframe(makeJoints({0, 10, 30, 0, 0, 0}), 600),
            Keyframe(makeJoints({90, 10, 30, 0, 0, 0}), 800),
            Keyframe(makeJoints({180, 10, 30, 0, 0, 0}), 800),
            Keyframe(makeJoints({90, 10, 30, 0, 0, 0}), 800),
            Keyframe(makeJoints({0, 10, 30, 0, 0, 0}), 800),
            Keyframe(home, 600)
        }});

        lib.add({"dance", "跳舞", {
            Keyframe(makeJoints({30, 15, 45, 90, 20, 0}), 600),
            Keyframe(makeJoints({-30, 15, 45, -90, -20, 0}), 600),
            Keyframe(makeJoints({30, -15, 30, 90, 20, 45}), 600),
            Keyframe(makeJoints({-30, -15, 30, -90, -20, -45}), 600),
            Keyframe(home, 800)
        }});

        const JointVector above = makeJoints({0, 20, 40, 0, 30, 0});
        const JointVector grasp = makeJoints({0, 45, 60, 0, 45, 0});
        const JointVector aboveDrop = makeJoints({90, 20, 40, 0, 30, 0});
        const JointVector drop = makeJoints({90, 45, 60, 0, 45, 0});
        lib.add({"pick_demo", "抓取演示", {
            Keyframe(above, 1000, true),
            Keyframe(grasp, 1000),
            Keyframe(grasp, 500, false),
            Keyframe(above, 1000),
            Keyframe(aboveDrop, 1200),
            Keyframe(drop, 1000),
            Keyframe(drop, 500, true),
            Keyframe(aboveDrop, 800),
            Keyframe(home, 1200)
        }});

        return lib;
    }

private:
    std::map<std::string, ActionSequence> sequences_;
};

// ============================================================================
// 播放结果
// ============================================================================

/// 播放请求状态
enum class PlayStatus {
    Started,            // 已开始
    AlreadyPlaying,     // 已有序列在播放，忽略
    UnknownSequence,    // 名称不存在
    EmptySequence,      // 序列无关键帧
    ValidationFailed,   // 首帧验证失败
    Refused             // 控制器拒绝 (急停中)
};

struct PlayResult {
    PlayStatus status = PlayStatus::UnknownSequence;
    std::string sequence;
    int failedKeyframe = -1;
    SafetyVerdict verdict;

    bool isSuccess() const { return status == PlayStatus::Started; }

    std::string statusString() const {
        switch (status) {
            case PlayStatus::Started: return "Started";
            case PlayStatus::AlreadyPlaying: return "Already Playing";
            case PlayStatus::UnknownSequence: return "Unknown Sequence";
            case PlayStatus::EmptySequence: return "Empty Sequence";
            case PlayStatus::ValidationFailed: return "Validation Failed";
            case PlayStatus::Refused: return "Refused";
            default: return "Unknown";
        }
    }
};

/// 上一次播放的结束方式
enum class PlaybackOutcome {
    None,          // 尚未结束过
    Completed,     // 全部关键帧完成
    Stopped,       // stop() 主动停止
    Interrupted,   // 被其他轨迹覆盖
    Aborted        // 关键帧验证失败
};

inline const char* playbackOutcomeString(PlaybackOutcome outcome) {
    switch (outcome) {
        case PlaybackOutcome::None: return "None";
        case PlaybackOutcome::Completed: return "Completed";
        case PlaybackOutcome::Stopped: return "Stopped";
        case PlaybackOutcome::Interrupted: return "Interrupted";
        case PlaybackOutcome::Aborted: return "Aborted";
        default: return "Unknown";
    }
}

// ============================================================================
// 播放器
// ============================================================================

class ActionSequencePlayer {
public:
    using GripperSink = std::function<void(bool open)>;

    // 完成回调捕获this，禁止复制和移动
    ActionSequencePlayer(const ActionSequencePlayer&) = delete;
    ActionSequencePlayer& operator=(const ActionSequencePlayer&) = delete;
    ActionSequencePlayer(ActionSequencePlayer&&) = delete;
    ActionSequencePlayer& operator=(ActionSequencePlayer&&) = delete;

    /**
     * @brief 构造函数
     * @param executor 轨迹执行器 (不拥有)
     * @param config 机械臂配置
     * @param library 动作库，构造后只读
     */
    explicit ActionSequencePlayer(TrajectoryExecutor& executor,
                                  const ArmConfig& config = ArmConfig::defaultArm(),
                                  ActionLibrary library = ActionLibrary::builtin())
        : executor_(executor), enforcer_(config.limits), validator_(config),
          library_(std::move(library)) {}

    void setGripperSink(GripperSink sink) { gripperSink_ = std::move(sink); }
    void setVerbose(bool verbose) { verbose_ = verbose; }

    /**
     * @brief 按名称播放内置动作
     */
    PlayResult play(const std::string& name) {
        // 先识别两次 tick 之间被其他写入者覆盖的序列
        update();
        if (playing_) {
            return rejectConcurrent(name);
        }
        const ActionSequence* sequence = library_.find(name);
        if (!sequence) {
            PlayResult result;
            result.status = PlayStatus::UnknownSequence;
            result.sequence = name;
            std::cerr << "[ActionSequencePlayer] 未知动作: " << name << std::endl;
            return result;
        }
        return playSequence(*sequence);
    }

    /**
     * @brief 播放临时序列 (规则同 play)
     */
    PlayResult playSequence(const ActionSequence& sequence) {
        update();
        if (playing_) {
            return rejectConcurrent(sequence.name);
        }

        PlayResult result;
        result.sequence = sequence.name;
        if (sequence.empty()) {
            result.status = PlayStatus::EmptySequence;
            std::cerr << "[ActionSequencePlayer] 动作 '" << sequence.name << "' 没有关键帧" << std::endl;
            return result;
        }

        sequence_ = sequence;
        playing_ = true;
        abortVerdict_ = SafetyVerdict();
        abortedKeyframe_ = -1;

        if (verbose_) {
            std::cout << "[ActionSequencePlayer] 开始播放 '" << sequence_.name << "' ("
                      << sequence_.size() << " 帧, " << sequence_.totalDurationMs() << " ms)" << std::endl;
        }

        if (!startKeyframe(0)) {
            result.status = PlayStatus::ValidationFailed;
            result.failedKeyframe = 0;
            result.verdict = abortVerdict_;
            return result;
        }

        result.status = PlayStatus::Started;
        return result;
    }

    /**
     * @brief 停止播放，停在当前位置，不复位
     * @return 是否有序列被停止
     */
    bool stop() {
        if (!playing_) return false;
        executor_.cancel(handle_);
        finish(PlaybackOutcome::Stopped);
        return true;
    }

    /**
     * @brief 每个tick调用，检测轨迹是否被其他写入者覆盖
     */
    void update() {
        if (!playing_) return;
        if (!executor_.isCurrent(handle_)) {
            std::cerr << "[ActionSequencePlayer] '" << sequence_.name << "' 第 "
                      << currentKeyframe_ << " 帧被覆盖, 播放中断" << std::endl;
            finish(PlaybackOutcome::Interrupted);
        }
    }

    bool isPlaying() const { return playing_; }
    const std::string& currentSequence() const { return sequence_.name; }
    int currentKeyframe() const { return currentKeyframe_; }
    PlaybackOutcome lastOutcome() const { return lastOutcome_; }
    int abortedKeyframe() const { return abortedKeyframe_; }
    const SafetyVerdict& abortVerdict() const { return abortVerdict_; }
    const ActionLibrary& library() const { return library_; }

private:
    PlayResult rejectConcurrent(const std::string& name) {
        std::cerr << "[ActionSequencePlayer] 正在播放 '" << sequence_.name
                  << "', 忽略 '" << name << "'" << std::endl;
        PlayResult result;
        result.status = PlayStatus::AlreadyPlaying;
        result.sequence = name;
        return result;
    }

    bool startKeyframe(int index) {
        const Keyframe& frame = sequence_.keyframes[index];

        JointVector safe = enforcer_.clamp(frame.angles);
        SafetyVerdict verdict = validator_.check(safe);
        if (!verdict.ok) {
            std::cerr << "[ActionSequencePlayer] '" << sequence_.name << "' 第 " << index
                      << " 帧验证失败: " << verdict.summary() << std::endl;
            abortVerdict_ = verdict;
            abortedKeyframe_ = index;
            finish(PlaybackOutcome::Aborted);
            return false;
        }

        if (frame.gripperOpen && gripperSink_) {
            gripperSink_(*frame.gripperOpen);
        }

        currentKeyframe_ = index;
        handle_ = executor_.run(safe, frame.durationMs, [this]() { onKeyframeComplete(); });
        return true;
    }

    void onKeyframeComplete() {
        int next = currentKeyframe_ + 1;
        if (next >= static_cast<int>(sequence_.size())) {
            finish(PlaybackOutcome::Completed);
            return;
        }
        startKeyframe(next);
    }

    void finish(PlaybackOutcome outcome) {
        playing_ = false;
        lastOutcome_ = outcome;
        handle_ = TrajectoryHandle();
        if (verbose_) {
            std::cout << "[ActionSequencePlayer] '" << sequence_.name << "' 结束: "
                      << playbackOutcomeString(outcome) << std::endl;
        }
    }

    TrajectoryExecutor& executor_;
    JointSafetyEnforcer enforcer_;
    CollisionValidator validator_;
    const ActionLibrary library_;
    GripperSink gripperSink_;
    bool verbose_ = false;

    ActionSequence sequence_;
    bool playing_ = false;
    int currentKeyframe_ = -1;
    TrajectoryHandle handle_;
    PlaybackOutcome lastOutcome_ = PlaybackOutcome::None;
    int abortedKeyframe_ = -1;
    SafetyVerdict abortVerdict_;
};

} // namespace armmotion
