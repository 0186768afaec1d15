#pragma once

#include "common/utils/Constants.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <vector>

/**
 * @brief 热点去抖网格
 *
 * 像素超过阈值时记录最近超限时间并把衰减截止时间推到 now + decay；
 * 截止时间只会向后推，截止之前（含截止时刻）像素都视为热点。
 */
class HotCellGrid {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = Clock::duration;

    /**
     * @brief 用一帧温度刷新网格
     * @return 本帧超限的像素数
     */
    int update(const std::vector<double>& celsius, double threshold, TimePoint now, Duration decay) {
        int exceeded = 0;
        size_t n = std::min(celsius.size(), Constants::THERMAL_CELLS);
        for (size_t i = 0; i < n; ++i) {
            if (celsius[i] >= threshold) {
                auto& cell = cells_[i];
                cell.lastExceedance = now;
                cell.armed = true;
                auto deadline = now + decay;
                if (deadline > cell.decayDeadline) {
                    cell.decayDeadline = deadline;
                }
                ++exceeded;
            }
        }
        return exceeded;
    }

    bool isHot(size_t index, TimePoint now) const {
        const auto& cell = cells_[index];
        return cell.armed && now <= cell.decayDeadline;
    }

    int activeCount(TimePoint now) const {
        int count = 0;
        for (size_t i = 0; i < cells_.size(); ++i) {
            if (isHot(i, now)) ++count;
        }
        return count;
    }

    /** 当前热点像素下标（行优先） */
    std::vector<int> hotCells(TimePoint now) const {
        std::vector<int> result;
        for (size_t i = 0; i < cells_.size(); ++i) {
            if (isHot(i, now)) result.push_back(static_cast<int>(i));
        }
        return result;
    }

    TimePoint decayDeadline(size_t index) const { return cells_[index].decayDeadline; }
    TimePoint lastExceedance(size_t index) const { return cells_[index].lastExceedance; }

private:
    struct Cell {
        TimePoint lastExceedance{};
        TimePoint decayDeadline{};
        bool armed = false;
    };

    std::array<Cell, Constants::THERMAL_CELLS> cells_{};
};
