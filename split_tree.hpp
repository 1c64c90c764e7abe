/**********************************************************************
 * split_tree.hpp
 * --------------------------------------------------------------------
 *    Append-only forest of timed subgoals plus the active pointer.
 *    Offsets are session elapsed values (pause-aware), never raw
 *    instants, so a split held open across a pause does not grow
 *    while the session is stopped.
 *********************************************************************/
#pragma once
#include "clock.hpp"
#include "util/format_time.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sw {

constexpr std::size_t MAX_SPLITS = 100;

/* ────────────────────────────────────────────────────────────────
*  1.  Records
* ────────────────────────────────────────────────────────────────*/
struct Split {
    std::string                name;
    Duration                   startOffset{};
    std::optional<Duration>    endOffset;      // set once, on close
    WallTime                   startWall{};
    std::optional<WallTime>    endWall;
    std::optional<std::size_t> parent;         // empty → top level
    std::size_t                level = 0;

    bool open() const { return !endOffset.has_value(); }

    // open splits run up to `nowTotal`
    Duration duration(Duration nowTotal) const
    {
        return saturating_sub(endOffset.value_or(nowTotal), startOffset);
    }
};

enum class SplitStatus { Ok, CapacityExceeded, NoActiveSplit };

struct OpenResult {
    SplitStatus status;
    std::size_t index;     // meaningful only for Ok
    bool ok() const { return status == SplitStatus::Ok; }
};

/* display strings for one split, insertion order */
struct SplitRow {
    std::size_t index;     // 0-based position in the tree
    std::size_t level;
    std::string name;
    std::string start;
    std::string end;
    std::string duration;
    bool        open;
    bool        active;
};

/* ────────────────────────────────────────────────────────────────
*  2.  The tree
* ────────────────────────────────────────────────────────────────*/
class SplitTree {
    std::vector<Split>         splits_;
    std::optional<std::size_t> active_;
    std::size_t                capacity_;

    // first open split walking up from `idx` (inclusive)
    std::optional<std::size_t> open_ancestor(std::optional<std::size_t> idx) const
    {
        while (idx && !splits_[*idx].open())
            idx = splits_[*idx].parent;
        return idx;
    }

public:
    explicit SplitTree(std::size_t capacity = MAX_SPLITS)
        : capacity_(capacity)
    { splits_.reserve(capacity_); }

    OpenResult open_split(std::string name,
                          std::optional<std::size_t> parent,
                          Duration offset,
                          WallTime wall)
    {
        if (full())
            return {SplitStatus::CapacityExceeded, 0};
        if (parent && *parent >= splits_.size())
            throw std::out_of_range("split parent index out of range");

        Split s;
        s.name        = std::move(name);
        s.startOffset = offset;
        s.startWall   = wall;
        s.parent      = parent;
        s.level       = parent ? splits_[*parent].level + 1 : 0;
        splits_.push_back(std::move(s));

        active_ = splits_.size() - 1;
        return {SplitStatus::Ok, *active_};
    }

    /* child of the active split, or top level when nothing is active */
    OpenResult open_top_or_sibling(std::string name, Duration offset, WallTime wall)
    {
        return open_split(std::move(name), active_, offset, wall);
    }

    OpenResult open_nested(std::string name, Duration offset, WallTime wall)
    {
        if (!active_) return {SplitStatus::NoActiveSplit, 0};
        return open_split(std::move(name), active_, offset, wall);
    }

    std::optional<std::size_t> close_active(Duration offset, WallTime wall)
    {
        if (!active_) return std::nullopt;

        std::size_t idx = *active_;
        Split& s = splits_[idx];
        s.endOffset = offset < s.startOffset ? s.startOffset : offset;
        s.endWall   = wall;
        active_     = open_ancestor(s.parent);
        return idx;
    }

    /* focus the parent, leaving the current split running */
    std::optional<std::size_t> ascend()
    {
        if (!active_) return std::nullopt;
        std::size_t idx = *active_;
        active_ = open_ancestor(splits_[idx].parent);
        return idx;
    }

    std::vector<SplitRow> snapshot(Duration nowTotal) const
    {
        std::vector<SplitRow> rows;
        rows.reserve(splits_.size());
        for (std::size_t i = 0; i < splits_.size(); ++i) {
            const Split& s = splits_[i];
            Duration end = s.endOffset.value_or(nowTotal);
            rows.push_back({i, s.level, s.name,
                            util::format_duration(s.startOffset),
                            util::format_duration(end < s.startOffset ? s.startOffset : end),
                            util::format_duration(s.duration(nowTotal)),
                            s.open(),
                            active_ == i});
        }
        return rows;
    }

    void clear()
    {
        splits_.clear();
        active_.reset();
    }

    bool full() const { return splits_.size() >= capacity_; }
    std::size_t size() const { return splits_.size(); }
    bool empty() const { return splits_.empty(); }

    const std::optional<std::size_t>& active() const { return active_; }
    const Split& operator[](std::size_t i) const { return splits_[i]; }
    const std::vector<Split>& splits() const { return splits_; }
};

} // namespace sw
