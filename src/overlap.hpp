#pragma once

#include <algorithm>
#include <cstddef>
#include <set>
#include <utility>
#include <vector>

namespace tc_season {

template <typename T>
struct OverlapSpan {
  T start;
  T end;
  std::vector<std::size_t> members;  // interval indices, ascending
};

// Sweep over interval boundaries. Every time span during which at least two
// intervals are active is reported once, with the active set.
// Boundaries at equal times are ordered start-before-end; intervals that only
// touch at one instant yield no span.
template <typename T>
std::vector<OverlapSpan<T>> findOverlaps(const std::vector<std::pair<T, T>>& intervals) {
  struct Event {
    T time;
    int kind;  // 0 = start, 1 = end
    std::size_t index;
  };

  std::vector<Event> events;
  events.reserve(intervals.size() * 2);
  for (std::size_t i = 0; i < intervals.size(); ++i) {
    events.push_back(Event{intervals[i].first, 0, i});
    events.push_back(Event{intervals[i].second, 1, i});
  }

  std::stable_sort(events.begin(), events.end(), [](const Event& a, const Event& b) {
    if (a.time < b.time) return true;
    if (b.time < a.time) return false;
    return a.kind < b.kind;
  });

  std::vector<OverlapSpan<T>> spans;
  std::set<std::size_t> active;
  const Event* prev = nullptr;

  for (const Event& ev : events) {
    if (prev != nullptr && prev->time < ev.time && active.size() >= 2) {
      spans.push_back(OverlapSpan<T>{prev->time, ev.time,
                                     std::vector<std::size_t>(active.begin(), active.end())});
    }

    if (ev.kind == 0) {
      active.insert(ev.index);
    } else {
      active.erase(ev.index);
    }
    prev = &ev;
  }

  return spans;
}

}  // namespace tc_season
