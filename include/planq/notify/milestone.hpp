#pragma once

#include "planq/util/enum.hpp"
#include "planq/util/id.hpp"
#include "planq/util/time.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string>

namespace planq {

enum class MilestoneKind : std::uint8_t {
  QueueStarted,
  TaskMerged,
  PhaseFailed,
  QueueFinished,
};
BOOST_DESCRIBE_ENUM(MilestoneKind, QueueStarted, TaskMerged, PhaseFailed,
                    QueueFinished)
PLANQ_DEFINE_ENUM_SERDE(MilestoneKind, MilestoneKind::QueueStarted)

/// Queue progress reported to outside observers.
struct Milestone {
  MilestoneKind kind{MilestoneKind::QueueStarted};
  PlanId plan_id;
  TaskId task_id;
  std::string message;
  TimePoint ts{Clock::now()};
};

} // namespace planq
