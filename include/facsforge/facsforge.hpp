#pragma once

#include <facsforge/channel.hpp>
#include <facsforge/config.hpp>
#include <facsforge/error.hpp>
#include <facsforge/evaluation.hpp>
#include <facsforge/event_matrix.hpp>
#include <facsforge/export.hpp>
#include <facsforge/gate.hpp>
#include <facsforge/hierarchy.hpp>
#include <facsforge/logger.hpp>
#include <facsforge/overlay.hpp>
#include <facsforge/transform.hpp>
#include <facsforge/workspace.hpp>

// ─── Typical use ─────────────────────────────────────────────────────────────
//
//   auto plan   = facsforge::build_analysis(facsforge::load_config("exp.yaml"));
//   auto events = facsforge::drop_ignored(plan, facsforge::load_events_csv("s1.csv"));
//   auto result = facsforge::evaluate(plan.hierarchy, plan.transforms, events);
//   for (const auto& s : facsforge::summarize(plan.hierarchy, result))
//       std::printf("%s: %zu\n", s.name.c_str(), s.count);
