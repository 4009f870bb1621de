#pragma once

#include "core/Error.hpp"
#include "core/Geometry.hpp"
#include "core/WidgetHandlers.hpp"
#include "core/WidgetId.hpp"
#include "core/WidgetTree.hpp"
#include "events/EventContext.hpp"
#include "events/EventManager.hpp"
#include "io/InputEvents.hpp"
#include "reactive/Link.hpp"
#include "runtime/DebugFlags.hpp"
#include "runtime/FrameLoop.hpp"
#include "runtime/RuntimeConfig.hpp"
#include "scheduler/DirtyScheduler.hpp"
#include "spatial/IntervalTree.hpp"
#include "spatial/SpatialIndex.hpp"
