#pragma once

#include "priv/common.hpp"
#include "priv/event-loop.hpp"

#include "priv/configuration.hpp"
#include "priv/health-probe.hpp"
#include "priv/readiness-controller.hpp"
#include "priv/process-supervisor.hpp"
#include "priv/presentation.hpp"

#include "priv/launch-orchestrator.hpp"
