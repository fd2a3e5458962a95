#pragma once

#include "findiff/analysis/analysis_interface.hpp"
#include "findiff/analysis/approximate_central.hpp"
#include "findiff/computation/computation_orchestrator.hpp"
#include "findiff/computation/result_types.hpp"
#include "findiff/core/containers.hpp"
#include "findiff/core/exceptions.hpp"
#include "findiff/derivative/derivative.hpp"
#include "findiff/differences/difference_computer.hpp"
#include "findiff/differences/direction_set.hpp"
#include "findiff/differences/method_registry.hpp"
#include "findiff/engine/derivative_engine.hpp"
#include "findiff/io/config_manager.hpp"
#include "findiff/success/consistency.hpp"
#include "findiff/success/success_evaluator.hpp"
