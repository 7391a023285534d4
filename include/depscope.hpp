#pragma once

#include "depscope/export.hpp"
#include "depscope/fwd.hpp"
#include "depscope/logging.hpp"
#include "depscope/exceptions.hpp"
#include "depscope/value.hpp"
#include "depscope/exit_stack.hpp"
#include "depscope/signature.hpp"
#include "depscope/dependency.hpp"
#include "depscope/producer.hpp"
#include "depscope/function.hpp"
#include "depscope/resolution_context.hpp"
#include "depscope/depends.hpp"
#include "depscope/shared.hpp"
#include "depscope/resolution.hpp"
#include "depscope/bridge.hpp"
#include "depscope/validation.hpp"
