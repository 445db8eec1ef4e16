#pragma once

// Umbrella header for the kern status vocabulary.

#include "kern/config/KernConfig.hpp"
#include "kern/fs/KPath.hpp"
#include "kern/log/Check.hpp"
#include "kern/log/Log.hpp"
#include "kern/log/LogConfig.hpp"
#include "kern/log/LogFormatter.hpp"
#include "kern/log/LogSeverity.hpp"
#include "kern/log/LogSinks.hpp"
#include "kern/status/ExceptionTranslator.hpp"
#include "kern/status/Expected.hpp"
#include "kern/status/Status.hpp"
#include "kern/status/StatusCode.hpp"
#include "kern/status/StatusOr.hpp"
#include "kern/status/UseStatus.hpp"
