#pragma once

/// @file gita.h
/// Umbrella header for the full gita C++ API.

#include "error.h"
#include "types.h"
#include "log.h"
#include "config.h"
#include "path_store.h"
#include "repo.h"
#include "registry.h"
#include "process.h"
#include "dispatcher.h"
#include "status.h"
#include "commands.h"
