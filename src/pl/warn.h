#pragma once

#include "pl/dbg.h"

#ifndef PULSELED_WARN
#define PULSELED_WARN PULSELED_DBG
#define PULSELED_WARN_IF PULSELED_DBG_IF
#endif

#ifndef PL_WARN
#define PL_WARN PULSELED_WARN
#define PL_WARN_IF PULSELED_WARN_IF
#endif
