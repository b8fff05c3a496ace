/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The Orchestra Authors
 * This file is part of the Orchestra project.
 */

#pragma once

/**
 * @file OrchestraCore.h
 * @brief Single header that includes all Orchestra components
 */

// Core common utilities
#include "CoreCommon.h"

// Players and stages
#include "Core/FunctionPlayer.h"
#include "Core/Player.h"
#include "Core/Stage.h"
#include "Core/StageErrors.h"

// Logging
#include "Logging/ConsoleSink.h"
#include "Logging/ILogSink.h"
#include "Logging/LogEntry.h"
#include "Logging/LogLevel.h"
#include "Logging/Logger.h"

// Concurrency
#include "Concurrency/FanOut.h"
