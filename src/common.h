/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#pragma once

#include "sjson_codec.h"
#include "utils/fs_utils.h"
#include "utils/log.h"
