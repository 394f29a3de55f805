// SPDX-License-Identifier: Apache-2.0

// Single translation unit for the miniaudio implementation.
// Compiled exactly once; MiniaudioBackend includes <miniaudio.h> without the IMPLEMENTATION define.
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>
