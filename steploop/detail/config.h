#pragma once

/**
 * When enabled every message dispatched by test_looper is logged at INFO
 * level, which helps when a test drains an unexpected number of messages.
 */
#ifndef STEPLOOP_TRACE_DISPATCH
#define STEPLOOP_TRACE_DISPATCH 0
#endif
