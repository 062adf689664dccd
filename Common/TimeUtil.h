#pragma once
#include <cstdint>

// Milliseconds of monotonic uptime. Never goes backwards, unaffected by wall clock changes.
// This is the timestamp source for the rotary history caches.
int64_t time_now_ms();

void GetCurrentTimeFormatted(char formattedTime[13]);
