#include "rotary_config.h"

#include <cstdio>
#include <cstdint>
#include <chrono>
#include <ctime>

#include "Common/TimeUtil.h"

#ifdef _WIN32
#include <sys/timeb.h>
#else
#include <sys/time.h>
#include <unistd.h>
#endif

#if ROTARY_PLATFORM(WINDOWS)

// QueryPerformanceCounter is what steady_clock wraps on MSVC anyway.
typedef std::chrono::steady_clock Clock;

int64_t time_now_ms() {
	return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now().time_since_epoch()).count();
}

#else

int64_t time_now_ms() {
	// Uptime, so values from different components compare.
	struct timespec tp;
	clock_gettime(CLOCK_MONOTONIC, &tp);
	return (int64_t)tp.tv_sec * 1000 + tp.tv_nsec / 1000000;
}

#endif

void GetCurrentTimeFormatted(char formattedTime[13]) {
	time_t sysTime;
	time(&sysTime);

	uint32_t milliseconds;
#ifdef _WIN32
	struct timeb tp;
	(void)::ftime(&tp);
	milliseconds = tp.millitm;
#else
	struct timeval t;
	(void)gettimeofday(&t, NULL);
	milliseconds = (int)(t.tv_usec / 1000);
#endif

	struct tm *gmTime = localtime(&sysTime);
	char tmp[6];
	strftime(tmp, sizeof(tmp), "%M:%S", gmTime);

	// Now tack on the milliseconds
	snprintf(formattedTime, 11, "%s:%03u", tmp, milliseconds % 1000);
}
