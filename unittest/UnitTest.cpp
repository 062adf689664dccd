// Copyright (c) 2024- Rotary Project.

// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, version 2.0 or later versions.

// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License 2.0 for more details.

// A copy of the GPL 2.0 should have been included with the program.
// If not, see http://www.gnu.org/licenses/


// UnitTests
//
// This is a program to directly test the focus navigation pieces, without going
// through a real window system. Everything runs on an in-memory view tree.
//
// To use, set command line parameter to one of the tests below, or "all".
// Search for "availableTests".
//
// Example of how to run with CMake:
//
// build/rotary_unittest FocusArea

#include "rotary_config.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "Common/CommonFuncs.h"
#include "Common/Log/LogManager.h"
#include "Rotary/RotaryConfig.h"

#include "unittest/UnitTest.h"

typedef bool (*TestFunc)();
struct TestItem {
	const char *name;
	TestFunc func;
};

#define TEST_ITEM(name) { #name, &Test ##name, }

bool TestRotaryCache();
bool TestFocusUtils();
bool TestFocusArea();
bool TestFocusParkingView();
bool TestRotaryController();
bool TestRotaryConfig();

TestItem availableTests[] = {
	TEST_ITEM(RotaryCache),
	TEST_ITEM(FocusUtils),
	TEST_ITEM(FocusArea),
	TEST_ITEM(FocusParkingView),
	TEST_ITEM(RotaryController),
	TEST_ITEM(RotaryConfig),
};

int main(int argc, const char *argv[]) {
	g_RotaryConfig.bEnableLogging = true;
	g_logManager.Init(&g_RotaryConfig.bEnableLogging);
	// Some tests look for specific messages in the ring buffer.
	g_logManager.EnableOutput(LogOutput::Stdio);
	g_logManager.EnableOutput(LogOutput::RingBuffer);

	bool allTests = false;
	TestFunc testFunc = nullptr;
	if (argc >= 2) {
		if (!strcasecmp(argv[1], "all")) {
			allTests = true;
		}
		for (auto f : availableTests) {
			if (!strcasecmp(argv[1], f.name)) {
				testFunc = f.func;
				break;
			}
		}
	}

	if (allTests) {
		int passes = 0;
		int fails = 0;
		for (auto f : availableTests) {
			if (f.func()) {
				++passes;
			} else {
				printf("%s: FAILED\n", f.name);
				++fails;
			}
		}
		if (passes > 0) {
			printf("%d tests passed.\n", passes);
		}
		if (fails > 0) {
			printf("%d tests failed!\n", fails);
			return 2;
		}
	} else if (testFunc == nullptr) {
		fprintf(stderr, "You may select a test to run by passing an argument, either \"all\" or one of the below.\n");
		fprintf(stderr, "\n");
		fprintf(stderr, "Available tests:\n");
		for (auto f : availableTests) {
			fprintf(stderr, "  * %s\n", f.name);
		}
		return 1;
	} else {
		if (!testFunc()) {
			return 2;
		}
	}

	g_logManager.Shutdown();
	return 0;
}
