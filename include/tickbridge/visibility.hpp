#pragma once

// Shared library visibility macros:
//
// TICKBRIDGE_API - public symbol (exported from shared library)
// TICKBRIDGE_LOCAL - private symbol (not visible outside shared library)
//
// The library is built with `-fvisibility=hidden`, so the latter is
// only needed to hide private parts of exported classes.

#ifndef _WIN32
	#define TICKBRIDGE_API __attribute__((visibility("default")))
	#define TICKBRIDGE_LOCAL __attribute__((visibility("hidden")))
#else
	#ifdef TICKBRIDGE_EXPORTS
		#define TICKBRIDGE_API __declspec(dllexport)
	#else
		#define TICKBRIDGE_API __declspec(dllimport)
	#endif
	#define TICKBRIDGE_LOCAL
#endif
