#pragma once

// Build/version info.
//
// CMake defines DUNGEONCRAWLER_VERSION from the project version.
// Builds outside CMake report "dev".

#ifndef DUNGEONCRAWLER_VERSION
#define DUNGEONCRAWLER_VERSION "dev"
#endif

#ifndef DUNGEONCRAWLER_APPNAME
#define DUNGEONCRAWLER_APPNAME "DungeonCrawler"
#endif
