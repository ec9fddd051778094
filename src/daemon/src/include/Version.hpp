/*
 * GPU Fan Control — Version
 * (c) 2025 GpuFanControl contributors
 */
#pragma once

// Normally injected by CMake from project(VERSION ...).
#ifndef GFC_VERSION
#define GFC_VERSION "0.1.0"
#endif
