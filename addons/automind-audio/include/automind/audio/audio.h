#pragma once

// automind Audio - Main Include
// Include this header to use the sources and analysis stages

// Audio sources
#include <automind/audio/capture_source.h>
#include <automind/audio/signal_source.h>

// Audio analysis
#include <automind/audio/spectral_analyzer.h>
#include <automind/audio/onset_detector.h>
#include <automind/audio/fatigue_monitor.h>
