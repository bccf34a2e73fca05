#pragma once

/**
 * @file profiling.h
 * @brief Profiling support using Tracy profiler
 *
 * Wrapper macros for Tracy zones. They expand to nothing unless TRACY_ENABLE is defined.
 */

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>

#define CHUNKWISE_ZONE_SCOPED() ZoneScoped
#define CHUNKWISE_ZONE_SCOPED_N(name) ZoneScopedN(name)
#define CHUNKWISE_PLOT(name, val) TracyPlot(name, val)

#define CHUNKWISE_STRATEGY_ZONE(strategy) CHUNKWISE_ZONE_SCOPED_N("Chunker::" strategy)

#else

#define CHUNKWISE_ZONE_SCOPED()
#define CHUNKWISE_ZONE_SCOPED_N(name)
#define CHUNKWISE_PLOT(name, val)

#define CHUNKWISE_STRATEGY_ZONE(strategy)

#endif // TRACY_ENABLE
