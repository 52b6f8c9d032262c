#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
// -----------------------------------------------------------------------------
//
// L1: cheap counters on control paths (connects, reconnects, gaps)
// L2: per-message counters on the data path
//

#if defined(TIDEWIRE_ENABLE_TELEMETRY_L1)
    #define TW_TL1(expr) expr
#else
    #define TW_TL1(expr) ((void)0)
#endif

#if defined(TIDEWIRE_ENABLE_TELEMETRY_L2)
    #define TW_TL2(expr) expr
#else
    #define TW_TL2(expr) ((void)0)
#endif
