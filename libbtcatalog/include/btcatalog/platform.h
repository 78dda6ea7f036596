/**
 * @file platform.h
 * @brief Platform detection and abstraction macros for btcatalog
 *
 * btcatalog talks to BlueZ over D-Bus and therefore only builds on Linux.
 */

#ifndef BTCATALOG_PLATFORM_H
#define BTCATALOG_PLATFORM_H

// ============================================================================
// Platform Detection (Linux only)
// ============================================================================

#if !defined(__linux__)
#error "Unsupported platform. btcatalog only supports Linux (BlueZ)."
#endif

// ============================================================================
// Export/Import Macros
// ============================================================================

#ifdef BTCATALOG_BUILDING_SHARED
#define BTCATALOG_API __attribute__((visibility("default")))
#else
#define BTCATALOG_API
#endif

// ============================================================================
// Utility Macros
// ============================================================================

#define BTCATALOG_UNUSED(x) (void)(x)

#endif // BTCATALOG_PLATFORM_H
