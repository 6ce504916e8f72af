#ifndef ARMADA_LOG_H
#define ARMADA_LOG_H

#include <stdbool.h>
#include <stdarg.h>
#include <stdint.h>

/**
 * Armada Logging System
 *
 * File-based logging with subsystem tags and log levels. Console output is
 * echoed through SDL_Log.
 *
 * Usage:
 *   armada_log_init();  // Default path: /tmp/armada.log (Unix) or armada.log (Windows)
 *
 *   armada_log_info(ARMADA_LOG_CORE, "Match started, seed %u", seed);
 *   armada_log_debug(ARMADA_LOG_AI, "Threat level %.2f", threat);
 *   armada_log_error(ARMADA_LOG_COMBAT, "Invalid movement: %s", reason);
 *
 *   armada_log_shutdown();
 *
 * Output format (turn tag present once armada_log_set_turn() was called):
 *   [2024-01-15 14:30:22] [ERROR  ] [Combat    ] [T012] Invalid movement: ...
 */

/**
 * Log levels - higher values include lower levels
 */
typedef enum {
    ARMADA_LOG_LEVEL_ERROR = 0,    /**< Always logged, auto-flush */
    ARMADA_LOG_LEVEL_WARNING = 1,
    ARMADA_LOG_LEVEL_INFO = 2,
    ARMADA_LOG_LEVEL_DEBUG = 3
} Armada_LogLevel;

/**
 * Subsystem identifiers
 */
#define ARMADA_LOG_CORE     "Core"
#define ARMADA_LOG_FLEET    "Fleet"
#define ARMADA_LOG_COMBAT   "Combat"
#define ARMADA_LOG_AI       "AI"
#define ARMADA_LOG_CONFIG   "Config"
#define ARMADA_LOG_GAME     "Game"

/**
 * Callback invoked for every message that passes the level filter.
 *
 * @param level     Message level
 * @param subsystem Subsystem name padded to 10 characters
 * @param message   Formatted message (no timestamp)
 * @param userdata  User pointer passed at registration
 */
typedef void (*Armada_LogCallback)(Armada_LogLevel level,
                                   const char *subsystem,
                                   const char *message,
                                   void *userdata);

/**
 * Initialize the logging system with the default log file path.
 *
 * @return true on success, false on failure
 */
bool armada_log_init(void);

/**
 * Initialize the logging system with a custom log file path.
 *
 * @param path Path to the log file (NULL uses default)
 * @return true on success, false on failure
 */
bool armada_log_init_with_path(const char *path);

/**
 * Write the session end marker and close the log file.
 */
void armada_log_shutdown(void);

bool armada_log_is_initialized(void);

/**
 * Set the current log level filter.
 * Messages above this level will not be logged. Default is INFO.
 */
void armada_log_set_level(Armada_LogLevel level);
Armada_LogLevel armada_log_get_level(void);

/**
 * Set whether to also output to console (SDL_Log). Enabled by default.
 */
void armada_log_set_console_output(bool enabled);

void armada_log_error(const char *subsystem, const char *fmt, ...);
void armada_log_warning(const char *subsystem, const char *fmt, ...);
void armada_log_info(const char *subsystem, const char *fmt, ...);
void armada_log_debug(const char *subsystem, const char *fmt, ...);

/**
 * Log with explicit level (va_list version).
 */
void armada_log_v(Armada_LogLevel level, const char *subsystem, const char *fmt, va_list args);

/**
 * Tag subsequent lines with a game turn. 0 removes the tag.
 */
void armada_log_set_turn(int32_t turn);
int32_t armada_log_get_turn(void);

void armada_log_flush(void);

/**
 * Get the path to the current log file.
 *
 * @return Path to log file, or NULL if not initialized
 */
const char *armada_log_get_path(void);

/**
 * Register a log callback.
 *
 * @return Handle for removal, or 0 if no slot is free
 */
uint32_t armada_log_add_callback(Armada_LogCallback callback, void *userdata);

/**
 * Remove a previously registered callback (0 is ignored).
 */
void armada_log_remove_callback(uint32_t handle);

#endif /* ARMADA_LOG_H */
