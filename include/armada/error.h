#ifndef ARMADA_ERROR_H
#define ARMADA_ERROR_H

#include <stdbool.h>
#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>

/**
 * Armada Error Handling System
 *
 * Two layers:
 *
 * 1. A thread-local "last error" buffer with printf-style formatting. Every
 *    API call that fails sets it and returns false/NULL.
 *
 *      if (!armada_movement_create(&comp, "enemy_home", turn, &move)) {
 *          armada_log_error(ARMADA_LOG_FLEET, "%s", armada_get_last_error());
 *      }
 *
 * 2. An explicit error log object that an orchestrator owns and hands to the
 *    engine. It classifies reported errors, keeps a bounded history and
 *    tells the caller whether the session can continue.
 *
 *      Armada_ErrorLog *log = armada_error_log_create(0);
 *      Armada_ErrorResponse r = armada_error_log_report(log,
 *          ARMADA_ERROR_GAME_LOGIC, ARMADA_SEVERITY_HIGH, turn,
 *          "AI produced invalid decision: %s", reason);
 *      if (!r.can_continue) { ... }
 *      armada_error_log_destroy(log);
 */

/*============================================================================
 * Last Error (thread-local)
 *============================================================================*/

/**
 * Set an error message with printf-style formatting.
 * The message is stored in a thread-local buffer.
 *
 * @param fmt Format string (printf-style)
 * @param ... Format arguments
 */
void armada_set_error(const char *fmt, ...);

/**
 * Set an error message with va_list arguments.
 *
 * @param fmt Format string (printf-style)
 * @param args va_list of format arguments
 */
void armada_set_error_v(const char *fmt, va_list args);

/**
 * Get the last error message.
 * Returns an empty string if no error has been set.
 *
 * @return Pointer to the error message (thread-local, do not free)
 */
const char *armada_get_last_error(void);

/**
 * Clear the last error message.
 */
void armada_clear_error(void);

/**
 * Check if an error is currently set.
 *
 * @return true if an error message is set, false otherwise
 */
bool armada_has_error(void);

/**
 * Log the last error to SDL_Log and clear it.
 */
void armada_log_and_clear_error(void);

/*============================================================================
 * Error Classification
 *============================================================================*/

#define ARMADA_ERROR_LOG_DEFAULT_CAPACITY 100
#define ARMADA_ERROR_MESSAGE_MAX 256

typedef enum Armada_ErrorCategory {
    ARMADA_ERROR_VALIDATION = 0,   /* State failed a consistency check */
    ARMADA_ERROR_RUNTIME,          /* Unexpected failure during a turn */
    ARMADA_ERROR_USER_INPUT,       /* Rejected command from the player */
    ARMADA_ERROR_SYSTEM,           /* Environment failure (files, memory) */
    ARMADA_ERROR_GAME_LOGIC,       /* Engine produced an illegal action */
    ARMADA_ERROR_CATEGORY_COUNT
} Armada_ErrorCategory;

typedef enum Armada_ErrorSeverity {
    ARMADA_SEVERITY_LOW = 0,
    ARMADA_SEVERITY_MEDIUM,
    ARMADA_SEVERITY_HIGH,
    ARMADA_SEVERITY_CRITICAL,
    ARMADA_SEVERITY_COUNT
} Armada_ErrorSeverity;

/**
 * One recorded error
 */
typedef struct Armada_ErrorRecord {
    Armada_ErrorCategory category;
    Armada_ErrorSeverity severity;
    int32_t turn;                          /* Game turn, 0 if unknown */
    bool recoverable;
    char message[ARMADA_ERROR_MESSAGE_MAX];
} Armada_ErrorRecord;

/**
 * What the caller should do after reporting an error
 */
typedef struct Armada_ErrorResponse {
    bool can_continue;
    bool should_restart;
    const char *user_message;              /* Static string, do not free */
} Armada_ErrorResponse;

typedef struct Armada_ErrorLog Armada_ErrorLog;

/*============================================================================
 * Error Log
 *============================================================================*/

/**
 * Create an error log.
 *
 * @param capacity Maximum retained records (0 = default of 100). Once full,
 *                 the oldest record is evicted.
 * @return New error log, or NULL on failure
 */
Armada_ErrorLog *armada_error_log_create(size_t capacity);

/**
 * Destroy an error log.
 *
 * @param log Error log (NULL is safe)
 */
void armada_error_log_destroy(Armada_ErrorLog *log);

/**
 * Record an error and compute the response.
 * The message is also written to the logging system at a level matching
 * the severity.
 *
 * @param log      Error log (NULL only computes the response)
 * @param category Error category
 * @param severity Error severity
 * @param turn     Game turn the error occurred on (0 if unknown)
 * @param fmt      Printf-style message
 * @return Response telling the caller whether to continue or restart
 */
Armada_ErrorResponse armada_error_log_report(Armada_ErrorLog *log,
                                             Armada_ErrorCategory category,
                                             Armada_ErrorSeverity severity,
                                             int32_t turn,
                                             const char *fmt, ...);

/**
 * Report a batch of state validation messages as one validation error.
 * Severity is derived from the messages: anything mentioning a negative,
 * null or missing value is critical; inconsistent, invalid state or
 * corrupted data is high; everything else is medium.
 *
 * @param log      Error log
 * @param messages Array of validation messages
 * @param count    Number of messages (0 reports nothing)
 * @param turn     Game turn
 * @return Response for the combined error (can_continue when count is 0)
 */
Armada_ErrorResponse armada_error_log_report_validation(Armada_ErrorLog *log,
                                                        const char *const *messages,
                                                        size_t count,
                                                        int32_t turn);

/**
 * Get number of retained records.
 */
size_t armada_error_log_count(const Armada_ErrorLog *log);

/**
 * Get a retained record (0 = oldest).
 *
 * @return Record pointer, or NULL if index is out of range
 */
const Armada_ErrorRecord *armada_error_log_get(const Armada_ErrorLog *log, size_t index);

/**
 * Get the most recent record, or NULL if the log is empty.
 */
const Armada_ErrorRecord *armada_error_log_latest(const Armada_ErrorLog *log);

/**
 * Count retained records of a given severity.
 */
size_t armada_error_log_count_by_severity(const Armada_ErrorLog *log,
                                          Armada_ErrorSeverity severity);

/**
 * Count retained records of a given category.
 */
size_t armada_error_log_count_by_category(const Armada_ErrorLog *log,
                                          Armada_ErrorCategory category);

/**
 * Remove all retained records.
 */
void armada_error_log_clear(Armada_ErrorLog *log);

/**
 * Whether an error of this category and severity can be recovered from.
 */
bool armada_error_is_recoverable(Armada_ErrorCategory category,
                                 Armada_ErrorSeverity severity);

const char *armada_error_category_name(Armada_ErrorCategory category);
const char *armada_error_severity_name(Armada_ErrorSeverity severity);

#endif /* ARMADA_ERROR_H */
