#include "armada/armada.h"
#include "armada/error.h"
#include "armada/log.h"
#include <SDL3/SDL.h>
#include <stdio.h>
#include <string.h>
#include <ctype.h>

/* Thread-local error buffer */
#define ARMADA_ERROR_BUFFER_SIZE 1024

#if defined(_MSC_VER)
    #define ARMADA_THREAD_LOCAL __declspec(thread)
#elif defined(__cplusplus)
    #define ARMADA_THREAD_LOCAL thread_local
#else
    #define ARMADA_THREAD_LOCAL _Thread_local
#endif

static ARMADA_THREAD_LOCAL char error_buffer[ARMADA_ERROR_BUFFER_SIZE] = {0};

void armada_set_error(const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    armada_set_error_v(fmt, args);
    va_end(args);
}

void armada_set_error_v(const char *fmt, va_list args) {
    if (!fmt) {
        error_buffer[0] = '\0';
        return;
    }
    vsnprintf(error_buffer, ARMADA_ERROR_BUFFER_SIZE, fmt, args);
}

const char *armada_get_last_error(void) {
    return error_buffer;
}

void armada_clear_error(void) {
    error_buffer[0] = '\0';
}

bool armada_has_error(void) {
    return error_buffer[0] != '\0';
}

void armada_log_and_clear_error(void) {
    if (error_buffer[0] != '\0') {
        SDL_Log("Error: %s", error_buffer);
        error_buffer[0] = '\0';
    }
}

/*============================================================================
 * Error Log
 *============================================================================*/

struct Armada_ErrorLog {
    Armada_ErrorRecord *records;    /* Ring buffer */
    size_t capacity;
    size_t head;                    /* Index of the oldest record */
    size_t count;
};

static const char *const CATEGORY_NAMES[ARMADA_ERROR_CATEGORY_COUNT] = {
    "validation",
    "runtime",
    "user_input",
    "system",
    "game_logic"
};

static const char *const SEVERITY_NAMES[ARMADA_SEVERITY_COUNT] = {
    "low",
    "medium",
    "high",
    "critical"
};

Armada_ErrorLog *armada_error_log_create(size_t capacity) {
    if (capacity == 0) {
        capacity = ARMADA_ERROR_LOG_DEFAULT_CAPACITY;
    }

    Armada_ErrorLog *log = ARMADA_ALLOC(Armada_ErrorLog);
    if (!log) {
        armada_set_error("Failed to allocate error log");
        return NULL;
    }

    log->records = ARMADA_ALLOC_ARRAY(Armada_ErrorRecord, capacity);
    if (!log->records) {
        ARMADA_FREE(log);
        armada_set_error("Failed to allocate error log records");
        return NULL;
    }

    log->capacity = capacity;
    return log;
}

void armada_error_log_destroy(Armada_ErrorLog *log) {
    if (!log) return;
    ARMADA_FREE(log->records);
    ARMADA_FREE(log);
}

bool armada_error_is_recoverable(Armada_ErrorCategory category,
                                 Armada_ErrorSeverity severity) {
    if (severity == ARMADA_SEVERITY_CRITICAL) {
        return false;
    }

    switch (category) {
        case ARMADA_ERROR_VALIDATION:
        case ARMADA_ERROR_GAME_LOGIC:
            return severity != ARMADA_SEVERITY_HIGH;
        case ARMADA_ERROR_RUNTIME:
            return severity == ARMADA_SEVERITY_LOW || severity == ARMADA_SEVERITY_MEDIUM;
        case ARMADA_ERROR_USER_INPUT:
            return true;
        case ARMADA_ERROR_SYSTEM:
            return severity == ARMADA_SEVERITY_LOW;
        default:
            return false;
    }
}

static Armada_ErrorResponse make_response(Armada_ErrorSeverity severity, bool recoverable) {
    Armada_ErrorResponse r;
    switch (severity) {
        case ARMADA_SEVERITY_CRITICAL:
            r.can_continue = false;
            r.should_restart = true;
            r.user_message = "A critical error occurred. The game cannot continue safely.";
            break;
        case ARMADA_SEVERITY_HIGH:
            r.can_continue = recoverable;
            r.should_restart = !recoverable;
            r.user_message = recoverable
                ? "A serious error occurred but the game can continue."
                : "A serious error occurred. Restarting is recommended.";
            break;
        case ARMADA_SEVERITY_MEDIUM:
            r.can_continue = true;
            r.should_restart = false;
            r.user_message = "An error occurred. The game will continue.";
            break;
        case ARMADA_SEVERITY_LOW:
        default:
            r.can_continue = true;
            r.should_restart = false;
            r.user_message = "A minor issue occurred.";
            break;
    }
    return r;
}

static void log_record(const Armada_ErrorRecord *rec) {
    const char *cat = armada_error_category_name(rec->category);
    switch (rec->severity) {
        case ARMADA_SEVERITY_CRITICAL:
        case ARMADA_SEVERITY_HIGH:
            armada_log_error(ARMADA_LOG_CORE, "[%s/%s] turn %d: %s",
                             cat, armada_error_severity_name(rec->severity),
                             (int)rec->turn, rec->message);
            break;
        case ARMADA_SEVERITY_MEDIUM:
            armada_log_warning(ARMADA_LOG_CORE, "[%s] turn %d: %s",
                               cat, (int)rec->turn, rec->message);
            break;
        case ARMADA_SEVERITY_LOW:
        default:
            armada_log_info(ARMADA_LOG_CORE, "[%s] turn %d: %s",
                            cat, (int)rec->turn, rec->message);
            break;
    }
}

static void push_record(Armada_ErrorLog *log, const Armada_ErrorRecord *rec) {
    size_t slot;
    if (log->count < log->capacity) {
        slot = (log->head + log->count) % log->capacity;
        log->count++;
    } else {
        /* Full: overwrite the oldest */
        slot = log->head;
        log->head = (log->head + 1) % log->capacity;
    }
    log->records[slot] = *rec;
}

Armada_ErrorResponse armada_error_log_report(Armada_ErrorLog *log,
                                             Armada_ErrorCategory category,
                                             Armada_ErrorSeverity severity,
                                             int32_t turn,
                                             const char *fmt, ...) {
    Armada_ErrorRecord rec;
    memset(&rec, 0, sizeof(rec));
    rec.category = category;
    rec.severity = severity;
    rec.turn = turn;
    rec.recoverable = armada_error_is_recoverable(category, severity);

    if (fmt) {
        va_list args;
        va_start(args, fmt);
        vsnprintf(rec.message, sizeof(rec.message), fmt, args);
        va_end(args);
    }

    log_record(&rec);
    if (log) {
        push_record(log, &rec);
    }

    return make_response(severity, rec.recoverable);
}

static bool contains_word(const char *haystack, const char *needle) {
    /* Case-insensitive substring search */
    size_t n = strlen(needle);
    for (const char *p = haystack; *p; p++) {
        size_t i = 0;
        while (i < n && p[i] &&
               tolower((unsigned char)p[i]) == tolower((unsigned char)needle[i])) {
            i++;
        }
        if (i == n) return true;
    }
    return false;
}

static Armada_ErrorSeverity classify_validation_message(const char *msg) {
    if (contains_word(msg, "negative") ||
        contains_word(msg, "null") ||
        contains_word(msg, "missing")) {
        return ARMADA_SEVERITY_CRITICAL;
    }
    if (contains_word(msg, "inconsistent") ||
        contains_word(msg, "invalid state") ||
        contains_word(msg, "corrupted")) {
        return ARMADA_SEVERITY_HIGH;
    }
    return ARMADA_SEVERITY_MEDIUM;
}

Armada_ErrorResponse armada_error_log_report_validation(Armada_ErrorLog *log,
                                                        const char *const *messages,
                                                        size_t count,
                                                        int32_t turn) {
    if (!messages || count == 0) {
        return make_response(ARMADA_SEVERITY_LOW, true);
    }

    Armada_ErrorSeverity worst = ARMADA_SEVERITY_LOW;
    char joined[ARMADA_ERROR_MESSAGE_MAX];
    joined[0] = '\0';
    size_t used = 0;

    for (size_t i = 0; i < count; i++) {
        if (!messages[i]) continue;

        Armada_ErrorSeverity sev = classify_validation_message(messages[i]);
        if (sev > worst) worst = sev;

        int written = snprintf(joined + used, sizeof(joined) - used, "%s%s",
                               used > 0 ? "; " : "", messages[i]);
        if (written < 0) break;
        used += (size_t)written;
        if (used >= sizeof(joined)) {
            used = sizeof(joined) - 1;
            break;
        }
    }

    return armada_error_log_report(log, ARMADA_ERROR_VALIDATION, worst, turn,
                                   "Game state validation failed: %s", joined);
}

size_t armada_error_log_count(const Armada_ErrorLog *log) {
    return log ? log->count : 0;
}

const Armada_ErrorRecord *armada_error_log_get(const Armada_ErrorLog *log, size_t index) {
    if (!log || index >= log->count) return NULL;
    return &log->records[(log->head + index) % log->capacity];
}

const Armada_ErrorRecord *armada_error_log_latest(const Armada_ErrorLog *log) {
    if (!log || log->count == 0) return NULL;
    return armada_error_log_get(log, log->count - 1);
}

size_t armada_error_log_count_by_severity(const Armada_ErrorLog *log,
                                          Armada_ErrorSeverity severity) {
    size_t n = 0;
    for (size_t i = 0; i < armada_error_log_count(log); i++) {
        if (armada_error_log_get(log, i)->severity == severity) n++;
    }
    return n;
}

size_t armada_error_log_count_by_category(const Armada_ErrorLog *log,
                                          Armada_ErrorCategory category) {
    size_t n = 0;
    for (size_t i = 0; i < armada_error_log_count(log); i++) {
        if (armada_error_log_get(log, i)->category == category) n++;
    }
    return n;
}

void armada_error_log_clear(Armada_ErrorLog *log) {
    if (!log) return;
    log->head = 0;
    log->count = 0;
}

const char *armada_error_category_name(Armada_ErrorCategory category) {
    if ((int)category < 0 || category >= ARMADA_ERROR_CATEGORY_COUNT) {
        return "unknown";
    }
    return CATEGORY_NAMES[category];
}

const char *armada_error_severity_name(Armada_ErrorSeverity severity) {
    if ((int)severity < 0 || severity >= ARMADA_SEVERITY_COUNT) {
        return "unknown";
    }
    return SEVERITY_NAMES[severity];
}
