#include "armada/armada.h"
#include "armada/log.h"
#include <SDL3/SDL.h>
#include <stdio.h>
#include <string.h>
#include <time.h>

/* Log file state */
static FILE *s_log_file = NULL;
static char s_log_path[512] = {0};
static Armada_LogLevel s_level = ARMADA_LOG_LEVEL_INFO;
static bool s_console = true;
static bool s_initialized = false;
static int32_t s_turn = 0;

/* Callback registration */
#define ARMADA_MAX_LOG_CALLBACKS 8

struct LogCallbackSlot {
    Armada_LogCallback callback;
    void *userdata;
    uint32_t handle;
    bool active;
};

static LogCallbackSlot s_callbacks[ARMADA_MAX_LOG_CALLBACKS] = {};
static uint32_t s_next_handle = 1;

/* Padded to 7 chars for alignment */
static const char *const LEVEL_TAGS[] = {
    "ERROR  ",
    "WARNING",
    "INFO   ",
    "DEBUG  "
};

#if defined(_WIN32)
    #define ARMADA_DEFAULT_LOG_PATH "armada.log"
#else
    #define ARMADA_DEFAULT_LOG_PATH "/tmp/armada.log"
#endif

#define ARMADA_LOG_RULE \
    "================================================================================\n"

static void format_timestamp(char *buf, size_t size) {
    time_t now = time(NULL);
    struct tm *tm_info = localtime(&now);
    strftime(buf, size, "%Y-%m-%d %H:%M:%S", tm_info);
}

static void write_marker(const char *label) {
    if (!s_log_file) return;

    char timestamp[32];
    format_timestamp(timestamp, sizeof(timestamp));

    fputs(ARMADA_LOG_RULE, s_log_file);
    fprintf(s_log_file, "=== Armada %d.%d - %s: %s\n",
            ARMADA_VERSION_MAJOR, ARMADA_VERSION_MINOR, label, timestamp);
    fputs(ARMADA_LOG_RULE, s_log_file);
    fflush(s_log_file);
}

bool armada_log_init(void) {
    return armada_log_init_with_path(NULL);
}

bool armada_log_init_with_path(const char *path) {
    if (s_initialized) {
        return true;
    }

    snprintf(s_log_path, sizeof(s_log_path), "%s", path ? path : ARMADA_DEFAULT_LOG_PATH);

    s_log_file = fopen(s_log_path, "a");
    if (!s_log_file) {
        SDL_Log("Failed to open log file: %s", s_log_path);
        s_log_path[0] = '\0';
        return false;
    }

    s_initialized = true;
    fputc('\n', s_log_file);
    write_marker("Session Start");
    return true;
}

void armada_log_shutdown(void) {
    if (!s_initialized) return;

    write_marker("Session End");
    fputc('\n', s_log_file);
    fclose(s_log_file);
    s_log_file = NULL;

    s_log_path[0] = '\0';
    s_turn = 0;
    s_initialized = false;
}

bool armada_log_is_initialized(void) {
    return s_initialized;
}

void armada_log_set_level(Armada_LogLevel level) {
    s_level = level;
}

Armada_LogLevel armada_log_get_level(void) {
    return s_level;
}

void armada_log_set_console_output(bool enabled) {
    s_console = enabled;
}

void armada_log_set_turn(int32_t turn) {
    s_turn = turn > 0 ? turn : 0;
}

int32_t armada_log_get_turn(void) {
    return s_turn;
}

void armada_log_v(Armada_LogLevel level, const char *subsystem, const char *fmt, va_list args) {
    /* Errors always pass the filter */
    if (level != ARMADA_LOG_LEVEL_ERROR && level > s_level) {
        return;
    }
    if (level < ARMADA_LOG_LEVEL_ERROR || level > ARMADA_LOG_LEVEL_DEBUG || !fmt) {
        return;
    }

    char body[1024];
    vsnprintf(body, sizeof(body), fmt, args);

    /* Prefix the turn tag so per-turn traces can be grepped */
    char message[1040];
    if (s_turn > 0) {
        snprintf(message, sizeof(message), "[T%03d] %s", (int)s_turn, body);
    } else {
        snprintf(message, sizeof(message), "%s", body);
    }

    char subsystem_padded[11];
    snprintf(subsystem_padded, sizeof(subsystem_padded), "%-10s", subsystem ? subsystem : "Unknown");

    if (s_log_file) {
        char timestamp[32];
        format_timestamp(timestamp, sizeof(timestamp));
        fprintf(s_log_file, "[%s] [%s] [%s] %s\n",
                timestamp, LEVEL_TAGS[level], subsystem_padded, message);

        if (level == ARMADA_LOG_LEVEL_ERROR) {
            fflush(s_log_file);
        }
    }

    if (s_console) {
        switch (level) {
            case ARMADA_LOG_LEVEL_ERROR:
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "[%s] %s", subsystem_padded, message);
                break;
            case ARMADA_LOG_LEVEL_WARNING:
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "[%s] %s", subsystem_padded, message);
                break;
            case ARMADA_LOG_LEVEL_INFO:
                SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "[%s] %s", subsystem_padded, message);
                break;
            case ARMADA_LOG_LEVEL_DEBUG:
                SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "[%s] %s", subsystem_padded, message);
                break;
        }
    }

    for (int i = 0; i < ARMADA_MAX_LOG_CALLBACKS; i++) {
        if (s_callbacks[i].active) {
            s_callbacks[i].callback(level, subsystem_padded, message, s_callbacks[i].userdata);
        }
    }
}

#define ARMADA_LOG_FORWARD(level_value) \
    do { \
        va_list args; \
        va_start(args, fmt); \
        armada_log_v((level_value), subsystem, fmt, args); \
        va_end(args); \
    } while (0)

void armada_log_error(const char *subsystem, const char *fmt, ...) {
    ARMADA_LOG_FORWARD(ARMADA_LOG_LEVEL_ERROR);
}

void armada_log_warning(const char *subsystem, const char *fmt, ...) {
    ARMADA_LOG_FORWARD(ARMADA_LOG_LEVEL_WARNING);
}

void armada_log_info(const char *subsystem, const char *fmt, ...) {
    ARMADA_LOG_FORWARD(ARMADA_LOG_LEVEL_INFO);
}

void armada_log_debug(const char *subsystem, const char *fmt, ...) {
    ARMADA_LOG_FORWARD(ARMADA_LOG_LEVEL_DEBUG);
}

void armada_log_flush(void) {
    if (s_log_file) {
        fflush(s_log_file);
    }
}

const char *armada_log_get_path(void) {
    return s_initialized ? s_log_path : NULL;
}

uint32_t armada_log_add_callback(Armada_LogCallback callback, void *userdata) {
    if (!callback) return 0;

    for (int i = 0; i < ARMADA_MAX_LOG_CALLBACKS; i++) {
        if (!s_callbacks[i].active) {
            s_callbacks[i].callback = callback;
            s_callbacks[i].userdata = userdata;
            s_callbacks[i].handle = s_next_handle++;
            s_callbacks[i].active = true;
            return s_callbacks[i].handle;
        }
    }

    return 0;
}

void armada_log_remove_callback(uint32_t handle) {
    if (handle == 0) return;

    for (int i = 0; i < ARMADA_MAX_LOG_CALLBACKS; i++) {
        if (s_callbacks[i].active && s_callbacks[i].handle == handle) {
            s_callbacks[i] = LogCallbackSlot{};
            return;
        }
    }
}
