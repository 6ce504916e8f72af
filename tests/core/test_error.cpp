/*
 * Armada Error Handling Tests
 *
 * Tests for the last-error buffer and the bounded error log.
 */

#include <catch2/catch_test_macros.hpp>
#include "armada/error.h"
#include <cstring>
#include <string>

/* ============================================================================
 * Basic Error Operations
 * ============================================================================ */

TEST_CASE("Error set and get", "[error][basic]") {
    armada_clear_error();

    SECTION("Initial state has no error") {
        REQUIRE_FALSE(armada_has_error());
        REQUIRE(strlen(armada_get_last_error()) == 0);
    }

    SECTION("Set formatted error") {
        armada_set_error("Movement %d rejected: %s", 3, "empty fleet");
        REQUIRE(armada_has_error());
        REQUIRE(strcmp(armada_get_last_error(), "Movement 3 rejected: empty fleet") == 0);
    }

    SECTION("Clear error") {
        armada_set_error("An error occurred");
        armada_clear_error();
        REQUIRE_FALSE(armada_has_error());
    }

    SECTION("Log and clear") {
        armada_set_error("Reported once");
        armada_log_and_clear_error();
        REQUIRE_FALSE(armada_has_error());

        /* No-op without an error */
        armada_log_and_clear_error();
        REQUIRE_FALSE(armada_has_error());
    }

    SECTION("Overwrite existing error") {
        armada_set_error("First error");
        armada_set_error("Second error");
        REQUIRE(strcmp(armada_get_last_error(), "Second error") == 0);
    }

    SECTION("NULL format string clears") {
        armada_set_error("Something");
        armada_set_error(nullptr);
        REQUIRE_FALSE(armada_has_error());
    }

    armada_clear_error();
}

/* ============================================================================
 * Recoverability
 * ============================================================================ */

TEST_CASE("Error recoverability rules", "[error][recoverable]") {
    SECTION("Critical is never recoverable") {
        for (int c = 0; c < ARMADA_ERROR_CATEGORY_COUNT; c++) {
            REQUIRE_FALSE(armada_error_is_recoverable((Armada_ErrorCategory)c,
                                                      ARMADA_SEVERITY_CRITICAL));
        }
    }

    SECTION("Validation and game logic recover unless high") {
        REQUIRE(armada_error_is_recoverable(ARMADA_ERROR_VALIDATION, ARMADA_SEVERITY_MEDIUM));
        REQUIRE_FALSE(armada_error_is_recoverable(ARMADA_ERROR_VALIDATION, ARMADA_SEVERITY_HIGH));
        REQUIRE(armada_error_is_recoverable(ARMADA_ERROR_GAME_LOGIC, ARMADA_SEVERITY_LOW));
        REQUIRE_FALSE(armada_error_is_recoverable(ARMADA_ERROR_GAME_LOGIC, ARMADA_SEVERITY_HIGH));
    }

    SECTION("Runtime recovers when low or medium") {
        REQUIRE(armada_error_is_recoverable(ARMADA_ERROR_RUNTIME, ARMADA_SEVERITY_LOW));
        REQUIRE(armada_error_is_recoverable(ARMADA_ERROR_RUNTIME, ARMADA_SEVERITY_MEDIUM));
        REQUIRE_FALSE(armada_error_is_recoverable(ARMADA_ERROR_RUNTIME, ARMADA_SEVERITY_HIGH));
    }

    SECTION("User input always recovers short of critical") {
        REQUIRE(armada_error_is_recoverable(ARMADA_ERROR_USER_INPUT, ARMADA_SEVERITY_HIGH));
    }

    SECTION("System recovers only when low") {
        REQUIRE(armada_error_is_recoverable(ARMADA_ERROR_SYSTEM, ARMADA_SEVERITY_LOW));
        REQUIRE_FALSE(armada_error_is_recoverable(ARMADA_ERROR_SYSTEM, ARMADA_SEVERITY_MEDIUM));
    }
}

/* ============================================================================
 * Error Log
 * ============================================================================ */

TEST_CASE("Error log reporting", "[error][log]") {
    Armada_ErrorLog *log = armada_error_log_create(0);
    REQUIRE(log != nullptr);

    SECTION("Empty log") {
        REQUIRE(armada_error_log_count(log) == 0);
        REQUIRE(armada_error_log_latest(log) == nullptr);
        REQUIRE(armada_error_log_get(log, 0) == nullptr);
    }

    SECTION("Report stores a record") {
        armada_error_log_report(log, ARMADA_ERROR_GAME_LOGIC, ARMADA_SEVERITY_HIGH, 7,
                                "AI produced invalid decision: %s", "unaffordable");
        REQUIRE(armada_error_log_count(log) == 1);

        const Armada_ErrorRecord *rec = armada_error_log_latest(log);
        REQUIRE(rec != nullptr);
        REQUIRE(rec->category == ARMADA_ERROR_GAME_LOGIC);
        REQUIRE(rec->severity == ARMADA_SEVERITY_HIGH);
        REQUIRE(rec->turn == 7);
        REQUIRE_FALSE(rec->recoverable);
        REQUIRE(strcmp(rec->message, "AI produced invalid decision: unaffordable") == 0);
    }

    SECTION("Responses follow severity") {
        Armada_ErrorResponse critical = armada_error_log_report(
            log, ARMADA_ERROR_RUNTIME, ARMADA_SEVERITY_CRITICAL, 1, "boom");
        REQUIRE_FALSE(critical.can_continue);
        REQUIRE(critical.should_restart);
        REQUIRE(critical.user_message != nullptr);

        Armada_ErrorResponse high_recoverable = armada_error_log_report(
            log, ARMADA_ERROR_USER_INPUT, ARMADA_SEVERITY_HIGH, 1, "bad command");
        REQUIRE(high_recoverable.can_continue);
        REQUIRE_FALSE(high_recoverable.should_restart);

        Armada_ErrorResponse high_fatal = armada_error_log_report(
            log, ARMADA_ERROR_GAME_LOGIC, ARMADA_SEVERITY_HIGH, 1, "illegal action");
        REQUIRE_FALSE(high_fatal.can_continue);

        Armada_ErrorResponse medium = armada_error_log_report(
            log, ARMADA_ERROR_SYSTEM, ARMADA_SEVERITY_MEDIUM, 1, "slow disk");
        REQUIRE(medium.can_continue);
        REQUIRE_FALSE(medium.should_restart);
    }

    SECTION("Counts by severity and category") {
        armada_error_log_report(log, ARMADA_ERROR_RUNTIME, ARMADA_SEVERITY_LOW, 1, "a");
        armada_error_log_report(log, ARMADA_ERROR_RUNTIME, ARMADA_SEVERITY_HIGH, 2, "b");
        armada_error_log_report(log, ARMADA_ERROR_SYSTEM, ARMADA_SEVERITY_HIGH, 3, "c");

        REQUIRE(armada_error_log_count_by_severity(log, ARMADA_SEVERITY_HIGH) == 2);
        REQUIRE(armada_error_log_count_by_severity(log, ARMADA_SEVERITY_CRITICAL) == 0);
        REQUIRE(armada_error_log_count_by_category(log, ARMADA_ERROR_RUNTIME) == 2);
        REQUIRE(armada_error_log_count_by_category(log, ARMADA_ERROR_SYSTEM) == 1);
    }

    SECTION("Clear empties the log") {
        armada_error_log_report(log, ARMADA_ERROR_RUNTIME, ARMADA_SEVERITY_LOW, 1, "a");
        armada_error_log_clear(log);
        REQUIRE(armada_error_log_count(log) == 0);
    }

    armada_error_log_destroy(log);
}

TEST_CASE("Error log evicts the oldest record", "[error][log]") {
    Armada_ErrorLog *log = armada_error_log_create(3);
    REQUIRE(log != nullptr);

    for (int i = 1; i <= 5; i++) {
        armada_error_log_report(log, ARMADA_ERROR_RUNTIME, ARMADA_SEVERITY_LOW, i, "error %d", i);
    }

    REQUIRE(armada_error_log_count(log) == 3);
    REQUIRE(armada_error_log_get(log, 0)->turn == 3);
    REQUIRE(armada_error_log_get(log, 1)->turn == 4);
    REQUIRE(armada_error_log_get(log, 2)->turn == 5);
    REQUIRE(strcmp(armada_error_log_latest(log)->message, "error 5") == 0);

    armada_error_log_destroy(log);
}

TEST_CASE("Default error log capacity", "[error][log]") {
    Armada_ErrorLog *log = armada_error_log_create(0);
    REQUIRE(log != nullptr);

    for (int i = 0; i < ARMADA_ERROR_LOG_DEFAULT_CAPACITY + 20; i++) {
        armada_error_log_report(log, ARMADA_ERROR_RUNTIME, ARMADA_SEVERITY_LOW, i, "x");
    }
    REQUIRE(armada_error_log_count(log) == ARMADA_ERROR_LOG_DEFAULT_CAPACITY);
    REQUIRE(armada_error_log_get(log, 0)->turn == 20);

    armada_error_log_destroy(log);
}

/* ============================================================================
 * Validation Batches
 * ============================================================================ */

TEST_CASE("Validation message classification", "[error][validation]") {
    Armada_ErrorLog *log = armada_error_log_create(0);
    REQUIRE(log != nullptr);

    SECTION("Negative values are critical") {
        const char *msgs[] = { "Fleet has Negative frigate count" };
        Armada_ErrorResponse r = armada_error_log_report_validation(log, msgs, 1, 4);
        REQUIRE_FALSE(r.can_continue);
        REQUIRE(armada_error_log_latest(log)->severity == ARMADA_SEVERITY_CRITICAL);
        REQUIRE(armada_error_log_latest(log)->category == ARMADA_ERROR_VALIDATION);
    }

    SECTION("Inconsistent state is high") {
        const char *msgs[] = { "Resource totals are inconsistent" };
        Armada_ErrorResponse r = armada_error_log_report_validation(log, msgs, 1, 4);
        REQUIRE_FALSE(r.can_continue);
        REQUIRE(armada_error_log_latest(log)->severity == ARMADA_SEVERITY_HIGH);
    }

    SECTION("Other messages are medium") {
        const char *msgs[] = { "Income looks low" };
        Armada_ErrorResponse r = armada_error_log_report_validation(log, msgs, 1, 4);
        REQUIRE(r.can_continue);
        REQUIRE(armada_error_log_latest(log)->severity == ARMADA_SEVERITY_MEDIUM);
    }

    SECTION("Worst message wins and messages are joined") {
        const char *msgs[] = { "Income looks low", "Scan data corrupted" };
        armada_error_log_report_validation(log, msgs, 2, 9);

        const Armada_ErrorRecord *rec = armada_error_log_latest(log);
        REQUIRE(rec->severity == ARMADA_SEVERITY_HIGH);
        REQUIRE(rec->turn == 9);
        std::string message(rec->message);
        REQUIRE(message.find("Game state validation failed: ") == 0);
        REQUIRE(message.find("Income looks low; Scan data corrupted") != std::string::npos);
    }

    SECTION("Empty batch reports nothing") {
        Armada_ErrorResponse r = armada_error_log_report_validation(log, nullptr, 0, 1);
        REQUIRE(r.can_continue);
        REQUIRE(armada_error_log_count(log) == 0);
    }

    armada_error_log_destroy(log);
}

TEST_CASE("Error names", "[error][names]") {
    REQUIRE(strcmp(armada_error_category_name(ARMADA_ERROR_GAME_LOGIC), "game_logic") == 0);
    REQUIRE(strcmp(armada_error_severity_name(ARMADA_SEVERITY_CRITICAL), "critical") == 0);
    REQUIRE(strcmp(armada_error_category_name((Armada_ErrorCategory)99), "unknown") == 0);
}

TEST_CASE("Error log NULL safety", "[error][log]") {
    SECTION("NULL log still computes a response") {
        Armada_ErrorResponse r = armada_error_log_report(nullptr, ARMADA_ERROR_RUNTIME,
                                                         ARMADA_SEVERITY_CRITICAL, 0, "x");
        REQUIRE(r.should_restart);
    }

    SECTION("Queries on NULL log are safe") {
        REQUIRE(armada_error_log_count(nullptr) == 0);
        REQUIRE(armada_error_log_latest(nullptr) == nullptr);
        armada_error_log_clear(nullptr);
        armada_error_log_destroy(nullptr);
    }
}
