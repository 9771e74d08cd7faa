#include <chrono>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/executor_config.hpp"
#include "core/errors/errors.hpp"

namespace {

using namespace std::chrono_literals;
using nlohmann::json;
using toolguard::core::config::ExecutorConfig;
using toolguard::core::errors::get_error;
using toolguard::core::errors::get_value;
using toolguard::core::errors::is_error;
namespace config = toolguard::core::config;

TEST(ExecutorConfigTest, DefaultsMatchDocumentedValues) {
    const ExecutorConfig defaults = config::default_executor_config();
    EXPECT_EQ(defaults.max_concurrent, 10);
    EXPECT_EQ(defaults.circuit_breaker_threshold, 5);
    EXPECT_EQ(defaults.circuit_breaker_timeout, 30s);
    EXPECT_EQ(defaults.retry_max_attempts, 3);
    EXPECT_EQ(defaults.retry_initial_delay, 100ms);
    EXPECT_DOUBLE_EQ(defaults.retry_backoff_multiplier, 2.0);
    EXPECT_FALSE(defaults.retry_max_delay.has_value());
    EXPECT_EQ(defaults.default_timeout, 30s);
}

TEST(ExecutorConfigTest, OptionsOverrideFields) {
    const ExecutorConfig cfg = config::apply_options(
        config::default_executor_config(),
        {config::with_max_concurrent(20), config::with_circuit_breaker_threshold(7),
         config::with_circuit_breaker_timeout(60s), config::with_retry_attempts(5),
         config::with_retry_delay(200ms), config::with_backoff_multiplier(3.0),
         config::with_max_retry_delay(2s), config::with_timeout(45s)});

    EXPECT_EQ(cfg.max_concurrent, 20);
    EXPECT_EQ(cfg.circuit_breaker_threshold, 7);
    EXPECT_EQ(cfg.circuit_breaker_timeout, 60s);
    EXPECT_EQ(cfg.retry_max_attempts, 5);
    EXPECT_EQ(cfg.retry_initial_delay, 200ms);
    EXPECT_DOUBLE_EQ(cfg.retry_backoff_multiplier, 3.0);
    ASSERT_TRUE(cfg.retry_max_delay.has_value());
    EXPECT_EQ(*cfg.retry_max_delay, 2s);
    EXPECT_EQ(cfg.default_timeout, 45s);
}

TEST(ExecutorConfigTest, LaterOptionsWin) {
    const ExecutorConfig cfg = config::apply_options(
        config::default_executor_config(),
        {config::with_max_concurrent(2), config::with_max_concurrent(4)});
    EXPECT_EQ(cfg.max_concurrent, 4);
}

TEST(ExecutorConfigTest, NormalizeClampsNonPositiveValues) {
    ExecutorConfig cfg;
    cfg.max_concurrent = -1;
    cfg.circuit_breaker_threshold = 0;
    cfg.retry_max_attempts = -3;
    cfg.retry_initial_delay = 0ms;
    cfg.default_timeout = -5ms;
    cfg.circuit_breaker_timeout = 0ms;
    cfg.retry_backoff_multiplier = 0.5;
    cfg.retry_max_delay = 0ms;

    const ExecutorConfig normalized = config::normalize_config(cfg);
    const ExecutorConfig defaults;
    EXPECT_EQ(normalized.max_concurrent, defaults.max_concurrent);
    EXPECT_EQ(normalized.circuit_breaker_threshold, defaults.circuit_breaker_threshold);
    EXPECT_EQ(normalized.retry_max_attempts, defaults.retry_max_attempts);
    EXPECT_EQ(normalized.retry_initial_delay, defaults.retry_initial_delay);
    EXPECT_EQ(normalized.default_timeout, defaults.default_timeout);
    EXPECT_EQ(normalized.circuit_breaker_timeout, defaults.circuit_breaker_timeout);
    EXPECT_DOUBLE_EQ(normalized.retry_backoff_multiplier, 1.0);
    EXPECT_FALSE(normalized.retry_max_delay.has_value());
}

TEST(ExecutorConfigTest, NormalizeKeepsValidValues) {
    ExecutorConfig cfg;
    cfg.max_concurrent = 1;
    cfg.retry_initial_delay = 10ms;

    const ExecutorConfig normalized = config::normalize_config(cfg);
    EXPECT_EQ(normalized.max_concurrent, 1);
    EXPECT_EQ(normalized.retry_initial_delay, 10ms);
}

TEST(ExecutorConfigTest, ValidateRejectsNonPositiveValues) {
    ExecutorConfig cfg;
    cfg.retry_max_attempts = 0;

    auto result = config::validate_config(cfg);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_config");
    EXPECT_FALSE(is_error(config::validate_config(ExecutorConfig{})));
}

TEST(ExecutorConfigTest, FromJsonReadsResilienceSection) {
    const json section = {
        {"timeout_ms", 5000},
        {"retry", {{"max_attempts", 4}, {"initial_delay_ms", 50},
                   {"max_delay_ms", 800}, {"multiplier", 1.5}}},
        {"circuit_breaker", {{"threshold", 2}, {"timeout_ms", 1000}}},
        {"bulkhead", {{"max_concurrent", 3}}}};

    auto result = config::config_from_json(section);
    ASSERT_FALSE(is_error(result));
    const auto& cfg = get_value(result);
    EXPECT_EQ(cfg.default_timeout, 5000ms);
    EXPECT_EQ(cfg.retry_max_attempts, 4);
    EXPECT_EQ(cfg.retry_initial_delay, 50ms);
    ASSERT_TRUE(cfg.retry_max_delay.has_value());
    EXPECT_EQ(*cfg.retry_max_delay, 800ms);
    EXPECT_DOUBLE_EQ(cfg.retry_backoff_multiplier, 1.5);
    EXPECT_EQ(cfg.circuit_breaker_threshold, 2);
    EXPECT_EQ(cfg.circuit_breaker_timeout, 1000ms);
    EXPECT_EQ(cfg.max_concurrent, 3);
}

TEST(ExecutorConfigTest, FromJsonKeepsDefaultsForMissingKeys) {
    auto result = config::config_from_json(json{{"bulkhead", {{"max_concurrent", 2}}}});
    ASSERT_FALSE(is_error(result));
    const auto& cfg = get_value(result);
    EXPECT_EQ(cfg.max_concurrent, 2);
    EXPECT_EQ(cfg.retry_max_attempts, 3);
    EXPECT_EQ(cfg.default_timeout, 30s);
}

TEST(ExecutorConfigTest, FromJsonRejectsWrongTypes) {
    auto bad_type = config::config_from_json(json{{"retry", {{"max_attempts", "three"}}}});
    ASSERT_TRUE(is_error(bad_type));
    EXPECT_EQ(get_error(bad_type).code, "invalid_config");

    auto bad_section = config::config_from_json(json{{"bulkhead", 4}});
    ASSERT_TRUE(is_error(bad_section));
    EXPECT_EQ(get_error(bad_section).code, "invalid_config");

    auto not_object = config::config_from_json(json::array());
    ASSERT_TRUE(is_error(not_object));
}

TEST(ExecutorConfigTest, FromJsonRejectsNonPositiveValues) {
    auto result = config::config_from_json(json{{"circuit_breaker", {{"threshold", 0}}}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_config");
}

TEST(ExecutorConfigTest, FromJsonRejectsValuesOutsideIntRange) {
    auto too_large = config::config_from_json(
        json{{"bulkhead", {{"max_concurrent", 4294967297LL}}}});
    ASSERT_TRUE(is_error(too_large));
    EXPECT_EQ(get_error(too_large).code, "invalid_config");

    auto too_small = config::config_from_json(
        json{{"circuit_breaker", {{"threshold", -4294967295LL}}}});
    ASSERT_TRUE(is_error(too_small));
    EXPECT_EQ(get_error(too_small).code, "invalid_config");

    auto huge_unsigned = config::config_from_json(
        json{{"retry", {{"max_attempts", 18446744073709551615ULL}}}});
    ASSERT_TRUE(is_error(huge_unsigned));

    auto huge_millis = config::config_from_json(
        json{{"timeout_ms", 18446744073709551615ULL}});
    ASSERT_TRUE(is_error(huge_millis));

    auto at_limit = config::config_from_json(
        json{{"bulkhead", {{"max_concurrent", 2147483647}}}});
    ASSERT_FALSE(is_error(at_limit));
    EXPECT_EQ(get_value(at_limit).max_concurrent, 2147483647);
}

}  // namespace
