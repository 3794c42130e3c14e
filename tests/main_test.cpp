/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main_test.cpp
 * @brief Central orchestrator for the Sigil test suite.
 */

#include "framework.hpp"

#include "sigil/infra/logger.hpp"

#include <iostream>

// Infrastructure (infra_test.cpp)
void test_text_trim();
void test_text_trim_blank();
void test_text_to_hex();
void test_logger_parse_level();
void test_logger_threshold();

// Token structure (token_test.cpp)
void test_token_field_extraction();
void test_token_machine_value();
void test_token_counter_max();
void test_token_is_zero();
void test_token_compare();
void test_token_string_round_trip();
void test_token_containers();

// Codec (codec_test.cpp)
void test_codec_golden_encodings();
void test_codec_golden_decodings();
void test_codec_round_trip_random();
void test_codec_round_trip_many_placements();
void test_codec_anchor_offsets_fixed();
void test_codec_alphabet_closure();
void test_codec_rejects_malformed_text();
void test_codec_rejects_tampered_tail();
void test_codec_rejects_bad_pointers();
void test_codec_rejects_wide_data_symbol();
void test_codec_symbol_membership();
void test_codec_rejects_bad_placement();

// Identity (identity_test.cpp)
void test_identity_platform_id();
void test_identity_host_name_fallback();
void test_identity_random_fallback();
void test_identity_machine_id_fatal();
void test_identity_counter_seed();
void test_identity_process_id();
void test_identity_system_source();

// Generator (generator_test.cpp)
void test_generator_fields();
void test_generator_pid_truncation();
void test_generator_counter_sequence();
void test_generator_counter_wraparound();
void test_generator_concurrent_counters();
void test_generator_concurrent_encode();
void test_generator_global_uniqueness();

// Command line (cli_test.cpp)
void test_cli_parse_options();
void test_cli_parse_errors();
void test_cli_mint();
void test_cli_inspect();
void test_cli_mint_json();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return 0 if every test passed, 1 otherwise.
 */
int main()
{
    std::cout << "\033[36mInitiating Sigil Test Suite...\033[0m" << std::endl;

    // Keep expected warnings (random fallback, rejected tokens) out of the report.
    sigil::infra::Logger::set_level(sigil::infra::LogLevel::FATAL);

    // --- 1. Infrastructure ---
    RUN_TEST(test_text_trim);
    RUN_TEST(test_text_trim_blank);
    RUN_TEST(test_text_to_hex);
    RUN_TEST(test_logger_parse_level);
    RUN_TEST(test_logger_threshold);

    // --- 2. Token structure ---
    RUN_TEST(test_token_field_extraction);
    RUN_TEST(test_token_machine_value);
    RUN_TEST(test_token_counter_max);
    RUN_TEST(test_token_is_zero);
    RUN_TEST(test_token_compare);
    RUN_TEST(test_token_string_round_trip);
    RUN_TEST(test_token_containers);

    // --- 3. Codec ---
    RUN_TEST(test_codec_golden_encodings);
    RUN_TEST(test_codec_golden_decodings);
    RUN_TEST(test_codec_round_trip_random);
    RUN_TEST(test_codec_round_trip_many_placements);
    RUN_TEST(test_codec_anchor_offsets_fixed);
    RUN_TEST(test_codec_alphabet_closure);
    RUN_TEST(test_codec_rejects_malformed_text);
    RUN_TEST(test_codec_rejects_tampered_tail);
    RUN_TEST(test_codec_rejects_bad_pointers);
    RUN_TEST(test_codec_rejects_wide_data_symbol);
    RUN_TEST(test_codec_symbol_membership);
    RUN_TEST(test_codec_rejects_bad_placement);

    // --- 4. Identity ---
    RUN_TEST(test_identity_platform_id);
    RUN_TEST(test_identity_host_name_fallback);
    RUN_TEST(test_identity_random_fallback);
    RUN_TEST(test_identity_machine_id_fatal);
    RUN_TEST(test_identity_counter_seed);
    RUN_TEST(test_identity_process_id);
    RUN_TEST(test_identity_system_source);

    // --- 5. Generator ---
    RUN_TEST(test_generator_fields);
    RUN_TEST(test_generator_pid_truncation);
    RUN_TEST(test_generator_counter_sequence);
    RUN_TEST(test_generator_counter_wraparound);
    RUN_TEST(test_generator_concurrent_counters);
    RUN_TEST(test_generator_concurrent_encode);
    RUN_TEST(test_generator_global_uniqueness);

    // --- 6. Command line ---
    RUN_TEST(test_cli_parse_options);
    RUN_TEST(test_cli_parse_errors);
    RUN_TEST(test_cli_mint);
    RUN_TEST(test_cli_inspect);
    RUN_TEST(test_cli_mint_json);

    sigil::test::print_summary();

    return (sigil::test::failed_count == 0) ? 0 : 1;
}
