#pragma once

// Minimal shared header for the test runner.
//
// Individual tests use their own local GW_ASSERT macro. This file exists so
// test_main.cpp can include a stable header without depending on any
// specific test framework.

int test_faction_policy();
int test_manifest_policy();
int test_content_loader();
int test_encounter_classifier();
int test_narrative_classifier();
int test_decision_recorder();
int test_consequence_ledger();
int test_ending();
int test_campaign();
int test_serialization();
int test_file_io();
int test_json_errors();
