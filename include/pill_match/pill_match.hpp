#pragma once

/// @file pill_match.hpp
/// @brief Main header for the pill_match C++ library
///
/// This is the unified include for all pill_match functionality.
/// Include this single header to access the engine, its building blocks,
/// configuration and the reference medication table.

#include <pill_match/aggregator.hpp>
#include <pill_match/barcode.hpp>
#include <pill_match/config.hpp>
#include <pill_match/engine.hpp>
#include <pill_match/errors.hpp>
#include <pill_match/internal/matching.hpp>
#include <pill_match/internal/normalization.hpp>
#include <pill_match/log.hpp>
#include <pill_match/ranker.hpp>
#include <pill_match/recognition.hpp>
#include <pill_match/reference/common.hpp>
#include <pill_match/scorer.hpp>
#include <pill_match/terms.hpp>
#include <pill_match/types.hpp>

/// @namespace pill_match
/// @brief The pill_match library namespace
///
/// Contains the medication identification engine: term extraction,
/// relevance scoring, ranking, the barcode shortcut and signal aggregation.
namespace pill_match {

/// Library version string
constexpr const char* kVersion = "1.0.0";

/// Library version as integers
constexpr int kVersionMajor = 1;
constexpr int kVersionMinor = 0;
constexpr int kVersionPatch = 0;

}  // namespace pill_match
