/// @file diffjson.hpp
/// @brief Umbrella header for the diffjson-cpp library.
///
/// Include this single header for access to all public types:
/// Document, AccessorPath, ChangeSet, FlatEntry, ReportNode,
/// CompareOptions, PairResult and Error.

#pragma once

#include <diffjson-cpp/color.hpp>
#include <diffjson-cpp/compare.hpp>
#include <diffjson-cpp/diff.hpp>
#include <diffjson-cpp/document.hpp>
#include <diffjson-cpp/error.hpp>
#include <diffjson-cpp/path.hpp>
#include <diffjson-cpp/report.hpp>
#include <diffjson-cpp/tree_editor.hpp>
