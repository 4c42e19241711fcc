/// @file mmds.hpp
/// @brief Umbrella header for the mmds-cpp core library.
///
/// Include this single header for access to Value, DocumentStore,
/// merge_patch, resolve, validate and Error.

#pragma once

#include <mmds-cpp/document_store.hpp>
#include <mmds-cpp/error.hpp>
#include <mmds-cpp/json.hpp>
#include <mmds-cpp/merge_patch.hpp>
#include <mmds-cpp/path.hpp>
#include <mmds-cpp/validator.hpp>
#include <mmds-cpp/value.hpp>
