#pragma once

/// Convenience umbrella header for the tabula library.

#include <tabula/core/column.hpp>
#include <tabula/core/error.hpp>
#include <tabula/frame.hpp>
#include <tabula/runtime/aggregate.hpp>
#include <tabula/runtime/csv.hpp>
#include <tabula/runtime/functions.hpp>
#include <tabula/runtime/join.hpp>
#include <tabula/runtime/mutate.hpp>
#include <tabula/runtime/ops.hpp>
#include <tabula/runtime/partition.hpp>
#include <tabula/runtime/table.hpp>
