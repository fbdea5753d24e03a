#pragma once

// This is the single entry-point for the pcflow library.
// Include this file to get access to region graphs, symbolic circuits and
// the pipeline compiler.

#include "pcflow/config.hpp"
#include "pcflow/debug.hpp"
#include "pcflow/error.hpp"
#include "pcflow/scope.hpp"

#include "pcflow/graph/topological.hpp"
#include "pcflow/io/region_graph_json.hpp"
#include "pcflow/region_graph/region_graph.hpp"
#include "pcflow/region_graph/rg_node.hpp"
#include "pcflow/region_graph/templates.hpp"

#include "pcflow/symbolic/circuit.hpp"
#include "pcflow/symbolic/circuit_block.hpp"
#include "pcflow/symbolic/functional.hpp"
#include "pcflow/symbolic/layers.hpp"
#include "pcflow/symbolic/parameters.hpp"
#include "pcflow/symbolic/registry.hpp"
#include "pcflow/symbolic/rules.hpp"

#include "pcflow/backend/compiled_circuit.hpp"
#include "pcflow/backend/compiler.hpp"
#include "pcflow/backend/layers.hpp"
#include "pcflow/backend/pipeline.hpp"
#include "pcflow/backend/reparam.hpp"
