#pragma once

// Core types and structures
#include "core/types.hpp"
#include "core/errors.hpp"
#include "core/graph.hpp"
#include "core/configuration.hpp"

// Spatial indexing
#include "spatial/cell_grid.hpp"

// Energy models
#include "hamiltonian/hamiltonian.hpp"
#include "hamiltonian/udmis_hamiltonian.hpp"

// Annealing
#include "anneal/engine.hpp"
#include "anneal/schedule.hpp"
#include "anneal/annealer.hpp"

// Random number generation
#include "random/rng.hpp"
