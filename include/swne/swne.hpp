#pragma once

/// \file
/// \brief Umbrella header for the public swne API.

#include <swne/core/error.hpp>
#include <swne/core/log.hpp>
#include <swne/core/parallel.hpp>

#include <swne/data/embedding.hpp>
#include <swne/data/graph.hpp>
#include <swne/data/matrices.hpp>

#include <swne/io/csv.hpp>

#include <swne/ops/anchor_layout.hpp>
#include <swne/ops/embed.hpp>
#include <swne/ops/factorization/nmf.hpp>
#include <swne/ops/graph/pca.hpp>
#include <swne/ops/graph/snn.hpp>
#include <swne/ops/linalg.hpp>
#include <swne/ops/project.hpp>
#include <swne/ops/pull.hpp>
#include <swne/ops/smoothing.hpp>
