#pragma once

/// Convenience umbrella header for the rowtree library.

#include <rowtree/core/error.hpp>
#include <rowtree/core/key.hpp>
#include <rowtree/core/ordered_tree.hpp>
#include <rowtree/core/value.hpp>
#include <rowtree/frame/frame.hpp>
#include <rowtree/frame/group.hpp>
#include <rowtree/frame/join.hpp>
#include <rowtree/index/indexer.hpp>
