#pragma once

#include "catalog.hpp"

#include <string>
#include <vector>

// Required (non-optional) transitive dependencies of `root`, each listed once
// and after its own dependencies. The root itself is never part of the result,
// even when a cycle leads back to it. Dependencies missing from the catalog are
// kept as leaves.
//
// Throws NotFoundError when `root` is not in the catalog.
std::vector<std::string> resolve_dependencies(const Catalog& catalog, const std::string& root);
