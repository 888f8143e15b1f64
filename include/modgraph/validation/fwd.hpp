#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for modgraph_validation module

namespace modgraph_validation {

class EdgeRelation;
class SubValidator;
class ModuleDependencyValidator;
class BundleValidator;

} // namespace modgraph_validation
