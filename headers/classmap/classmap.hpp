//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef CLASSMAP_CLASSMAP_HPP
#define CLASSMAP_CLASSMAP_HPP

/**
 * @file classmap.hpp
 * @brief Main header for the classmap library.
 *
 * Pulls in the types and the two entry points most callers need: the
 * mapping builder and the loader façade. Include the scanner headers
 * directly for token-level access.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"
#include "options.hpp"
#include "mapping_builder.hpp"
#include "loader/autoloader.hpp"
#include "loader/resolver_chain.hpp"

#endif //CLASSMAP_CLASSMAP_HPP
