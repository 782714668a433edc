//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef CLASSMAP_VERSION_HPP
#define CLASSMAP_VERSION_HPP

/**
 * @file version.hpp
 * @brief classmap version information.
 */

namespace classmap {

    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    constexpr auto VERSION_STRING = "1.0.0";

    constexpr auto PROJECT_NAME = "classmap";

    /**
     * Oldest host loader interface revision the loader façade works with.
     *
     * Hosts report their revision through IHostLoader::capability_version().
     * Revision 2 added include_once() and identity-based unregistration.
     */
    constexpr int MIN_HOST_CAPABILITY = 2;

}  // namespace classmap

#endif //CLASSMAP_VERSION_HPP
