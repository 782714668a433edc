//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef CLASSMAP_TREE_WALKER_HPP
#define CLASSMAP_TREE_WALKER_HPP

/**
 * @file tree_walker.hpp
 * @brief Recursive enumeration of candidate source files.
 *
 * Entries of every directory are visited in byte order of their file
 * names, depth first, so repeated walks of an unchanged tree yield the
 * same sequence. Sub-directories that cannot be opened are skipped with a
 * warning; only a problem with the root itself fails the walk.
 */

#include "classmap/diagnostics.hpp"
#include "classmap/error.hpp"
#include "classmap/options.hpp"
#include "classmap/result.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace classmap::scanner {

    namespace fs = std::filesystem;

    /**
     * One candidate file.
     */
    struct WalkEntry {
        fs::path path;              // Root joined with the entries leading to the file
        std::string relative_path;  // '/'-separated, relative to the root
    };

    using WalkCallback = std::function<void(const WalkEntry&)>;

    class TreeWalker {
    public:
        /**
         * @param root Directory to walk.
         * @param options Uses extensions, exclude and follow_symlinks.
         * @param sink Receives warnings for skipped directories.
         */
        TreeWalker(fs::path root, Options options, WarningSink sink = stderr_warning_sink());

        /**
         * Calls @p callback for each candidate file, in walk order.
         *
         * @return Number of candidates, or the root error.
         */
        Result<std::size_t, Error> walk(const WalkCallback& callback) const;

        /**
         * Walks the tree and returns every candidate.
         */
        Result<std::vector<WalkEntry>, Error> collect() const;

        /**
         * Checks that @p root exists, is a directory and can be listed.
         *
         * @return NotFound, InvalidArgument or PermissionDenied on failure.
         */
        static Result<void, Error> check_root(const fs::path& root);

    private:
        struct WalkState {
            fs::path root;                // Canonical root
            std::vector<fs::path> active; // Canonical directories on the current descent
            const WalkCallback& callback;
            std::size_t count = 0;
        };

        void walk_directory(const fs::path& dir, WalkState& state) const;
        void visit_subdirectory(const fs::directory_entry& entry, bool is_symlink, WalkState& state) const;

        fs::path root_;
        Options options_;
        WarningSink sink_;
    };

}  // namespace classmap::scanner

#endif //CLASSMAP_TREE_WALKER_HPP
