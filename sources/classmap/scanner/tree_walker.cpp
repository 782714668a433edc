//
// Created by gregorian-rayne on 2/10/26.
//

#include "classmap/scanner/tree_walker.hpp"
#include "classmap/utils/file_utils.hpp"
#include "classmap/utils/path_utils.hpp"

#include <algorithm>

namespace classmap::scanner {

    TreeWalker::TreeWalker(fs::path root, Options options, WarningSink sink)
        : root_(std::move(root))
        , options_(std::move(options))
        , sink_(std::move(sink)) {}

    Result<void, Error> TreeWalker::check_root(const fs::path& root) {
        std::error_code ec;
        const auto status = fs::status(root, ec);

        if (!fs::exists(status)) {
            return Result<void, Error>::failure(
                Error::not_found("Directory does not exist", root.string())
            );
        }
        if (!fs::is_directory(status)) {
            return Result<void, Error>::failure(
                Error::invalid_argument("Path is not a directory", root.string())
            );
        }
        if (!file_utils::is_readable_directory(root)) {
            return Result<void, Error>::failure(
                Error::permission_denied("Directory is not readable", root.string())
            );
        }
        return Result<void, Error>::success();
    }

    Result<std::size_t, Error> TreeWalker::walk(const WalkCallback& callback) const {
        if (auto checked = check_root(root_); checked.is_err()) {
            return Result<std::size_t, Error>::failure(checked.error());
        }

        auto canonical_root = path_utils::canonical(root_);
        if (canonical_root.is_err()) {
            return Result<std::size_t, Error>::failure(canonical_root.error());
        }

        WalkState state{canonical_root.value(), {canonical_root.value()}, callback, 0};
        walk_directory(state.root, state);

        return Result<std::size_t, Error>::success(state.count);
    }

    Result<std::vector<WalkEntry>, Error> TreeWalker::collect() const {
        std::vector<WalkEntry> entries;
        auto walked = walk([&entries](const WalkEntry& entry) {
            entries.push_back(entry);
        });
        if (walked.is_err()) {
            return Result<std::vector<WalkEntry>, Error>::failure(walked.error());
        }
        return Result<std::vector<WalkEntry>, Error>::success(std::move(entries));
    }

    void TreeWalker::walk_directory(const fs::path& dir, WalkState& state) const {
        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            report_warning(sink_, Error::permission_denied(
                "Cannot open directory, skipping: " + ec.message(), dir.string()));
            return;
        }

        std::vector<fs::directory_entry> entries;
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                break;
            }
            entries.push_back(*it);
        }
        if (ec) {
            report_warning(sink_, Error::io_error(
                "Directory listing interrupted: " + ec.message(), dir.string()));
        }

        std::ranges::sort(entries, [](const fs::directory_entry& a, const fs::directory_entry& b) {
            return a.path().filename().string() < b.path().filename().string();
        });

        for (const auto& entry : entries) {
            const bool is_symlink = entry.is_symlink(ec);

            if (entry.is_directory(ec)) {
                visit_subdirectory(entry, is_symlink, state);
                continue;
            }

            if (!entry.is_regular_file(ec) || !options_.matches_extension(entry.path())) {
                continue;
            }

            WalkEntry candidate{entry.path(), path_utils::relative_to_root(entry.path(), state.root)};
            if (options_.is_excluded(candidate.relative_path)) {
                continue;
            }

            ++state.count;
            state.callback(candidate);
        }
    }

    void TreeWalker::visit_subdirectory(const fs::directory_entry& entry,
                                        const bool is_symlink,
                                        WalkState& state) const {
        if (is_symlink && !options_.follow_symlinks) {
            return;
        }

        auto target = path_utils::canonical(entry.path());
        if (target.is_err()) {
            report_warning(sink_, target.error());
            return;
        }

        if (std::ranges::find(state.active, target.value()) != state.active.end()) {
            report_warning(sink_, Error::invalid_argument(
                "Symbolic link loop, skipping", entry.path().string()));
            return;
        }

        state.active.push_back(target.value());
        walk_directory(entry.path(), state);
        state.active.pop_back();
    }

}  // namespace classmap::scanner
