//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef CLASSMAP_TYPES_HPP
#define CLASSMAP_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures produced by a scan.
 *
 * - SymbolMap: identifier -> defining file, in insertion order
 * - ScanStats: counters collected while walking a tree
 * - ClassMap: everything one scan of a directory produces
 */

#include "classmap/utils/string_utils.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace classmap {

    namespace fs = std::filesystem;

    /**
     * Identifier to file table.
     *
     * Keys are unique. Assigning an existing key replaces its path but keeps
     * the key's original position, so iteration order is the order in which
     * identifiers were first seen.
     */
    class SymbolMap {
    public:
        using Entry = std::pair<std::string, fs::path>;
        using const_iterator = std::vector<Entry>::const_iterator;

        /**
         * Inserts or overwrites an entry (last writer wins).
         *
         * @return True if the identifier was not present before.
         */
        bool insert_or_assign(const std::string& identifier, fs::path file) {
            if (const auto it = index_.find(identifier); it != index_.end()) {
                entries_[it->second].second = std::move(file);
                return false;
            }
            index_.emplace(identifier, entries_.size());
            entries_.emplace_back(identifier, std::move(file));
            return true;
        }

        /**
         * Exact, case-sensitive lookup.
         *
         * @return The mapped path, or nullptr.
         */
        [[nodiscard]] const fs::path* find(const std::string_view identifier) const {
            if (const auto it = index_.find(std::string(identifier)); it != index_.end()) {
                return &entries_[it->second].second;
            }
            return nullptr;
        }

        /**
         * ASCII case-insensitive lookup. Scans entries in insertion order and
         * returns the first match, so among identifiers that differ only in
         * case the earliest inserted one wins.
         */
        [[nodiscard]] const fs::path* find_case_insensitive(const std::string_view identifier) const {
            for (const auto& [name, path] : entries_) {
                if (string_utils::iequals(name, identifier)) {
                    return &path;
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool contains(const std::string_view identifier) const {
            return find(identifier) != nullptr;
        }

        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
        [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

        [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
        [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

        [[nodiscard]] const std::vector<Entry>& entries() const noexcept { return entries_; }

        bool operator==(const SymbolMap& other) const {
            return entries_ == other.entries_;
        }

        bool operator!=(const SymbolMap& other) const {
            return !(*this == other);
        }

    private:
        std::vector<Entry> entries_;
        std::unordered_map<std::string, std::size_t> index_;
    };

    /**
     * Counters collected during one scan.
     */
    struct ScanStats {
        std::size_t files_visited = 0;       // Candidates yielded by the walker
        std::size_t files_scanned = 0;       // Read and tokenized successfully
        std::size_t files_failed = 0;        // Read or tokenize failures
        std::size_t static_files = 0;
        std::size_t duplicate_symbols = 0;   // Overwritten identifiers
    };

    /**
     * Result of scanning one directory.
     */
    struct ClassMap {
        fs::path root;                        // Canonical scanned directory
        SymbolMap symbols;
        std::vector<fs::path> static_files;  // Only filled when include_static is set
        ScanStats stats;

        // Static files alone do not make a usable map.
        [[nodiscard]] bool empty() const noexcept {
            return symbols.empty();
        }
    };

}  // namespace classmap

#endif //CLASSMAP_TYPES_HPP
