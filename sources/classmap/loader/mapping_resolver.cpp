//
// Created by gregorian-rayne on 2/11/26.
//

#include "classmap/loader/mapping_resolver.hpp"
#include "classmap/utils/file_utils.hpp"

#include <exception>

namespace classmap::loader {

    MappingResolver::MappingResolver(IHostLoader& host, SymbolMap symbols, const bool case_sensitive,
                                     WarningSink sink)
        : host_(host)
        , symbols_(std::move(symbols))
        , case_sensitive_(case_sensitive)
        , sink_(std::move(sink)) {}

    const fs::path* MappingResolver::locate(const std::string_view identifier) const {
        return case_sensitive_ ? symbols_.find(identifier) : symbols_.find_case_insensitive(identifier);
    }

    bool MappingResolver::resolve(const std::string_view identifier) {
        const fs::path* file = locate(identifier);
        if (file == nullptr || !file_utils::is_readable_file(*file)) {
            return false;
        }

        try {
            return host_.include_once(*file);
        } catch (const std::exception& e) {
            report_warning(sink_, Error::io_error(
                std::string("Failed to load '") + std::string(identifier) + "': " + e.what(), file->string()));
            return false;
        }
    }

}  // namespace classmap::loader
