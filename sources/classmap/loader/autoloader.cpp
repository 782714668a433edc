//
// Created by gregorian-rayne on 2/12/26.
//

#include "classmap/loader/autoloader.hpp"
#include "classmap/loader/mapping_resolver.hpp"
#include "classmap/loader/renderer.hpp"
#include "classmap/loader/resolver_chain.hpp"
#include "classmap/version.hpp"

#include <exception>
#include <memory>

namespace classmap::loader {

    Autoloader::Autoloader(IHostLoader& host, MappingBuilder& builder)
        : host_(host)
        , builder_(builder) {}

    Autoloader& Autoloader::instance() {
        static Autoloader autoloader(ResolverChain::instance(), MappingBuilder::instance());
        return autoloader;
    }

    Error Autoloader::warn(Error error) const {
        report_warning(sink_, error);
        return error;
    }

    Result<void, Error> Autoloader::check_host() {
        if (host_checked_) {
            return Result<void, Error>::success();
        }

        if (const int capability = host_.capability_version(); capability < MIN_HOST_CAPABILITY) {
            return Result<void, Error>::failure(warn(Error::unsupported_host(
                "Host loader capability " + std::to_string(capability) +
                " is below the required " + std::to_string(MIN_HOST_CAPABILITY))));
        }

        host_checked_ = true;
        return Result<void, Error>::success();
    }

    Result<ClassMap, Error> Autoloader::build_non_empty(const fs::path& directory, const Options& options) {
        auto map = builder_.build(directory, options);
        if (map.is_err()) {
            return map;
        }
        if (map.value().empty()) {
            return Result<ClassMap, Error>::failure(warn(
                Error::empty_result("No symbols found", map.value().root.string())));
        }
        return map;
    }

    Result<void, Error> Autoloader::activate(const fs::path& directory, const Options& options) {
        if (auto host = check_host(); host.is_err()) {
            return host;
        }

        auto built = build_non_empty(directory, options);
        if (built.is_err()) {
            return Result<void, Error>::failure(built.error());
        }
        ClassMap map = std::move(built).value();

        const ResolverHandle resolver =
            std::make_shared<MappingResolver>(host_, map.symbols, options.case_sensitive, sink_);

        if (!host_.register_resolver(resolver, options.prepend)) {
            return Result<void, Error>::failure(warn(
                Error::registration_error("Host loader rejected the resolver", map.root.string())));
        }

        if (options.include_static) {
            for (const auto& file : map.static_files) {
                try {
                    if (!host_.include_once(file)) {
                        warn(Error::io_error("Cannot include static file", file.string()));
                    }
                } catch (const std::exception& e) {
                    warn(Error::io_error(std::string("Failed to include static file: ") + e.what(), file.string()));
                }
            }
        }

        fs::path root = map.root;
        records_.push_back(LoaderRecord{std::move(root), resolver, std::move(map)});
        return Result<void, Error>::success();
    }

    Result<SymbolMap, Error> Autoloader::generate_table(const fs::path& directory, const Options& options) {
        if (auto host = check_host(); host.is_err()) {
            return Result<SymbolMap, Error>::failure(host.error());
        }

        auto map = builder_.build(directory, options);
        if (map.is_err()) {
            return Result<SymbolMap, Error>::failure(map.error());
        }
        if (map.value().empty()) {
            return Result<SymbolMap, Error>::failure(warn(
                Error::empty_result("No symbols found", map.value().root.string())));
        }
        return Result<SymbolMap, Error>::success(std::move(map).value().symbols);
    }

    Result<std::string, Error> Autoloader::render_source(const fs::path& directory, const Options& options) {
        if (auto host = check_host(); host.is_err()) {
            return Result<std::string, Error>::failure(host.error());
        }

        auto map = build_non_empty(directory, options);
        if (map.is_err()) {
            return Result<std::string, Error>::failure(map.error());
        }

        const ArtifactRenderer renderer(options, ArtifactRenderer::current_timestamp());
        auto source = renderer.render_source(map.value());
        if (source.is_err()) {
            warn(source.error());
        }
        return source;
    }

    Result<std::string, Error> Autoloader::render_json(const fs::path& directory, const Options& options) {
        if (auto host = check_host(); host.is_err()) {
            return Result<std::string, Error>::failure(host.error());
        }

        auto map = build_non_empty(directory, options);
        if (map.is_err()) {
            return Result<std::string, Error>::failure(map.error());
        }

        const ArtifactRenderer renderer(options, ArtifactRenderer::current_timestamp());
        return Result<std::string, Error>::success(renderer.render_json(map.value()));
    }

    std::vector<LoaderInfo> Autoloader::list_active() const {
        std::vector<LoaderInfo> result;
        result.reserve(records_.size());
        for (const auto& record : records_) {
            result.push_back(LoaderInfo{record.directory, record.map.symbols.size()});
        }
        return result;
    }

    void Autoloader::clear_cache() noexcept {
        builder_.clear_cache();
    }

    std::size_t Autoloader::unregister_all() {
        std::size_t removed = 0;
        for (const auto& record : records_) {
            if (host_.unregister_resolver(record.resolver)) {
                ++removed;
            }
        }
        records_.clear();
        return removed;
    }

}  // namespace classmap::loader
