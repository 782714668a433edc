//
// Created by gregorian-rayne on 2/12/26.
//

#include "classmap/loader/renderer.hpp"
#include "classmap/utils/hash_utils.hpp"
#include "classmap/utils/path_utils.hpp"
#include "classmap/utils/string_utils.hpp"
#include "classmap/version.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <sstream>

namespace classmap::loader {

    namespace {

        const char* php_bool(const bool value) noexcept {
            return value ? "true" : "false";
        }

        std::string quoted(const std::string_view value) {
            return "'" + string_utils::escape_single_quoted(value) + "'";
        }

    }  // namespace

    ArtifactRenderer::ArtifactRenderer(Options options, std::string generated_at)
        : options_(std::move(options))
        , generated_at_(std::move(generated_at)) {}

    std::string ArtifactRenderer::current_timestamp() {
        const auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &time_t);
#else
        localtime_r(&time_t, &tm);
#endif

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    std::string ArtifactRenderer::wrapper_name() const {
        const auto ns = string_utils::trim_char(options_.namespace_name, '\\');
        if (ns.empty()) {
            return options_.class_name;
        }
        return std::string(ns) + "\\" + options_.class_name;
    }

    std::string ArtifactRenderer::relative_form(const fs::path& base_dir, const fs::path& file) const {
        const auto base = path_utils::canonical(base_dir);
        const auto target = path_utils::canonical(file);
        if (base.is_err() || target.is_err()) {
            return {};
        }
        return path_utils::relative_segments(base.value(), target.value());
    }

    std::string ArtifactRenderer::path_expression(const fs::path& base_dir, const fs::path& file) const {
        if (options_.relative) {
            if (const auto rel = relative_form(base_dir, file); !rel.empty()) {
                return "__DIR__ . " + loader::quoted(rel);
            }
        }
        return loader::quoted(path_utils::to_forward_slashes(file));
    }

    std::string ArtifactRenderer::json_path(const fs::path& base_dir, const fs::path& file) const {
        if (options_.relative) {
            if (const auto rel = relative_form(base_dir, file); !rel.empty()) {
                return "." + rel;
            }
        }
        return path_utils::to_forward_slashes(file);
    }

    Result<std::string, Error> ArtifactRenderer::render_source(const ClassMap& map) const {
        std::string loader_id;
        try {
            std::ostringstream seed;
            for (const auto& [identifier, file] : map.symbols) {
                seed << identifier << '=' << file.string() << '\n';
            }
            seed << generated_at_ << '\n'
                 << std::chrono::high_resolution_clock::now().time_since_epoch().count();
            loader_id = "classmap_" + hash_utils::md5_hex(seed.str());
        } catch (const std::exception& e) {
            return Result<std::string, Error>::failure(
                Error::internal_error(std::string("Cannot derive loader id: ") + e.what())
            );
        }

        const bool case_insensitive = !options_.case_sensitive;
        std::ostringstream out;

        out << "<?php\n"
            << "/**\n"
            << " * Generated autoloader " << wrapper_name() << "\n"
            << " *\n"
            << " * Generated by " << PROJECT_NAME << " " << VERSION_STRING << " on " << generated_at_ << "\n"
            << " * Total classes: " << map.symbols.size() << "\n"
            << " * Static files: " << map.static_files.size() << "\n"
            << " * Case insensitive: " << php_bool(case_insensitive) << "\n"
            << " * Prepend: " << php_bool(options_.prepend) << "\n"
            << " * Relative paths: " << php_bool(options_.relative) << "\n"
            << " *\n"
            << " * Usage: require or include this file to register the autoloader.\n"
            << " *\n"
            << " * @generated\n"
            << " */\n\n";

        out << "// Prevent multiple registrations of the same autoloader\n"
            << "if (!defined('" << loader_id << "'))\n"
            << "{\n"
            << "    define('" << loader_id << "', true);\n\n";

        out << "    // Class to file mapping\n"
            << "    $GLOBALS['" << loader_id << "_mapping'] = ";
        if (map.symbols.empty()) {
            out << "[];\n\n";
        } else {
            out << "[\n";
            for (const auto& [identifier, file] : map.symbols) {
                out << "        " << loader::quoted(identifier) << " => " << path_expression(map.root, file) << ",\n";
            }
            out << "    ];\n\n";
        }

        out << "    $GLOBALS['" << loader_id << "_case_insensitive'] = " << php_bool(case_insensitive) << ";\n\n";

        out << "    $GLOBALS['" << loader_id << "_loader'] = function ($className)\n"
            << "    {\n"
            << "        $mapping = $GLOBALS['" << loader_id << "_mapping'];\n"
            << "        $filePath = null;\n\n"
            << "        if ($GLOBALS['" << loader_id << "_case_insensitive'])\n"
            << "        {\n"
            << "            foreach ($mapping as $mappedClass => $mappedFile)\n"
            << "            {\n"
            << "                if (strcasecmp($mappedClass, $className) === 0)\n"
            << "                {\n"
            << "                    $filePath = $mappedFile;\n"
            << "                    break;\n"
            << "                }\n"
            << "            }\n"
            << "        }\n"
            << "        elseif (isset($mapping[$className]))\n"
            << "        {\n"
            << "            $filePath = $mapping[$className];\n"
            << "        }\n\n"
            << "        if (!$filePath || !is_file($filePath) || !is_readable($filePath))\n"
            << "        {\n"
            << "            return false;\n"
            << "        }\n\n"
            << "        try\n"
            << "        {\n"
            << "            require_once $filePath;\n"
            << "            return true;\n"
            << "        }\n"
            << "        catch (\\Throwable $e)\n"
            << "        {\n"
            << "            trigger_error(\"Autoloader: Failed to load '{$filePath}': \" . $e->getMessage(), E_USER_WARNING);\n"
            << "            return false;\n"
            << "        }\n"
            << "    };\n\n";

        out << "    spl_autoload_register($GLOBALS['" << loader_id << "_loader'], true, "
            << php_bool(options_.prepend) << ");\n";

        if (!map.static_files.empty()) {
            out << "\n    // Files without class declarations\n";
            for (const auto& file : map.static_files) {
                out << "    require_once " << path_expression(map.root, file) << ";\n";
            }
        }

        out << "}\n";

        return Result<std::string, Error>::success(out.str());
    }

    std::string ArtifactRenderer::render_json(const ClassMap& map) const {
        using json = nlohmann::ordered_json;

        json symbols = json::object();
        for (const auto& [identifier, file] : map.symbols) {
            symbols[identifier] = json_path(map.root, file);
        }

        json static_files = json::array();
        for (const auto& file : map.static_files) {
            static_files.push_back(json_path(map.root, file));
        }

        json document = {
            {"generator", PROJECT_NAME},
            {"version", VERSION_STRING},
            {"generated_at", generated_at_},
            {"case_sensitive", options_.case_sensitive},
            {"prepend", options_.prepend},
            {"relative", options_.relative},
            {"symbol_count", map.symbols.size()},
            {"symbols", std::move(symbols)},
            {"static_files", std::move(static_files)}
        };

        // Identifiers and paths are not guaranteed to be valid UTF-8.
        return document.dump(2, ' ', false, json::error_handler_t::replace);
    }

}  // namespace classmap::loader
