#include "cache_catalog.hpp"
#include "cleaner.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "installed_catalog.hpp"
#include "localization.hpp"
#include "selection.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace {
    void print_usage(const cxxopts::Options& options) {
        std::cerr << options.help({""});
        std::cerr << get_string("info.selection_modes") << std::endl;
        std::cerr << get_string("info.uninstalled_desc") << std::endl;
        std::cerr << get_string("info.morethan_desc") << std::endl;
    }

    Config resolve_config(const cxxopts::ParseResult& result) {
        Config config;
        if (result.count("root")) {
            rebase_config(config, result["root"].as<std::string>());
        }

        if (result.count("config")) {
            config.config_file = result["config"].as<std::string>();
            load_config_file(config.config_file, config, true);
        } else {
            load_config_file(config.config_file, config, false);
        }

        if (result.count("cache_path")) {
            config.cache_dir = result["cache_path"].as<std::string>();
        }
        if (result.count("installed_path")) {
            config.installed_dir = result["installed_path"].as<std::string>();
        }
        if (result.count("number")) {
            int number = result["number"].as<int>();
            if (number < 0) {
                throw PacsweepException(string_format("error.invalid_keep", number));
            }
            config.keep = static_cast<std::size_t>(number);
        }
        if (result["skip-malformed"].as<bool>()) {
            config.skip_malformed = true;
        }
        return config;
    }
}

int main(int argc, char* argv[]) {
    try {
        init_localization();

        cxxopts::Options options(argv[0], get_string("info.description"));
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("help.help"))
            ("u,uninstalled", get_string("help.uninstalled"), cxxopts::value<bool>()->default_value("false"))
            ("m,morethan", get_string("help.morethan"), cxxopts::value<bool>()->default_value("false"))
            ("delete", get_string("help.delete"), cxxopts::value<bool>()->default_value("false"))
            ("n,number", get_string("help.number"), cxxopts::value<int>())
            ("c,cache_path", get_string("help.cache_path"), cxxopts::value<std::string>())
            ("i,installed_path", get_string("help.installed_path"), cxxopts::value<std::string>())
            ("s,sort", get_string("help.sort"), cxxopts::value<bool>()->default_value("false"))
            ("skip-malformed", get_string("help.skip_malformed"), cxxopts::value<bool>()->default_value("false"))
            ("config", get_string("help.config"), cxxopts::value<std::string>())
            ("root", get_string("help.root_dir"), cxxopts::value<std::string>());

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        const bool want_uninstalled = result["uninstalled"].as<bool>();
        const bool want_morethan = result["morethan"].as<bool>();
        if (!want_uninstalled && !want_morethan) {
            print_usage(options);
            log_error(get_string("error.no_selection_mode"));
            return 1;
        }

        const Config config = resolve_config(result);
        const bool sorted = result["sort"].as<bool>();
        const bool do_delete = result["delete"].as<bool>();

        // Both catalogs must be complete before anything is selected or deleted.
        const InstalledCatalog installed = build_installed_catalog(config.installed_dir, config);
        const CacheCatalog cache = build_cache_catalog(config.cache_dir, config);

        auto uninstalled = select_uninstalled(cache, installed);
        auto old = select_excess_old(cache, installed, config.keep);
        if (sorted) {
            uninstalled = sort_packages(std::move(uninstalled));
            old = sort_packages(std::move(old));
        }

        if (!do_delete) {
            if (want_uninstalled) print_packages(uninstalled, std::cout);
            if (want_morethan) print_packages(old, std::cout);
            return 0;
        }

        RemovalReport total;
        auto accumulate = [&total](const RemovalReport& r) {
            total.removed += r.removed;
            total.already_absent += r.already_absent;
            total.failed += r.failed;
            total.bytes_freed += r.bytes_freed;
        };
        if (want_uninstalled) {
            accumulate(remove_packages(uninstalled));
        }
        if (want_morethan) {
            accumulate(remove_packages(resolve_to_files(old, cache)));
        }
        log_removal_summary(total);
        return total.failed > 0 ? 1 : 0;

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const DeletionPermissionDenied& e) {
        log_error(e.what());
        log_error(get_string("error.run_as_root"));
        return 1;
    } catch (const PacsweepException& e) {
        log_error(string_format("error.pacsweep_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }
}
