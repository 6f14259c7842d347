#ifndef CLI_HPP
#define CLI_HPP

//local
#include <config.hpp>
#include <logging/logger.hpp>
#include <validation/registry.hpp>

//internal
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

//external
#include <boost/json.hpp>

namespace json = boost::json;

namespace taxid::cli
{
    inline constexpr int exit_success{0};
    inline constexpr int exit_failure{1};
    // The identifier is malformed
    inline constexpr int exit_invalid{2};
    // Unknown command or jurisdiction
    inline constexpr int exit_usage{64};

    inline void print(const json::object& object)
    {
        std::cout << json::serialize(object) << '\n';
    }

    inline int print_usage()
    {
        std::cerr << 
            "Usage: taxid [--config <path>] validate|compact|format <country> <number>\n"
            "       taxid [--config <path>] list\n";

        return exit_usage;
    }

    // Print all registered jurisdictions with their metadata
    inline int list()
    {
        json::array jurisdictions;

        for (std::string_view code : registry::codes())
        {
            const jurisdiction* found{registry::find(code)};

            jurisdictions.push_back(json::object
            {
                {"code", found->code},
                {"name", found->name},
                {"localName", found->local_name},
                {"abbreviation", found->abbreviation}
            });
        }

        std::cout << json::serialize(jurisdictions) << '\n';

        return exit_success;
    }

    // Run the given command over the number by the rules of the jurisdiction
    inline int execute(std::string_view command, const jurisdiction& selected, std::string_view number)
    {
        if (command == "validate")
        {
            validation_result result{selected.validate(number)};

            LOG_DEBUG << "Validated " << selected.abbreviation << " number: " << json::serialize(to_json(result));

            print(to_json(result));

            return result.is_valid() ? exit_success : exit_invalid;
        }

        if (command != "compact" && command != "format")
        {
            return print_usage();
        }

        try
        {
            print(json::object
            {
                {command, command == "compact" ? selected.compact(number) : selected.format(number)}
            });

            return exit_success;
        }
        // Number contains characters outside the alphabet of the jurisdiction
        catch (const validation_error& ex)
        {
            LOG_DEBUG << "Failed to " << command << " " << selected.abbreviation << " number: " << ex.what();

            print(json::object{{"error", ex.what()}});

            return exit_invalid;
        }
    }

    // Parse the command line arguments, initialize config and execute the requested command
    inline int run(int argc, char* argv[])
    {
        std::vector<std::string_view> arguments(argv + 1, argv + argc);
        std::string config_path{config::default_config_path};

        if (arguments.size() >= 2 && arguments[0] == "--config")
        {
            config_path = arguments[1];
            arguments.erase(arguments.begin(), arguments.begin() + 2);
        }

        // Logger can't be used until the config is read as its sinks depend on it
        try
        {
            config::init(config_path);
        }
        catch (const std::exception& ex)
        {
            std::cerr << "Failed to initialize config: " << ex.what() << '\n';
            return exit_failure;
        }

        try
        {
            if (arguments.size() == 1 && arguments[0] == "list")
            {
                return list();
            }

            if (arguments.size() != 3)
            {
                return print_usage();
            }

            const jurisdiction* found{registry::find(arguments[1])};

            if (!found)
            {
                LOG_WARNING << "Unknown jurisdiction was requested: " << arguments[1];

                print(json::object{{"error", "UNKNOWN_JURISDICTION"}});

                return exit_usage;
            }

            return execute(arguments[0], *found, arguments[2]);
        }
        catch (const std::exception& ex)
        {
            LOG_ERROR << ex.what();

            print(json::object{{"error", ex.what()}});

            return exit_failure;
        }
    }
}

#endif
