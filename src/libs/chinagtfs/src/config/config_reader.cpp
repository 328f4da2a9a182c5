// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#include <chinagtfs/config/config_reader.h>
#include <chinagtfs/version.h>

#include <logging/logger.h>

#include <cstdlib>
#include <getopt.h>
#include <iomanip>
#include <iostream>

namespace chinagtfs::config
{
static const char* YEAR = static_cast<const char*>(__DATE__) + 7;

// _____________________________________________________________________________
void config_reader::help(const char* bin) const
{
    std::cout << std::setfill(' ') << std::left << "chinagtfs MetroMan to GTFS converter "
              << chinagtfs::long_version() << "\n(built " << __DATE__ << " " << __TIME__ << ")\n\n"
              << "Usage: " << bin
              << " -i <ARCHIVE ROOT> -V <VERSION TABLE> [--all | <CITY>...]\n\n"
              << "Allowed options:\n\n"
              << "General:\n"
              << std::setw(35) << "  -v [ --version ]"
              << "print version\n"
              << std::setw(35) << "  -h [ --help ]"
              << "show this help message\n"
              << std::setw(35) << "  -p"
              << "print the effective options\n"
              << std::setw(35) << "  --log-level arg (=info)"
              << "console log level, one of trace, debug,\n"
              << std::setw(35) << " "
              << "  info, warn, error, critical, off\n"
              << "\nInput:\n"
              << std::setw(35) << "  -i [ --input ] arg (=.)"
              << "root of the extracted city archives,\n"
              << std::setw(35) << " "
              << "  laid out as <arg>/<city>/<version>/\n"
              << std::setw(35) << "  -V [ --versions ] arg"
              << "city version table, city,version,extra\n"
              << std::setw(35) << "  -c [ --city ] arg"
              << "city to convert, may be repeated or given\n"
              << std::setw(35) << " "
              << "  as positional parameter\n"
              << std::setw(35) << "  --all"
              << "convert every city of the version table\n"
              << std::setw(35) << "  -g [ --station-geometry ] arg"
              << "station_code,encoded_geometry table used\n"
              << std::setw(35) << " "
              << "  to override station positions\n"
              << "\nOutput:\n"
              << std::setw(35) << "  -o [ --output ] arg (=gtfs-out)"
              << "GTFS output path, one feed per city\n"
              << std::setw(35) << "  --agency-url arg"
              << "agency_url of the written feeds\n"
              << std::setw(35) << "  --timezone arg (=Asia/Shanghai)"
              << "agency and stop timezone\n"
              << std::setw(35) << "  --lang arg (=zh)"
              << "agency language\n"
              << std::setw(35) << "  --currency arg (=CNY)"
              << "fare currency\n"
              << std::setw(35) << "  --no-fares"
              << "do not write fare_rules and fare_attributes\n"
              << std::setw(35) << "  --no-shapes"
              << "do not write shapes\n";
}

// _____________________________________________________________________________
config_reader::config_reader(config& cfg) :
    config_{cfg}
{
}

// _____________________________________________________________________________
void config_reader::read(int argc, char** argv)
{
    bool print_opts = false;

    struct option ops[] = {{"input", required_argument, nullptr, 'i'},
                           {"versions", required_argument, nullptr, 'V'},
                           {"city", required_argument, nullptr, 'c'},
                           {"output", required_argument, nullptr, 'o'},
                           {"station-geometry", required_argument, nullptr, 'g'},
                           {"all", no_argument, nullptr, 1},
                           {"agency-url", required_argument, nullptr, 2},
                           {"timezone", required_argument, nullptr, 3},
                           {"lang", required_argument, nullptr, 4},
                           {"currency", required_argument, nullptr, 5},
                           {"no-fares", no_argument, nullptr, 6},
                           {"no-shapes", no_argument, nullptr, 7},
                           {"log-level", required_argument, nullptr, 8},
                           {"version", no_argument, nullptr, 'v'},
                           {"help", no_argument, nullptr, 'h'},
                           {nullptr, 0, nullptr, 0}};

    // restart the scan, read may run more than once per process
    optind = 0;

    int c = 0;
    while ((c = getopt_long(argc, argv, ":i:V:c:o:g:hvp", ops, nullptr)) != -1)
    {
        switch (c)
        {
            case 1:
                config_.all_cities = true;
                break;
            case 2:
                config_.feed.agency_url = optarg;
                break;
            case 3:
                config_.feed.timezone = optarg;
                break;
            case 4:
                config_.feed.language = optarg;
                break;
            case 5:
                config_.feed.currency = optarg;
                break;
            case 6:
                config_.feed.write_fares = false;
                break;
            case 7:
                config_.feed.write_shapes = false;
                break;
            case 8:
                config_.log_level = optarg;
                break;
            case 'i':
                config_.input_path = optarg;
                break;
            case 'V':
                config_.versions_path = optarg;
                break;
            case 'c':
                config_.cities.emplace_back(optarg);
                break;
            case 'o':
                config_.output_path = optarg;
                break;
            case 'g':
                config_.station_geometry_path = optarg;
                break;
            case 'v':
                std::cout << "chinagtfs " << chinagtfs::short_version() << " (built " << __DATE__ << " "
                          << __TIME__ << ")\n"
                          << "(C) " << YEAR << "\n";
                exit(0);
            case 'p':
                print_opts = true;
                break;
            case 'h':
                help(argv[0]);
                exit(0);
            case ':':
                std::cerr << argv[optind - 1];
                std::cerr << " requires an argument" << std::endl;
                exit(1);
            case '?':
                std::cerr << argv[optind - 1];
                std::cerr << " option unknown" << std::endl;
                exit(1);
            default:
                std::cerr << "Error while parsing arguments" << std::endl;
                exit(1);
        }
    }

    for (int i = optind; i < argc; i++)
        config_.cities.emplace_back(argv[i]);

    if (config_.versions_path.empty())
    {
        std::cerr << "No version table given (-V)" << std::endl;
        exit(1);
    }

    if (config_.cities.empty() && !config_.all_cities)
    {
        std::cerr << "No city given, use -c <CITY> or --all" << std::endl;
        exit(1);
    }

    if (print_opts)
    {
        LOG_INFO() << "\nConfigured options:\n\n"
                   << config_.to_string();
    }
}

}  // namespace chinagtfs::config
