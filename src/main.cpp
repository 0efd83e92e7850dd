// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#include "main.h"

po::options_description get_options()
{
    po::options_description desc("Command line options");
    desc.add_options()
        ("help", "Produce the help message")
        ("config", po::value<std::string>()->default_value("spiperipheral.cfg"), "Path and filename of the configuration file")
        ("script", po::value<std::string>(), "Path and filename of a stimulus script to run")
        ("ticks", po::value<uint64_t>(), "Extra idle ticks to run after the script")
        ("load-state", po::value<std::string>(), "Restore the receiver from a save state before running")
        ("save-state", po::value<std::string>(), "Write a save state after running")
        ("trace", "Enable tracing")
        ("version", "Print version and exit.");
    return desc;
}

po::options_description get_config_file_options()
{
    po::options_description desc("Configuration File Options");
    desc.add_options()
        ("Host.HALF_PERIOD_TICKS", po::value<uint32_t>()->default_value(50), "SCLK low and high time in receiver ticks")
        ("Host.IDLE_TICKS", po::value<uint32_t>()->default_value(600), "Ticks nCS stays high after a transaction")
        ("Host.RESET_TICKS", po::value<uint32_t>()->default_value(5), "Ticks rst_n is held low for a reset pulse")
        ("Log.FILE", po::value<std::string>()->default_value("spiperipheral.log"), "Log file, empty for the console")
        ("Log.LEVEL", po::value<std::string>()->default_value("info"), "Minimum level: debug, info, warning or error")
        ("Log.TIMESTAMPS", po::value<bool>()->default_value(true), "Prefix log lines with the wall clock time")
        ("Log.COMPONENTS", po::value<std::string>()->default_value(""), "Components to log: synchronizer,edge,frame,dispatcher,registers,host")
        ("Trace.FILE", po::value<std::string>()->default_value(""), "Mirror trace lines to this file")
        ("Trace.CATEGORIES", po::value<std::string>()->default_value("all"), "Trace categories: edge,frame,dispatch,register,reset or all");
    return desc;
}

void applyLogComponents(const std::string& list, SPIPeripheral& peripheral, SPIHost& host)
{
    for (const auto& name : splitCSV(list))
    {
        const auto type = stringToLogSet(name);
        if (!type)
            throw std::runtime_error("Unknown log component: " + name);

        if (*type == LogSet::Host)
            host.setLog(true);
        else
            peripheral.setLogging(*type, true);
    }
}

int main(int argc, char *argv[])
{
    // Setup command line options
    po::options_description cmdLineOptions = get_options();
    po::variables_map vmCmdLine;
    try
    {
        po::store(po::parse_command_line(argc, argv, cmdLineOptions), vmCmdLine);
        po::notify(vmCmdLine);
    }
    catch (const po::error& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << cmdLineOptions << std::endl;
        return 1;
    }

    // Parse cmd line options
    if (vmCmdLine.count("help"))
    {
        std::cout << cmdLineOptions << std::endl;
        std::cout << get_config_file_options() << std::endl;
        return 0;
    }
    if (vmCmdLine.count("version"))
    {
        std::cout << VersionInfo::NAME
          << " v" << VersionInfo::VERSION
          << " built " << VersionInfo::BUILD_DATE
          << " " << VersionInfo::BUILD_TIME << "\n";
        std::cout << "Boost "
          << BOOST_VERSION / 100000     << "."
          << BOOST_VERSION / 100 % 1000 << "."
          << BOOST_VERSION % 100        << "\n";
        return 0;
    }

    // Process configuration file. A missing default file just means defaults,
    // a missing file named on the command line is an error.
    po::variables_map vmConfig;
    po::options_description configFileOptions = get_config_file_options();
    const std::string configPath = vmCmdLine["config"].as<std::string>();

    try
    {
        std::ifstream configFile(configPath);
        if (configFile)
        {
            po::store(po::parse_config_file(configFile, configFileOptions), vmConfig);
        }
        else if (!vmCmdLine["config"].defaulted())
        {
            std::cerr << "Error: Unable to open configuration file " << configPath << " exiting!" << std::endl;
            return 1;
        }
        else
        {
            // Defaults only
            po::store(po::parsed_options(&configFileOptions), vmConfig);
        }
        po::notify(vmConfig);
    }
    catch (const po::unknown_option& e)
    {
        std::cerr << "Unknown option encountered: " << e.what() << std::endl;
        return 1;
    }
    catch (const po::error& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    try
    {
        // Logging
        Logging logger(vmConfig["Log.FILE"].as<std::string>());
        if (!logger.isOpen())
            throw std::runtime_error("Unable to open log file " + vmConfig["Log.FILE"].as<std::string>());

        const auto level = Logging::parseLevel(vmConfig["Log.LEVEL"].as<std::string>());
        if (!level)
            throw std::runtime_error("Unknown log level: " + vmConfig["Log.LEVEL"].as<std::string>());
        logger.setLogLevel(*level);
        logger.enableTimestamps(vmConfig["Log.TIMESTAMPS"].as<bool>());

        // Tracing
        TraceManager trace;
        trace.setCategories(TraceManager::parseCategories(vmConfig["Trace.CATEGORIES"].as<std::string>()));
        const std::string traceFile = vmConfig["Trace.FILE"].as<std::string>();
        if (!traceFile.empty() && !trace.setFileOutput(traceFile))
            throw std::runtime_error("Unable to open trace file " + traceFile);
        trace.enable(vmCmdLine.count("trace") != 0);

        // Receiver and bus master
        SPIPeripheral peripheral;
        peripheral.attachLogInstance(&logger);
        peripheral.attachTraceManagerInstance(&trace);
        peripheral.powerOnReset();

        SPIHost::Timing timing;
        timing.halfPeriodTicks = vmConfig["Host.HALF_PERIOD_TICKS"].as<uint32_t>();
        timing.idleTicks = vmConfig["Host.IDLE_TICKS"].as<uint32_t>();
        timing.resetTicks = vmConfig["Host.RESET_TICKS"].as<uint32_t>();

        SPIHost host(peripheral, timing);
        host.attachLogInstance(&logger);

        applyLogComponents(vmConfig["Log.COMPONENTS"].as<std::string>(), peripheral, host);

        logger.WriteLog(std::string(VersionInfo::NAME) + " v" + VersionInfo::VERSION + " starting");

        if (vmCmdLine.count("load-state"))
        {
            const std::string path = vmCmdLine["load-state"].as<std::string>();
            if (!peripheral.loadStateFromFile(path))
                throw std::runtime_error("Unable to load state from " + path);
            logger.WriteLog("Loaded state from " + path);
        }

        size_t failures = 0;
        if (vmCmdLine.count("script"))
        {
            StimulusScript script;
            script.parseFile(vmCmdLine["script"].as<std::string>());
            failures = script.run(host, peripheral, std::cout);
        }

        if (vmCmdLine.count("ticks"))
            peripheral.run(vmCmdLine["ticks"].as<uint64_t>());

        if (vmCmdLine.count("save-state"))
        {
            const std::string path = vmCmdLine["save-state"].as<std::string>();
            if (!peripheral.saveStateToFile(path))
                throw std::runtime_error("Unable to save state to " + path);
            logger.WriteLog("Saved state to " + path);
        }

        if (trace.isEnabled() && traceFile.empty())
            trace.dumpBuffer(std::cout);

        std::cout << peripheral.dumpState();

        if (failures != 0)
        {
            std::cout << failures << " expectation(s) failed" << std::endl;
            logger.WriteLog(Logging::LogLevel::ERROR, std::to_string(failures) + " expectation(s) failed");
            return 1;
        }
        return 0;
    }
    catch (const std::runtime_error& error)
    {
        std::cout << "Error: Runtime error exception: " << error.what() << std::endl;
    }
    catch (const std::exception& error)
    {
        std::cout << "Error: General exception: " << error.what() << std::endl;
    }
    return 1;
}
