// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#ifndef MAIN_H_INCLUDED
#define MAIN_H_INCLUDED

#include <boost/program_options.hpp>
#include <boost/version.hpp>
#include <string>
#include <vector>
#include <fstream>
#include <iostream>
#include "Debug/TraceManager.h"
#include "Host/ScriptUtils.h"
#include "Host/SPIHost.h"
#include "Host/StimulusScript.h"
#include "Logging.h"
#include "SPIPeripheral.h"
#include "Version.h"

namespace po = boost::program_options;

// Command line options function
po::options_description get_options();

// Config file options function
po::options_description get_config_file_options();

// Turn on the components named in Log.COMPONENTS
void applyLogComponents(const std::string& list, SPIPeripheral& peripheral, SPIHost& host);

#endif // MAIN_H_INCLUDED
