//------------------------------------------------------------------------------
/*
    This file is part of ringsettle
    Copyright (c) 2026 the ringsettle authors

    Permission to use, copy, modify, and/or distribute this software for any
    purpose  with  or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL ,  DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#include <ringsettle/basics/Log.h>
#include <ringsettle/core/BuildInfo.h>
#include <ringsettle/core/Config.h>
#include <ringsettle/core/ConfigSections.h>
#include <ringsettle/core/RingFile.h>
#include <ringsettle/ring/BalanceSheet.h>
#include <ringsettle/ring/Ring.h>
#include <ringsettle/ring/SettlementErrors.h>

#include <boost/program_options.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace po = boost::program_options;

namespace ringsettle {

namespace {

enum ExitCode : int {
    exitSettled = 0,
    exitUsage = 1,
    exitUnsettleable = 2,
};

void
printHelp(po::options_description const& desc)
{
    std::cerr << "ringsettle [options]\n"
              << "Settles one ring of orders and prints the transfers.\n\n"
              << desc << std::endl;
}

int
run(po::variables_map const& vm)
{
    Config config;
    config.setup(vm["conf"].as<std::string>());

    using namespace severities;
    Logs logs(config.logSeverity);

    if (vm.count("quiet"))
        logs.silent(true);
    else if (vm.count("verbose"))
        logs.threshold(kTrace);

    if (!config.logFile.empty() && !logs.open(config.logFile))
        std::cerr << "Can't open log file " << config.logFile << std::endl;

    setDebugLogSink(logs.makeSink("Debug", kTrace));

    auto const j = logs.journal("Config");
    JLOG(j.debug()) << "Loaded " << config.configFile();

    if (!config.feeHolder)
    {
        JLOG(j.fatal()) << "No " SECTION_SETTLEMENT ".fee_holder configured";
        return exitUsage;
    }

    int walletSplitPercentage = config.walletSplitPercentage;
    if (vm.count("split"))
        walletSplitPercentage = vm["split"].as<int>();

    RingFile ringFile;
    ringFile.setup(vm["ring"].as<std::string>());

    BalanceSheet sheet;
    ringFile.populate(sheet);

    SettlementContext ctx{sheet, sheet, *config.feeHolder};
    Ring ring(
        ctx,
        ringFile.orders,
        ringFile.owner,
        ringFile.feeRecipient,
        logs.journal("Ring"));

    try
    {
        auto const transfers = ring.settle(walletSplitPercentage);

        std::cout << "ring " << ring.hash() << '\n';
        if (!ring.valid())
            std::cout << "ring is not valid, nothing to transfer\n";
        for (auto const& item : transfers)
            std::cout << item << '\n';
        std::cout << std::flush;
    }
    catch (UnsettleableRing const& e)
    {
        std::cout << "ring " << ring.hash() << '\n'
                  << "unsettleable: " << e.what() << std::endl;
        return exitUnsettleable;
    }

    return exitSettled;
}

}  // namespace

}  // namespace ringsettle

int
main(int argc, char** argv)
{
    using namespace ringsettle;

    po::variables_map vm;

    po::options_description desc("General Options");
    // clang-format off
    desc.add_options()
        ("help,h", "Display this message.")
        ("conf", po::value<std::string>(), "Specify the configuration file.")
        ("ring", po::value<std::string>(), "Specify the ring file to settle.")
        ("split", po::value<int>(),
            "Wallet split percentage, overriding the configuration file.")
        ("quiet,q", "Reduce diagnostics.")
        ("verbose,v", "Verbose logging.")
        ("version", "Display the build version.")
        ;
    // clang-format on

    try
    {
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);
    }
    catch (po::error const& e)
    {
        std::cerr << "ringsettle: " << e.what() << std::endl;
        printHelp(desc);
        return exitUsage;
    }

    if (vm.count("version"))
    {
        std::cout << "ringsettle version " << BuildInfo::getVersionString()
                  << std::endl;
        return exitSettled;
    }

    if (vm.count("help"))
    {
        printHelp(desc);
        return exitSettled;
    }

    if (!vm.count("conf") || !vm.count("ring"))
    {
        std::cerr << "ringsettle: --conf and --ring are required" << std::endl;
        printHelp(desc);
        return exitUsage;
    }

    try
    {
        return run(vm);
    }
    catch (std::exception const& e)
    {
        std::cerr << "ringsettle: " << e.what() << std::endl;
        return exitUsage;
    }
}
