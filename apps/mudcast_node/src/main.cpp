#include "NodeApplication.hpp"

#include <mudcast/core/Clock.hpp>
#include <mudcast/core/ConfigLoader.hpp>
#include <mudcast/core/Logger.hpp>
#include <mudcast/core/LoggingConfig.hpp>
#include <mudcast/core/SignalHandler.hpp>

#include <iostream>

int main(int argc, char **argv)
{
    try
    {
        auto cfg = mudcast::core::ConfigLoader::load(argc, argv);
        mudcast::core::applyLoggingConfig(cfg.node);

        mudcast::core::SignalHandler signals;
        mudcast::core::SteadyClock clock;

        node::NodeApplication app(std::move(cfg), clock);
        app.run(signals);

        mudcast::core::shutdownLogger();
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "mudcast_node: " << e.what() << '\n';
        mudcast::core::shutdownLogger();
        return 1;
    }
}
