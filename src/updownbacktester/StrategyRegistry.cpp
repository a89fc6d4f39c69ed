// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "StrategyRegistry.h"
#include "OracleDeficitStrategy.h"
#include <stdexcept>

using namespace mkc_updown;

namespace updownbacktester
{

StrategyRegistry::StrategyRegistry()
    : mFactories()
{
}

void StrategyRegistry::registerStrategy(const std::string& name, StrategyFactoryFunction factory)
{
    if (name.empty())
        throw std::invalid_argument("StrategyRegistry: strategy name cannot be empty");

    if (!factory)
        throw std::invalid_argument("StrategyRegistry: empty factory for strategy " + name);

    if (mFactories.find(name) != mFactories.end())
        throw std::invalid_argument("StrategyRegistry: strategy already registered: " + name);

    mFactories[name] = std::move(factory);
}

std::shared_ptr<WindowStrategy<Num>> StrategyRegistry::createStrategy(const std::string& name) const
{
    auto it = mFactories.find(name);
    if (it == mFactories.end())
        throw std::invalid_argument("Strategy not found: " + name);

    return it->second();
}

bool StrategyRegistry::isStrategyAvailable(const std::string& name) const
{
    return mFactories.find(name) != mFactories.end();
}

std::vector<std::string> StrategyRegistry::getAvailableStrategies() const
{
    std::vector<std::string> names;
    names.reserve(mFactories.size());
    for (const auto& pair : mFactories)
        names.push_back(pair.first);

    return names;
}

size_t StrategyRegistry::size() const
{
    return mFactories.size();
}

StrategyRegistry StrategyRegistry::createDefaultRegistry()
{
    StrategyRegistry registry;

    registry.registerStrategy("oracle_deficit", []() {
        return std::make_shared<OracleDeficitStrategy<Num>>();
    });

    registry.registerStrategy("hold", []() {
        return std::make_shared<FunctionalWindowStrategy<Num>>(
            "Hold",
            [](const WindowMarketState<Num>&, const StrategyParameters<Num>&) {
                return std::vector<TradeSignal<Num>>();
            });
    });

    return registry;
}

} // namespace updownbacktester
