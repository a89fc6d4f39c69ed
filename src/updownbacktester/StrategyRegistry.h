// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "number.h"
#include "WindowStrategy.h"

namespace updownbacktester
{

using Num = num::DefaultNumber;
using StrategyFactoryFunction = std::function<std::shared_ptr<mkc_updown::WindowStrategy<Num>>()>;

/**
 * @brief Maps strategy names used in run files to strategy factories
 */
class StrategyRegistry
{
public:
    StrategyRegistry();

    /**
     * @throws std::invalid_argument if the name is empty, already taken or the factory is empty
     */
    void registerStrategy(const std::string& name, StrategyFactoryFunction factory);

    /**
     * @brief Fresh strategy prototype for a registered name
     * @throws std::invalid_argument if the name is not registered
     */
    std::shared_ptr<mkc_updown::WindowStrategy<Num>> createStrategy(const std::string& name) const;

    bool isStrategyAvailable(const std::string& name) const;

    /// Registered names in alphabetical order
    std::vector<std::string> getAvailableStrategies() const;

    size_t size() const;

    /**
     * @brief Registry holding the built-in strategies ("oracle_deficit", "hold")
     */
    static StrategyRegistry createDefaultRegistry();

private:
    std::map<std::string, StrategyFactoryFunction> mFactories;
};

} // namespace updownbacktester
