// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATEGY_PARAMETERS_H
#define __STRATEGY_PARAMETERS_H 1

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>

namespace mkc_updown
{
  class StrategyParameterException : public std::runtime_error
  {
  public:
  StrategyParameterException(const std::string msg)
    : std::runtime_error(msg)
      {}

    ~StrategyParameterException()
      {}
  };

  /**
   * @class StrategyParameters
   * @brief Named numeric tuning values handed to a strategy on every call.
   *
   * Names are kept in sorted order so that two parameter sets holding the
   * same values always compare and serialize the same way.
   */
  template <class Decimal>
  class StrategyParameters
  {
  public:
    typedef typename std::map<std::string, Decimal>::const_iterator ConstParameterIterator;

    StrategyParameters()
      : mParameters()
    {}

    void setParameter(const std::string& name, const Decimal& value)
    {
      mParameters[name] = value;
    }

    bool hasParameter(const std::string& name) const
    {
      return mParameters.find(name) != mParameters.end();
    }

    /**
     * @throws StrategyParameterException if the parameter is not set
     */
    const Decimal& getParameter(const std::string& name) const
    {
      ConstParameterIterator it = mParameters.find(name);
      if (it == mParameters.end())
	throw StrategyParameterException("StrategyParameters::getParameter - no parameter named " + name);

      return it->second;
    }

    Decimal getParameter(const std::string& name, const Decimal& defaultValue) const
    {
      ConstParameterIterator it = mParameters.find(name);
      return (it == mParameters.end()) ? defaultValue : it->second;
    }

    /**
     * @brief Copy of this set overlaid with other; values in other win.
     */
    StrategyParameters<Decimal> merge(const StrategyParameters<Decimal>& other) const
    {
      StrategyParameters<Decimal> merged(*this);

      for (ConstParameterIterator it = other.beginParameters(); it != other.endParameters(); ++it)
	merged.setParameter(it->first, it->second);

      return merged;
    }

    std::size_t getNumParameters() const
    {
      return mParameters.size();
    }

    bool empty() const
    {
      return mParameters.empty();
    }

    ConstParameterIterator beginParameters() const
    {
      return mParameters.begin();
    }

    ConstParameterIterator endParameters() const
    {
      return mParameters.end();
    }

    bool operator==(const StrategyParameters<Decimal>& rhs) const
    {
      return mParameters == rhs.mParameters;
    }

    bool operator!=(const StrategyParameters<Decimal>& rhs) const
    {
      return !(*this == rhs);
    }

  private:
    std::map<std::string, Decimal> mParameters;
  };
}

#endif
