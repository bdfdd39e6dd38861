// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __MCSIG_SIMULATION_OBSERVER_H
#define __MCSIG_SIMULATION_OBSERVER_H 1

#include <algorithm>
#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace mcsig
{
  /**
   * @class SimulationObserver
   * @brief Receives one notification per completed Monte Carlo trial.
   *
   * update() may be called concurrently from several worker threads when
   * the harness runs with a multi-threaded executor; implementations must
   * be thread-safe. Notification order is not trial order.
   */
  template <class Decimal>
  class SimulationObserver
  {
  public:
    virtual ~SimulationObserver() = default;

    virtual void update(std::size_t trialIndex, const Decimal& simulatedStatistic) = 0;

    // Called by the harness at the start of each estimatePValue() run.
    virtual void clear() = 0;
  };

  /**
   * @class SimulationSubject
   * @brief Observer registry shared by the hypothesis-test harness and the
   *        power analysis.
   *
   * Observers are held by raw pointer and must outlive the subject or be
   * detached first.
   */
  template <class Decimal>
  class SimulationSubject
  {
  public:
    SimulationSubject() = default;

    SimulationSubject(const SimulationSubject&) = delete;
    SimulationSubject& operator=(const SimulationSubject&) = delete;

    virtual ~SimulationSubject() = default;

    void attach(SimulationObserver<Decimal>* observer)
    {
      std::unique_lock<std::shared_mutex> lock(mObserversMutex);
      if (observer && std::find(mObservers.begin(), mObservers.end(), observer) == mObservers.end())
	mObservers.push_back(observer);
    }

    void detach(SimulationObserver<Decimal>* observer)
    {
      std::unique_lock<std::shared_mutex> lock(mObserversMutex);
      mObservers.erase(std::remove(mObservers.begin(), mObservers.end(), observer),
		       mObservers.end());
    }

    std::size_t getNumObservers() const
    {
      std::shared_lock<std::shared_mutex> lock(mObserversMutex);
      return mObservers.size();
    }

  protected:
    void notifyObservers(std::size_t trialIndex, const Decimal& simulatedStatistic) const
    {
      std::shared_lock<std::shared_mutex> lock(mObserversMutex);
      for (auto* observer : mObservers)
	observer->update(trialIndex, simulatedStatistic);
    }

    void clearObservers() const
    {
      std::shared_lock<std::shared_mutex> lock(mObserversMutex);
      for (auto* observer : mObservers)
	observer->clear();
    }

  private:
    mutable std::shared_mutex mObserversMutex;
    std::vector<SimulationObserver<Decimal>*> mObservers;
  };
}

#endif
