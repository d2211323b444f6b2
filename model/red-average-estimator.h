/* -*- Mode:C++; c-file-style:"gnu"; indent-tabs-mode:nil; -*- */
/*
 * Copyright (c) 2017-2020 Cable Television Laboratories, Inc.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions
 * are met:
 * 1. Redistributions of source code must retain the above copyright
 *    notice, this list of conditions, and the following disclaimer,
 *    without modification.
 * 2. Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 * 3. The names of the authors may not be used to endorse or promote products
 *    derived from this software without specific prior written permission.
 *
 * Alternatively, provided that this notice is retained in full, this
 * software may be distributed under the terms of the GNU General
 * Public License ("GPL") version 2, in which case the provisions of the
 * GPL apply INSTEAD OF those given above.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
 * OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
 * SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
 * LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
 * DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
 * THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
 * OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef WRED_RED_AVERAGE_ESTIMATOR_H
#define WRED_RED_AVERAGE_ESTIMATOR_H

#include "ns3/nstime.h"

#include <cstdint>

namespace ns3
{
namespace wred
{

/**
 * \ingroup wred
 *
 * \brief Exponentially weighted moving average of the queue size
 *
 * The average follows
 *   avg = avg * (1 - 2^-n) + sample * 2^-n
 * where n is the weight factor (commonly 6 for packet mode, 9 for byte mode).
 *
 * While the queue is empty the average is not sampled.  When the next packet
 * arrives, the average instead decays as if m samples of zero had been taken,
 * where m is the number of small packets the link could have transmitted
 * during the idle period (at least one):
 *   avg = avg * (1 - 2^-n)^m
 *
 * The average is never negative or NaN; a violation aborts the simulation.
 */
class RedAverageEstimator
{
  public:
    RedAverageEstimator();

    /**
     * \param weightFactor exponent n of the EWMA weight 2^-n (at least 1)
     */
    void SetWeightFactor(uint32_t weightFactor);
    /**
     * \return the exponent n of the EWMA weight
     */
    uint32_t GetWeightFactor() const;
    /**
     * \return the EWMA weight 2^-n
     */
    double GetWeight() const;
    /**
     * \return the current average queue size
     */
    double GetAverage() const;

    /**
     * \brief Busy period update with one queue size sample
     * \param sample queue size sampled before the arriving packet is added
     * \return the new average
     */
    double Update(double sample);

    /**
     * \brief Idle period decay
     *
     * Applying m cycles at once is equivalent to applying one cycle m times.
     *
     * \param cycles number of small packet transmission times spent idle
     * \return the new average
     */
    double Decay(uint32_t cycles);

    /**
     * \brief Record that the queue became empty.  Has no effect if the
     * queue is already idle.
     * \param now the time at which the queue became empty
     */
    void NotifyIdle(Time now);

    /**
     * \return true if the queue has been empty since the last sample
     */
    bool IsIdle() const;

    /**
     * \brief Per-arrival update of the average
     *
     * Applies the idle decay if the queue has been empty since the previous
     * arrival, or the busy update otherwise.
     *
     * \param sample queue size sampled before the arriving packet is added
     * \param now the arrival time
     * \param packetTime transmission time of a small packet on the link
     * \return the new average
     */
    double Sample(double sample, Time now, Time packetTime);

    /**
     * \brief Return to the initial state (zero average, idle since time zero)
     */
    void Reset();

  private:
    void CheckAverage() const;

    uint32_t m_weightFactor; //!< Exponent n of the EWMA weight
    double m_weight;         //!< EWMA weight 2^-n
    double m_average{0};     //!< Average queue size
    bool m_idle{true};       //!< Whether the queue is empty
    Time m_idleStart;        //!< Time at which the queue became empty
};

} // namespace wred
} // namespace ns3

#endif /* WRED_RED_AVERAGE_ESTIMATOR_H */
