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

#ifndef WRED_RED_DROP_DECISION_H
#define WRED_RED_DROP_DECISION_H

#include "wred-policy-map.h"

#include "ns3/ptr.h"
#include "ns3/random-variable-stream.h"

#include <cstdint>
#include <ostream>

namespace ns3
{
namespace wred
{

/**
 * \brief Enumeration of the admission verdicts
 */
enum class RedVerdict
{
    ADMIT,              /*!< Enqueue the packet */
    PROBABILISTIC_DROP, /*!< Early drop in the region between the thresholds */
    FORCED_DROP,        /*!< Drop because the average reached the maximum threshold */
};

/**
 * \brief Stream insertion operator
 * \param os the stream
 * \param verdict the verdict
 * \return a reference to the stream
 */
std::ostream& operator<<(std::ostream& os, RedVerdict verdict);

/**
 * \ingroup wred
 *
 * \brief RED drop decision with count-based drop spacing
 *
 * Given the average queue size and a threshold pair, the packet is admitted
 * below the minimum threshold and dropped at or above the maximum threshold.
 * In between, the base probability grows linearly from 0 to the maximum
 * probability,
 *   pb = maxP * (avg - minTh) / (maxTh - minTh)
 * and is corrected by the number of packets admitted since the last drop,
 *   pa = pb / (1 - count * pb)
 * so that drops are spaced more evenly than independent trials would space
 * them.  The counter is reset by every drop, incremented by every admit in
 * the early drop region, and left unchanged below the minimum threshold.
 */
class RedDropDecision
{
  public:
    RedDropDecision();

    /**
     * \brief Decide the fate of one arriving packet
     * \param average the average queue size
     * \param thresholds the thresholds, in the unit of the average
     * \param maxProbability drop probability at the maximum threshold, in (0, 1]
     * \param uv source of uniform draws in [0, 1)
     * \return the verdict
     */
    RedVerdict Decide(double average,
                      const WredThresholds& thresholds,
                      double maxProbability,
                      Ptr<RandomVariableStream> uv);

    /**
     * \brief Linear base probability pb
     * \param average the average queue size
     * \param thresholds the thresholds, in the unit of the average
     * \param maxProbability drop probability at the maximum threshold
     * \return pb, zero below the minimum threshold and one at or above the maximum
     */
    static double CalculateBaseProbability(double average,
                                           const WredThresholds& thresholds,
                                           double maxProbability);

    /**
     * \brief Drop probability pa after the count correction
     * \param baseProbability the base probability pb
     * \return pa in [0, 1]
     */
    double CalculateDropProbability(double baseProbability) const;

    /**
     * \return the number of packets admitted since the last drop
     */
    uint32_t GetCount() const;

    /**
     * \brief Clear the count since the last drop
     */
    void Reset();

  private:
    uint32_t m_count{0}; //!< Packets admitted in the early drop region since the last drop
};

} // namespace wred
} // namespace ns3

#endif /* WRED_RED_DROP_DECISION_H */
