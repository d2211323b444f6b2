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

#ifndef WRED_RED_CONGESTION_CONTROLLER_H
#define WRED_RED_CONGESTION_CONTROLLER_H

#include "red-average-estimator.h"
#include "red-drop-decision.h"
#include "wred-policy-map.h"

#include "ns3/data-rate.h"
#include "ns3/nstime.h"
#include "ns3/object.h"
#include "ns3/random-variable-stream.h"
#include "ns3/traced-callback.h"
#include "ns3/traced-value.h"

namespace ns3
{
namespace wred
{

/**
 * \ingroup wred
 *
 * \brief RED congestion avoidance engine for one queue
 *
 * Combines the average queue size estimator with the count-based drop
 * decision.  The controller is parameterized by one threshold pair at a time;
 * a WredQueueDisc installs the pair of the arriving packet's priority class
 * before each decision, so that every class is compared against its own
 * thresholds while sharing the average queue size and the count since the
 * last drop.
 *
 * Typical code for creating and connecting these objects is as follows:
 * \code
 * Ptr<WredQueueDisc> queue = CreateObject<WredQueueDisc> ();
 * queue->GetCongestionController ()->SetAttribute ("WeightFactor", UintegerValue (9));
 * \endcode
 */
class RedCongestionController : public Object
{
  public:
    /**
     * \brief Get the type ID.
     * \return the object TypeId
     */
    static TypeId GetTypeId();
    /**
     * \brief RedCongestionController constructor
     */
    RedCongestionController();
    /**
     * \brief RedCongestionController destructor
     */
    ~RedCongestionController() override;

    /**
     * \brief Set the thresholds used by the next decisions
     * \param thresholds thresholds in the unit of the monitored queue
     */
    void SetThresholds(const WredThresholds& thresholds);
    /**
     * \return the thresholds currently in use
     */
    WredThresholds GetThresholds() const;

    /**
     * \brief Update the average and decide the fate of an arriving packet
     * \param qSize queue size sampled before the packet is added
     * \return the verdict
     */
    RedVerdict Decide(double qSize);

    /**
     * \brief Notify that the monitored queue became empty
     */
    void NotifyIdle();

    /**
     * \return the average queue size
     */
    double GetAverage() const;
    /**
     * \return the number of packets admitted since the last drop
     */
    uint32_t GetCount() const;
    /**
     * \return the drop probability at the maximum threshold
     */
    double GetMaxProbability() const;
    /**
     * \return the transmission time of a small packet on the link
     */
    Time GetPacketTime() const;

    /**
     * \brief Replace the source of uniform draws used by the drop decision
     * \param rv the random variable stream
     */
    void SetRandomVariable(Ptr<RandomVariableStream> rv);

    /**
     * \brief Clear the average, the idle state and the drop count
     */
    void Reset();

    /**
     * Assign a fixed random variable stream number to the random variables
     * used by this model.  Return the number of streams (possibly zero) that
     * have been assigned.
     *
     * \param stream first stream index to use
     * \return the number of stream indices assigned by this model
     */
    int64_t AssignStreams(int64_t stream);

    /**
     * TracedCallback signature for verdict reporting
     *
     * \param [in] average the average queue size used in the decision
     * \param [in] minTh the minimum threshold used in the decision
     * \param [in] maxTh the maximum threshold used in the decision
     * \param [in] verdict the verdict
     */
    typedef void (*VerdictTracedCallback)(double average,
                                          double minTh,
                                          double maxTh,
                                          RedVerdict verdict);

  protected:
    /**
     * \brief Dispose of the object
     */
    void DoDispose() override;

  private:
    /**
     * \param weightFactor exponent of the EWMA weight
     */
    void SetWeightFactor(uint32_t weightFactor);
    /**
     * \return exponent of the EWMA weight
     */
    uint32_t GetWeightFactor() const;

    // Variables tied to attributes do not need default initializers
    double m_maxProbability;    //!< Drop probability at the maximum threshold
    DataRate m_linkBandwidth;   //!< Link rate used to count idle cycles
    uint32_t m_smallPacketSize; //!< Packet size (bytes) used to count idle cycles

    RedAverageEstimator m_estimator; //!< Average queue size
    RedDropDecision m_dropDecision;  //!< Drop decision and count since last drop
    WredThresholds m_thresholds;     //!< Thresholds of the current decision
    Ptr<RandomVariableStream> m_uv;  //!< Rng stream

    TracedValue<double> m_qAvg; //!< Average queue size
    /**
     * The trace source fired upon each decision
     */
    TracedCallback<double, double, double, RedVerdict> m_verdictTrace;
};

} // namespace wred
} // namespace ns3

#endif /* WRED_RED_CONGESTION_CONTROLLER_H */
