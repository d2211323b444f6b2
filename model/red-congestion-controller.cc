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

#include "red-congestion-controller.h"

#include "ns3/abort.h"
#include "ns3/assert.h"
#include "ns3/double.h"
#include "ns3/log.h"
#include "ns3/simulator.h"
#include "ns3/uinteger.h"

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("RedCongestionController");

namespace wred
{

NS_OBJECT_ENSURE_REGISTERED(RedCongestionController);

TypeId
RedCongestionController::GetTypeId()
{
    static TypeId tid =
        TypeId("ns3::wred::RedCongestionController")
            .SetParent<Object>()
            .SetGroupName("Wred")
            .AddConstructor<RedCongestionController>()
            .AddAttribute("MaxProbability",
                          "Drop probability when the average queue size reaches the maximum "
                          "threshold (1 / mark probability denominator)",
                          DoubleValue(0.1),
                          MakeDoubleAccessor(&RedCongestionController::m_maxProbability),
                          MakeDoubleChecker<double>())
            .AddAttribute("WeightFactor",
                          "Exponent n of the average queue size weight 2^-n; usually 6 in "
                          "packet mode and 9 in byte mode",
                          UintegerValue(6),
                          MakeUintegerAccessor(&RedCongestionController::SetWeightFactor,
                                               &RedCongestionController::GetWeightFactor),
                          MakeUintegerChecker<uint32_t>(1, 31))
            .AddAttribute("LinkBandwidth",
                          "Rate of the link served by the queue, used to estimate the number "
                          "of packets that could have been sent while the queue was idle",
                          DataRateValue(DataRate("1.5Mbps")),
                          MakeDataRateAccessor(&RedCongestionController::m_linkBandwidth),
                          MakeDataRateChecker())
            .AddAttribute("SmallPacketSize",
                          "Size (bytes) of the small packet whose transmission time defines "
                          "one idle cycle",
                          UintegerValue(64),
                          MakeUintegerAccessor(&RedCongestionController::m_smallPacketSize),
                          MakeUintegerChecker<uint32_t>(1, 65535))
            .AddTraceSource("AverageQueueSize",
                            "Average queue size after each arrival",
                            MakeTraceSourceAccessor(&RedCongestionController::m_qAvg),
                            "ns3::TracedValueCallback::Double")
            .AddTraceSource("Verdict",
                            "Report the average, thresholds and verdict of each decision",
                            MakeTraceSourceAccessor(&RedCongestionController::m_verdictTrace),
                            "ns3::wred::RedCongestionController::VerdictTracedCallback");
    return tid;
}

RedCongestionController::RedCongestionController()
{
    NS_LOG_FUNCTION(this);
    m_uv = CreateObject<UniformRandomVariable>();
}

RedCongestionController::~RedCongestionController()
{
    NS_LOG_FUNCTION(this);
}

void
RedCongestionController::DoDispose()
{
    NS_LOG_FUNCTION(this);
    m_uv = nullptr;
    Object::DoDispose();
}

void
RedCongestionController::SetWeightFactor(uint32_t weightFactor)
{
    NS_LOG_FUNCTION(this << weightFactor);
    m_estimator.SetWeightFactor(weightFactor);
}

uint32_t
RedCongestionController::GetWeightFactor() const
{
    return m_estimator.GetWeightFactor();
}

void
RedCongestionController::SetThresholds(const WredThresholds& thresholds)
{
    NS_LOG_FUNCTION(this << thresholds);
    NS_ASSERT_MSG(thresholds.m_minTh >= 0 && thresholds.m_minTh <= thresholds.m_maxTh,
                  "Invalid thresholds " << thresholds);
    m_thresholds = thresholds;
}

WredThresholds
RedCongestionController::GetThresholds() const
{
    return m_thresholds;
}

RedVerdict
RedCongestionController::Decide(double qSize)
{
    NS_LOG_FUNCTION(this << qSize);
    m_qAvg = m_estimator.Sample(qSize, Simulator::Now(), GetPacketTime());
    RedVerdict verdict =
        m_dropDecision.Decide(m_qAvg.Get(), m_thresholds, m_maxProbability, m_uv);
    NS_LOG_INFO("qSize " << qSize << " avg " << m_qAvg.Get() << " " << m_thresholds << " -> "
                         << verdict);
    m_verdictTrace(m_qAvg.Get(), m_thresholds.m_minTh, m_thresholds.m_maxTh, verdict);
    return verdict;
}

void
RedCongestionController::NotifyIdle()
{
    NS_LOG_FUNCTION(this);
    m_estimator.NotifyIdle(Simulator::Now());
}

double
RedCongestionController::GetAverage() const
{
    return m_estimator.GetAverage();
}

uint32_t
RedCongestionController::GetCount() const
{
    return m_dropDecision.GetCount();
}

double
RedCongestionController::GetMaxProbability() const
{
    return m_maxProbability;
}

Time
RedCongestionController::GetPacketTime() const
{
    if (m_linkBandwidth.GetBitRate() == 0)
    {
        return Seconds(0);
    }
    return m_linkBandwidth.CalculateBytesTxTime(m_smallPacketSize);
}

void
RedCongestionController::SetRandomVariable(Ptr<RandomVariableStream> rv)
{
    NS_LOG_FUNCTION(this << rv);
    NS_ABORT_MSG_UNLESS(rv, "Random variable must not be null");
    m_uv = rv;
}

void
RedCongestionController::Reset()
{
    NS_LOG_FUNCTION(this);
    m_estimator.Reset();
    m_dropDecision.Reset();
    m_qAvg = 0.0;
}

int64_t
RedCongestionController::AssignStreams(int64_t stream)
{
    NS_LOG_FUNCTION(this << stream);
    m_uv->SetStream(stream);
    return 1;
}

} // namespace wred
} // namespace ns3
